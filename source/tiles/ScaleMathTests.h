#pragma once

// ============================================================================
// ScaleMathTests - Unit tests for tier quantization and scale capping
// ============================================================================
// Run with: tessera-tests --test-scale
//
// - Fixed-seed property sweep over zoom, pixel ratio and maxZoom
// - Ladder rounding at the boundaries
// - Degenerate inputs (NaN, zero, negative, infinity)
// - Maximum zoom on a high-density display reaches the top tier
// ============================================================================

#include "ScaleMath.h"
#include <QDebug>
#include <QRandomGenerator>
#include <cmath>
#include <limits>

namespace ScaleMathTests {

inline bool check(bool condition, const char* what)
{
    if (!condition) {
        qDebug() << "  FAIL:" << what;
    }
    return condition;
}

/**
 * @brief Every computed tier is a ladder value, under the ceiling,
 *        idempotent under applyScaleCaps and equal to its cache-key scale.
 */
inline bool testPropertySweep()
{
    qDebug() << "=== Test: ScaleMath property sweep ===";

    QRandomGenerator rng(20240611);
    const double pixelRatios[] = {1.0, 1.25, 1.5, 2.0, 3.0};
    const double maxZooms[] = {4.0, 8.0, 16.0, 32.0, 64.0};

    int failures = 0;
    for (int i = 0; i < 5000 && failures < 10; ++i) {
        // log-uniform zoom in [0.01, 128]
        const double zoom = std::pow(10.0, -2.0 + rng.generateDouble() * 4.1);
        const double dpr = pixelRatios[rng.bounded(5)];
        const double maxZoom = maxZooms[rng.bounded(5)];

        const ScaleMath::ScaleTier tier = ScaleMath::targetScaleTier(zoom, dpr, maxZoom);
        const double exact = ScaleMath::exactTargetScale(zoom, dpr, maxZoom);
        const double ceiling = ScaleMath::effectiveScaleCeiling(dpr, maxZoom);

        bool ok = true;
        ok &= ScaleMath::tierIndex(tier.tier) >= 0;
        ok &= tier.tier <= ceiling;
        ok &= ScaleMath::applyScaleCaps(tier.tier, dpr, maxZoom) == tier.tier;
        ok &= ScaleMath::scaleForCacheKey(tier.tier) == tier.tier;
        ok &= std::fabs(tier.cssStretch * tier.tier - exact) < 1e-9 * exact;
        if (ScaleMath::quantizeScale(exact) <= ceiling) {
            ok &= ScaleMath::quantizeScale(exact) == tier.tier;
        }

        if (!ok) {
            qDebug() << "  FAIL: zoom" << zoom << "dpr" << dpr << "maxZoom" << maxZoom
                     << "-> tier" << tier.tier << "stretch" << tier.cssStretch;
            ++failures;
        }
    }

    qDebug() << (failures == 0 ? "PASSED" : "FAILED");
    return failures == 0;
}

inline bool testLadderRounding()
{
    qDebug() << "=== Test: ladder rounding ===";
    bool ok = true;

    ok &= check(ScaleMath::quantizeScale(31.5) == 32.0, "31.5 -> 32");
    ok &= check(ScaleMath::quantizeScale(32.5) == 32.0, "32.5 -> 32");
    ok &= check(ScaleMath::quantizeScale(28.0) == 32.0, "midpoint 28 rounds up to 32");
    ok &= check(ScaleMath::quantizeScale(27.9) == 24.0, "27.9 -> 24");
    ok &= check(ScaleMath::quantizeScale(2.5) == 3.0, "midpoint 2.5 rounds up to 3");
    ok &= check(ScaleMath::quantizeScale(0.1) == 0.25, "below ladder snaps to 0.25");
    ok &= check(ScaleMath::quantizeScale(500.0) == 64.0, "above ladder snaps to 64");
    ok &= check(ScaleMath::quantizeScale(1.0) == 1.0, "ladder value is fixed");

    // Two raw scales in the same bucket share a cache-key scale
    ok &= check(ScaleMath::scaleForCacheKey(1.9) == ScaleMath::scaleForCacheKey(2.2),
                "1.9 and 2.2 share a key scale");

    ok &= check(ScaleMath::nextLowerTier(32.0) == 24.0, "next lower of 32 is 24");
    ok &= check(ScaleMath::nextLowerTier(0.25) == 0.25, "bottom tier has no lower");
    ok &= check(ScaleMath::tierIndex(5.0) == -1, "5 is not a tier");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testDegenerateInputs()
{
    qDebug() << "=== Test: degenerate inputs ===";
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    bool ok = true;

    ok &= check(ScaleMath::applyScaleCaps(nan, 1.0, 32.0) == 1.0, "NaN scale -> 1");
    ok &= check(ScaleMath::applyScaleCaps(0.0, 1.0, 32.0) == 1.0, "zero scale -> 1");
    ok &= check(ScaleMath::applyScaleCaps(-4.0, 1.0, 32.0) == 1.0, "negative scale -> 1");
    ok &= check(ScaleMath::applyScaleCaps(inf, 2.0, 64.0) == 64.0, "+inf -> ceiling");
    ok &= check(ScaleMath::applyScaleCaps(inf, 1.0, 16.0) == 16.0, "+inf -> maxZoom ceiling");
    ok &= check(ScaleMath::quantizeScale(nan) == 1.0, "quantize NaN -> 1");

    const ScaleMath::ScaleTier t = ScaleMath::targetScaleTier(nan, nan, 32.0);
    ok &= check(t.tier == 1.0 && t.cssStretch == 1.0, "NaN zoom and dpr -> tier 1, stretch 1");

    ok &= check(ScaleMath::velocityQualityFactor(1.0, 2.0) == 1.0, "slow gesture keeps quality");
    ok &= check(ScaleMath::velocityQualityFactor(3.0, 2.0) == ScaleMath::FAST_GESTURE_QUALITY,
                "fast gesture reduces quality");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

/**
 * @brief Zoom 32 on a 2x display with maxZoom 32 renders at 64, not 32.
 */
inline bool testMaxZoomHighDensity()
{
    qDebug() << "=== Test: max zoom on high-density display ===";
    bool ok = true;

    const ScaleMath::ScaleTier t = ScaleMath::targetScaleTier(32.0, 2.0, 32.0);
    ok &= check(t.tier == 64.0, "tier is 64");
    ok &= check(t.cssStretch == 1.0, "no stretch at 64");

    const ScaleMath::ScaleTier lowDpr = ScaleMath::targetScaleTier(32.0, 1.0, 32.0);
    ok &= check(lowDpr.tier == 32.0, "tier 32 at dpr 1");

    // maxZoom * dpr above the hardware ceiling is capped at 64
    ok &= check(ScaleMath::effectiveScaleCeiling(3.0, 32.0) == 64.0, "ceiling never exceeds 64");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running ScaleMath Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;
    allPass &= testPropertySweep();
    allPass &= testLadderRounding();
    allPass &= testDegenerateInputs();
    allPass &= testMaxZoomHighDensity();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";
    return allPass;
}

} // namespace ScaleMathTests
