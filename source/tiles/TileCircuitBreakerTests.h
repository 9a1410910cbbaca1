#pragma once

// ============================================================================
// TileCircuitBreakerTests - Unit tests for TileCircuitBreaker
// ============================================================================
// Run with: tessera-tests --test-breaker
// ============================================================================

#include "TileCircuitBreaker.h"

#include <limits>
#include <QDebug>

namespace TileCircuitBreakerTests {

inline bool expect(bool condition, const char* what)
{
    if (!condition) {
        qDebug() << "  FAIL:" << what;
    }
    return condition;
}

/**
 * @brief Nine rejections leave the breaker closed; the tenth trips it.
 */
inline bool testTripsAtThreshold()
{
    qDebug() << "=== Test: trips on the tenth rejection ===";
    TileCircuitBreaker breaker;
    bool ok = true;

    for (int i = 0; i < 9; ++i) {
        breaker.recordRejection(TileRejectionReason::EpochExpired);
    }
    ok &= expect(!breaker.isTripped(), "closed after 9");
    ok &= expect(breaker.getFallbackScaleReduction() == 1.0, "no reduction while closed");

    breaker.recordRejection(TileRejectionReason::ScaleMismatch);
    ok &= expect(breaker.isTripped(), "tripped after 10");
    ok &= expect(breaker.shouldUseFallback(), "fallback while tripped");
    ok &= expect(breaker.getFallbackScaleReduction() == 2.0, "reduction 2 while tripped");

    // More rejections keep it tripped without counting another trip
    breaker.recordRejection(TileRejectionReason::RenderFailed);
    const CircuitBreakerStats stats = breaker.getStats();
    ok &= expect(stats.tripCount == 1, "one trip");
    ok &= expect(stats.totalRejections == 11, "11 rejections");
    ok &= expect(stats.rejectionsByReason.value(TileRejectionReason::EpochExpired) == 9,
                 "9 epoch rejections");
    ok &= expect(stats.rejectionsByReason.value(TileRejectionReason::ScaleMismatch) == 1,
                 "1 scale rejection");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testSuccessResetsStreak()
{
    qDebug() << "=== Test: success resets the streak ===";
    TileCircuitBreaker breaker;
    bool ok = true;

    for (int i = 0; i < 10; ++i) {
        breaker.recordRejection(TileRejectionReason::EpochExpired);
    }
    ok &= expect(breaker.isTripped(), "tripped");

    breaker.recordSuccess();
    ok &= expect(!breaker.isTripped(), "closed after success");
    ok &= expect(breaker.getConsecutiveFailures() == 0, "streak cleared");
    ok &= expect(breaker.getFallbackScaleReduction() == 1.0, "reduction back to 1");

    // Interleaved successes never let the streak reach the threshold
    for (int i = 0; i < 30; ++i) {
        breaker.recordRejection(TileRejectionReason::EpochExpired);
        if (i % 5 == 4) {
            breaker.recordSuccess();
        }
    }
    ok &= expect(!breaker.isTripped(), "interleaved successes keep it closed");
    ok &= expect(breaker.getStats().tripCount == 1, "still one trip");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testResetClearsEverything()
{
    qDebug() << "=== Test: reset ===";
    TileCircuitBreaker breaker;
    bool ok = true;

    for (int i = 0; i < 12; ++i) {
        breaker.recordRejection(TileRejectionReason::RenderFailed);
    }
    breaker.reset();

    const CircuitBreakerState state = breaker.getState();
    const CircuitBreakerStats stats = breaker.getStats();
    ok &= expect(!state.isTripped, "not tripped");
    ok &= expect(state.consecutiveFailures == 0, "no failures");
    ok &= expect(state.threshold == 10, "threshold kept");
    ok &= expect(stats.rejectionsByReason.isEmpty(), "histogram cleared");
    ok &= expect(stats.totalRejections == 0 && stats.tripCount == 0, "totals cleared");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool testConfig()
{
    qDebug() << "=== Test: configuration ===";
    bool ok = true;

    CircuitBreakerConfig config;
    config.threshold = 3;
    config.reductionFactor = 4.0;
    TileCircuitBreaker breaker(config);
    for (int i = 0; i < 3; ++i) {
        breaker.recordRejection(TileRejectionReason::ScaleMismatch);
    }
    ok &= expect(breaker.isTripped(), "custom threshold trips at 3");
    ok &= expect(breaker.getFallbackScaleReduction() == 4.0, "custom reduction");

    // Invalid values are replaced by defaults
    config.threshold = 0;
    config.reductionFactor = 0.5;
    breaker.setConfig(config);
    ok &= expect(breaker.config().threshold == 10, "threshold defaulted");
    ok &= expect(breaker.config().reductionFactor == 2.0, "reduction defaulted");
    ok &= expect(!breaker.isTripped(), "3 of 10 is closed");

    config.threshold = 5;
    config.reductionFactor = std::numeric_limits<double>::infinity();
    breaker.setConfig(config);
    ok &= expect(breaker.config().reductionFactor == 2.0, "infinite reduction defaulted");
    ok &= expect(breaker.config().threshold == 5, "valid threshold kept");
    config.reductionFactor = std::numeric_limits<double>::quiet_NaN();
    ok &= expect(TileCircuitBreaker(config).config().reductionFactor == 2.0, "NaN reduction defaulted");

    ok &= expect(rejectionReasonName(TileRejectionReason::EpochExpired) != 
                 rejectionReasonName(TileRejectionReason::ScaleMismatch), "distinct names");

    qDebug() << (ok ? "PASSED" : "FAILED");
    return ok;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running TileCircuitBreaker Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;
    allPass &= testTripsAtThreshold();
    allPass &= testSuccessResetsStreak();
    allPass &= testResetClearsEverything();
    allPass &= testConfig();

    qDebug() << "\n========================================";
    qDebug() << (allPass ? "ALL TESTS PASSED!" : "SOME TESTS FAILED!");
    qDebug() << "========================================\n";
    return allPass;
}

} // namespace TileCircuitBreakerTests
