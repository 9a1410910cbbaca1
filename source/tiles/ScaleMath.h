#pragma once

// ============================================================================
// ScaleMath - Zoom to render-scale conversion and tier quantization
// ============================================================================
// Every render scale and every cache-key scale in Tessera is derived here.
// Callers never multiply zoom by pixel ratio themselves; they ask for a tier.
//
// Tier ladder (fine grained above 1x, three buckets below):
//   0.25  0.5  1  2  3  4  6  8  12  16  24  32  64
//
// Rounding rule:
//   quantizeScale() picks the nearest ladder value. A value exactly on the
//   midpoint between two tiers rounds up. Values below the ladder snap to
//   0.25 and values above it snap to 64.
//
//   applyScaleCaps() caps by the hardware ceiling (64) and by maxZoom * dpr,
//   quantizes, and steps down the ladder if rounding up crossed the ceiling.
//   The result is always a ladder value, so applying it twice is a no-op.
// ============================================================================

#include <QVector>

namespace ScaleMath {

/// Largest scale the rasterizer can safely produce regardless of zoom.
static constexpr double GPU_SAFE_MAX_SCALE = 64.0;

/// Gesture speed factor applied when the pointer moves faster than the threshold.
static constexpr double FAST_GESTURE_QUALITY = 0.5;

/**
 * @brief Quantized render tier and the stretch needed to reach the ideal scale.
 */
struct ScaleTier {
    double tier = 1.0;          ///< Ladder value used for render requests AND cache keys
    double cssStretch = 1.0;    ///< exactScale / tier
};

/**
 * @brief The fixed tier ladder, ascending.
 */
const QVector<double>& tierLadder();

/**
 * @brief Ideal scale with no capping (zoom * pixelRatio).
 *
 * Informational only. Non-finite or non-positive zoom and pixel ratio are
 * treated as 1. maxZoom is accepted for signature symmetry and ignored.
 */
double exactTargetScale(double zoom, double pixelRatio, double maxZoom);

/**
 * @brief Tier used for rendering and caching at the given zoom.
 *
 * tier = applyScaleCaps(exactTargetScale(...)), cssStretch = exact / tier.
 */
ScaleTier targetScaleTier(double zoom, double pixelRatio, double maxZoom);

/**
 * @brief Apply hardware ceiling, maxZoom ceiling and ladder quantization.
 *
 * NaN and non-positive input is treated as 1, +infinity as the hardware
 * ceiling. A non-positive or non-finite maxZoom disables the device ceiling.
 * The result is idempotent: applyScaleCaps(applyScaleCaps(x)) == applyScaleCaps(x).
 */
double applyScaleCaps(double scale, double pixelRatio, double maxZoom);

/**
 * @brief Round a raw scale to the nearest ladder value (ties round up).
 */
double quantizeScale(double scale);

/**
 * @brief Scale component used in cache keys. Always equals quantizeScale().
 */
double scaleForCacheKey(double scale);

/**
 * @brief Device ceiling: min(GPU_SAFE_MAX_SCALE, maxZoom * pixelRatio).
 */
double effectiveScaleCeiling(double pixelRatio, double maxZoom);

/**
 * @brief Quality factor for in-flight gestures.
 * @return 1.0 at or below fastThreshold, FAST_GESTURE_QUALITY above it.
 */
double velocityQualityFactor(double speed, double fastThreshold);

/**
 * @brief Index of a tier on the ladder, or -1 if the value is not a ladder tier.
 */
int tierIndex(double tier);

/**
 * @brief Next ladder value below tier, or the lowest tier if already at the bottom.
 */
double nextLowerTier(double tier);

} // namespace ScaleMath
