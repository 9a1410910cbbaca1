#include "ScaleMath.h"

#include <QtGlobal>
#include <cmath>
#include <algorithm>

namespace ScaleMath {

namespace {

double sanitizePositive(double value)
{
    if (!std::isfinite(value) || value <= 0.0) {
        return 1.0;
    }
    return value;
}

// Largest ladder value <= limit, or the lowest tier when limit is below the ladder.
double floorToLadder(double limit)
{
    const QVector<double>& ladder = tierLadder();
    double result = ladder.first();
    for (double tier : ladder) {
        if (tier <= limit) {
            result = tier;
        } else {
            break;
        }
    }
    return result;
}

} // namespace

const QVector<double>& tierLadder()
{
    static const QVector<double> ladder = {
        0.25, 0.5, 1.0, 2.0, 3.0, 4.0, 6.0, 8.0, 12.0, 16.0, 24.0, 32.0, 64.0
    };
    return ladder;
}

double exactTargetScale(double zoom, double pixelRatio, double maxZoom)
{
    Q_UNUSED(maxZoom);
    return sanitizePositive(zoom) * sanitizePositive(pixelRatio);
}

ScaleTier targetScaleTier(double zoom, double pixelRatio, double maxZoom)
{
    ScaleTier result;
    const double exact = exactTargetScale(zoom, pixelRatio, maxZoom);
    result.tier = applyScaleCaps(exact, pixelRatio, maxZoom);
    result.cssStretch = exact / result.tier;
    return result;
}

double effectiveScaleCeiling(double pixelRatio, double maxZoom)
{
    double ceiling = GPU_SAFE_MAX_SCALE;
    if (std::isfinite(maxZoom) && maxZoom > 0.0) {
        ceiling = std::min(ceiling, maxZoom * sanitizePositive(pixelRatio));
    }
    return ceiling;
}

double applyScaleCaps(double scale, double pixelRatio, double maxZoom)
{
    double value = scale;
    if (std::isnan(value) || value <= 0.0) {
        value = 1.0;
    } else if (std::isinf(value)) {
        value = GPU_SAFE_MAX_SCALE;
    }

    // 1. hardware ceiling, 2. device/maxZoom ceiling
    const double ceiling = effectiveScaleCeiling(pixelRatio, maxZoom);
    value = std::min(value, ceiling);

    // 3. ladder quantization, never rounding past the ceiling
    double tier = quantizeScale(value);
    if (tier > ceiling) {
        tier = floorToLadder(ceiling);
    }
    return tier;
}

double quantizeScale(double scale)
{
    const QVector<double>& ladder = tierLadder();
    if (std::isnan(scale) || scale <= 0.0) {
        return 1.0;
    }
    if (scale >= ladder.last()) {
        return ladder.last();
    }

    for (int i = 0; i + 1 < ladder.size(); ++i) {
        const double midpoint = (ladder[i] + ladder[i + 1]) / 2.0;
        if (scale < midpoint) {
            return ladder[i];
        }
    }
    return ladder.last();
}

double scaleForCacheKey(double scale)
{
    return quantizeScale(scale);
}

double velocityQualityFactor(double speed, double fastThreshold)
{
    if (!std::isfinite(speed)) {
        return FAST_GESTURE_QUALITY;
    }
    return std::fabs(speed) > fastThreshold ? FAST_GESTURE_QUALITY : 1.0;
}

int tierIndex(double tier)
{
    const QVector<double>& ladder = tierLadder();
    for (int i = 0; i < ladder.size(); ++i) {
        if (qFuzzyCompare(ladder[i], tier)) {
            return i;
        }
    }
    return -1;
}

double nextLowerTier(double tier)
{
    const QVector<double>& ladder = tierLadder();
    double result = ladder.first();
    for (double candidate : ladder) {
        if (candidate < tier && !qFuzzyCompare(candidate, tier)) {
            result = candidate;
        } else {
            break;
        }
    }
    return result;
}

} // namespace ScaleMath
