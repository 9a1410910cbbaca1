#include "TileEngineConfig.h"

#include <QDebug>
#include <QSettings>
#include <cmath>

namespace {

const char* GROUP = "TileEngine";

// QVariant::canConvert() accepts any string for numbers, so parse explicitly
bool convert(const QVariant& raw, int* out)
{
    bool ok = false;
    *out = raw.toInt(&ok);
    return ok;
}

bool convert(const QVariant& raw, qint64* out)
{
    bool ok = false;
    *out = raw.toLongLong(&ok);
    return ok;
}

bool convert(const QVariant& raw, double* out)
{
    bool ok = false;
    *out = raw.toDouble(&ok);
    return ok;
}

bool convert(const QVariant& raw, bool* out)
{
    const QString text = raw.toString().trimmed().toLower();
    if (text == QLatin1String("true") || text == QLatin1String("1")) {
        *out = true;
        return true;
    }
    if (text == QLatin1String("false") || text == QLatin1String("0")) {
        *out = false;
        return true;
    }
    return false;
}

// Reads a value and keeps @p fallback unless it parses and passes @p valid.
template <typename T, typename Pred>
T readValue(QSettings& settings, const QString& key, T fallback, Pred valid, QStringList* warnings)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    const QVariant raw = settings.value(key);
    T value = fallback;
    if (!convert(raw, &value)) {
        if (warnings) {
            warnings->append(QStringLiteral("%1: cannot convert '%2'").arg(key, raw.toString()));
        }
        return fallback;
    }
    if (!valid(value)) {
        if (warnings) {
            warnings->append(QStringLiteral("%1: value '%2' out of range").arg(key, raw.toString()));
        }
        return fallback;
    }
    return value;
}

bool positiveDouble(double v) { return std::isfinite(v) && v > 0.0; }
bool positiveInt(int v) { return v > 0; }
bool nonNegativeInt(int v) { return v >= 0; }
bool positiveBytes(qint64 v) { return v > 0; }

} // namespace

TileEngineConfig TileEngineConfig::load(QSettings& settings, QStringList* warnings)
{
    TileEngineConfig config;
    settings.beginGroup(GROUP);

    settings.beginGroup("zoom");
    config.zoom.pixelRatio = readValue(settings, "pixelRatio", config.zoom.pixelRatio, positiveDouble, warnings);
    config.zoom.minZoom = readValue(settings, "minZoom", config.zoom.minZoom, positiveDouble, warnings);
    config.zoom.maxZoom = readValue(settings, "maxZoom", config.zoom.maxZoom, positiveDouble, warnings);
    config.zoom.initialZoom = readValue(settings, "initialZoom", config.zoom.initialZoom, positiveDouble, warnings);
    config.zoom.gestureEndDelayMs = readValue(settings, "gestureEndDelayMs", config.zoom.gestureEndDelayMs, nonNegativeInt, warnings);
    config.zoom.settlingDelayMs = readValue(settings, "settlingDelayMs", config.zoom.settlingDelayMs, nonNegativeInt, warnings);
    config.zoom.phaseWatchdogMs = readValue(settings, "phaseWatchdogMs", config.zoom.phaseWatchdogMs, positiveInt, warnings);
    config.zoom.fastGestureSpeed = readValue(settings, "fastGestureSpeed", config.zoom.fastGestureSpeed, positiveDouble, warnings);
    settings.endGroup();

    settings.beginGroup("cache");
    config.cache.l1MaxEntries = readValue(settings, "l1MaxEntries", config.cache.l1MaxEntries, positiveInt, warnings);
    config.cache.l1MaxBytes = readValue(settings, "l1MaxBytes", config.cache.l1MaxBytes, positiveBytes, warnings);
    config.cache.l2MaxEntries = readValue(settings, "l2MaxEntries", config.cache.l2MaxEntries, positiveInt, warnings);
    config.cache.l2MaxBytes = readValue(settings, "l2MaxBytes", config.cache.l2MaxBytes, positiveBytes, warnings);
    config.cache.l3MaxPages = readValue(settings, "l3MaxPages", config.cache.l3MaxPages, positiveInt, warnings);
    settings.endGroup();

    settings.beginGroup("breaker");
    config.breaker.threshold = readValue(settings, "threshold", config.breaker.threshold, positiveInt, warnings);
    config.breaker.reductionFactor = readValue(settings, "reductionFactor", config.breaker.reductionFactor,
                                               [](double v) { return std::isfinite(v) && v >= 1.0; }, warnings);
    settings.endGroup();

    config.tileSize = readValue(settings, "tileSize", config.tileSize, positiveInt, warnings);
    config.maxRetries = readValue(settings, "maxRetries", config.maxRetries, nonNegativeInt, warnings);
    config.telemetryCapacity = readValue(settings, "telemetryCapacity", config.telemetryCapacity, positiveInt, warnings);
    config.telemetryEnabled = readValue(settings, "telemetryEnabled", config.telemetryEnabled,
                                        [](bool) { return true; }, warnings);

    settings.endGroup();

    // Cross-field checks fall back to the defaults as a pair
    if (config.zoom.minZoom > config.zoom.maxZoom) {
        if (warnings) {
            warnings->append(QStringLiteral("zoom: minZoom %1 > maxZoom %2")
                                 .arg(config.zoom.minZoom).arg(config.zoom.maxZoom));
        }
        const ZoomAuthorityConfig defaults;
        config.zoom.minZoom = defaults.minZoom;
        config.zoom.maxZoom = defaults.maxZoom;
    }

    return config;
}

TileEngineConfig TileEngineConfig::loadDefault()
{
    QSettings settings(ORGANIZATION, APPLICATION);
    QStringList warnings;
    TileEngineConfig config = load(settings, &warnings);
    for (const QString& warning : warnings) {
        qWarning() << "TileEngineConfig:" << warning;
    }
    return config;
}

void TileEngineConfig::save(QSettings& settings) const
{
    settings.beginGroup(GROUP);

    settings.beginGroup("zoom");
    settings.setValue("pixelRatio", zoom.pixelRatio);
    settings.setValue("minZoom", zoom.minZoom);
    settings.setValue("maxZoom", zoom.maxZoom);
    settings.setValue("initialZoom", zoom.initialZoom);
    settings.setValue("gestureEndDelayMs", zoom.gestureEndDelayMs);
    settings.setValue("settlingDelayMs", zoom.settlingDelayMs);
    settings.setValue("phaseWatchdogMs", zoom.phaseWatchdogMs);
    settings.setValue("fastGestureSpeed", zoom.fastGestureSpeed);
    settings.endGroup();

    settings.beginGroup("cache");
    settings.setValue("l1MaxEntries", cache.l1MaxEntries);
    settings.setValue("l1MaxBytes", cache.l1MaxBytes);
    settings.setValue("l2MaxEntries", cache.l2MaxEntries);
    settings.setValue("l2MaxBytes", cache.l2MaxBytes);
    settings.setValue("l3MaxPages", cache.l3MaxPages);
    settings.endGroup();

    settings.beginGroup("breaker");
    settings.setValue("threshold", breaker.threshold);
    settings.setValue("reductionFactor", breaker.reductionFactor);
    settings.endGroup();

    settings.setValue("tileSize", tileSize);
    settings.setValue("maxRetries", maxRetries);
    settings.setValue("telemetryCapacity", telemetryCapacity);
    settings.setValue("telemetryEnabled", telemetryEnabled);

    settings.endGroup();
}

QStringList TileEngineConfig::validate() const
{
    QStringList problems;
    if (!positiveDouble(zoom.pixelRatio)) problems << QStringLiteral("pixelRatio must be > 0");
    if (!positiveDouble(zoom.minZoom)) problems << QStringLiteral("minZoom must be > 0");
    if (!positiveDouble(zoom.maxZoom)) problems << QStringLiteral("maxZoom must be > 0");
    if (zoom.minZoom > zoom.maxZoom) problems << QStringLiteral("minZoom must not exceed maxZoom");
    if (tileSize <= 0) problems << QStringLiteral("tileSize must be > 0");
    if (breaker.threshold < 1) problems << QStringLiteral("breaker threshold must be >= 1");
    if (!(breaker.reductionFactor >= 1.0)) problems << QStringLiteral("breaker reductionFactor must be >= 1");
    if (maxRetries < 0) problems << QStringLiteral("maxRetries must be >= 0");
    return problems;
}
