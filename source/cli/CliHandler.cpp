#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QTextStream>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 * 
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

// Reads a positive number option; leaves @p target alone when the option is absent.
static bool readPositive(const QCommandLineParser& parser, const QString& name, double& target)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const double value = parser.value(name).toDouble(&ok);
    if (!ok || !(value > 0.0)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: --%1 expects a positive number, got '%2'\n")
                   .arg(name, parser.value(name));
        return false;
    }
    target = value;
    return true;
}

static bool readNonNegative(const QCommandLineParser& parser, const QString& name, int& target)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    if (!ok || value < 0) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: --%1 expects a non-negative integer, got '%2'\n")
                   .arg(name, parser.value(name));
        return false;
    }
    target = value;
    return true;
}

static QJsonObject countsToJson(const QMap<TileEventType, int>& counts)
{
    QJsonObject obj;
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        obj.insert(tileEventTypeName(it.key()), it.value());
    }
    return obj;
}

QJsonObject reportToJson(const Stress::ReplayReport& report)
{
    QJsonObject obj;
    obj["stepsRun"] = report.stepsRun;
    obj["cancelled"] = report.cancelled;
    obj["settleSkipped"] = report.settleSkipped;
    obj["settled"] = report.settled;
    obj["consistent"] = report.isConsistent();
    obj["elapsedMs"] = static_cast<double>(report.elapsedMs);

    QJsonObject final;
    final["zoom"] = report.finalZoom;
    final["tier"] = report.finalTier;
    final["cssStretch"] = report.finalCssStretch;
    final["epoch"] = report.finalEpoch;
    final["phase"] = gesturePhaseName(report.finalPhase);
    obj["final"] = final;

    QJsonObject requests;
    requests["total"] = report.tilesRequested;
    requests["cacheHits"] = report.cacheHits;
    requests["dispatched"] = report.dispatched;
    requests["coalesced"] = report.coalesced;
    requests["fallbacksShown"] = report.fallbacksShown;
    obj["requests"] = requests;

    QJsonObject verdicts;
    for (auto it = report.verdicts.constBegin(); it != report.verdicts.constEnd(); ++it) {
        verdicts.insert(tileResultVerdictName(it.key()), it.value());
    }
    obj["verdicts"] = verdicts;

    QJsonObject cache;
    cache["l1Count"] = report.cache.l1Count;
    cache["l2Count"] = report.cache.l2Count;
    cache["l1Bytes"] = static_cast<double>(report.cache.l1Bytes);
    cache["l2Bytes"] = static_cast<double>(report.cache.l2Bytes);
    cache["hitRate"] = report.cache.hitRate();
    cache["integrityViolations"] = report.cache.integrityViolations;
    QJsonObject evictions;
    for (auto it = report.cache.evictionsByReason.constBegin();
         it != report.cache.evictionsByReason.constEnd(); ++it) {
        evictions.insert(evictionReasonName(it.key()), it.value());
    }
    cache["evictions"] = evictions;
    obj["cache"] = cache;

    QJsonObject breaker;
    breaker["tripped"] = report.breaker.isTripped;
    breaker["tripCount"] = report.breaker.tripCount;
    breaker["totalRejections"] = report.breaker.totalRejections;
    breaker["totalSuccesses"] = report.breaker.totalSuccesses;
    QJsonObject reasons;
    for (auto it = report.breaker.rejectionsByReason.constBegin();
         it != report.breaker.rejectionsByReason.constEnd(); ++it) {
        reasons.insert(rejectionReasonName(it.key()), it.value());
    }
    breaker["rejectionsByReason"] = reasons;
    obj["breaker"] = breaker;

    QJsonObject telemetry;
    telemetry["events"] = countsToJson(report.telemetry.eventsByType);
    telemetry["phaseTransitions"] = report.telemetry.phaseTransitions;
    telemetry["bytesEvicted"] = static_cast<double>(report.telemetry.bytesEvicted);
    obj["telemetry"] = telemetry;

    QJsonArray failures;
    for (const QString& failure : report.consistencyFailures) {
        failures.append(failure);
    }
    obj["consistencyFailures"] = failures;
    return obj;
}

QJsonObject configToJson(const TileEngineConfig& config)
{
    QJsonObject zoom;
    zoom["pixelRatio"] = config.zoom.pixelRatio;
    zoom["minZoom"] = config.zoom.minZoom;
    zoom["maxZoom"] = config.zoom.maxZoom;
    zoom["initialZoom"] = config.zoom.initialZoom;
    zoom["gestureEndDelayMs"] = config.zoom.gestureEndDelayMs;
    zoom["settlingDelayMs"] = config.zoom.settlingDelayMs;
    zoom["phaseWatchdogMs"] = config.zoom.phaseWatchdogMs;
    zoom["fastGestureSpeed"] = config.zoom.fastGestureSpeed;

    QJsonObject cache;
    cache["l1MaxEntries"] = config.cache.l1MaxEntries;
    cache["l1MaxBytes"] = static_cast<double>(config.cache.l1MaxBytes);
    cache["l2MaxEntries"] = config.cache.l2MaxEntries;
    cache["l2MaxBytes"] = static_cast<double>(config.cache.l2MaxBytes);
    cache["l3MaxPages"] = config.cache.l3MaxPages;

    QJsonObject breaker;
    breaker["threshold"] = config.breaker.threshold;
    breaker["reductionFactor"] = config.breaker.reductionFactor;

    QJsonObject obj;
    obj["zoom"] = zoom;
    obj["cache"] = cache;
    obj["breaker"] = breaker;
    obj["tileSize"] = config.tileSize;
    obj["maxRetries"] = config.maxRetries;
    obj["telemetryCapacity"] = config.telemetryCapacity;
    obj["telemetryEnabled"] = config.telemetryEnabled;
    return obj;
}

static void printReport(const Stress::ReplayReport& report, OutputMode mode)
{
    QTextStream out(stdout);

    if (mode == OutputMode::Json) {
        out << QJsonDocument(reportToJson(report)).toJson(QJsonDocument::Indented);
        return;
    }

    out << QCoreApplication::translate("CLI", "Steps: %1%2, %3 ms\n")
               .arg(report.stepsRun)
               .arg(report.settleSkipped ? QStringLiteral(" (cancelled, settle skipped)")
                    : report.cancelled   ? QStringLiteral(" (cancelled)")
                                         : QString())
               .arg(report.elapsedMs);
    out << QCoreApplication::translate("CLI", "Final: zoom %1, tier %2, stretch %3, epoch %4, %5\n")
               .arg(report.finalZoom).arg(report.finalTier).arg(report.finalCssStretch)
               .arg(report.finalEpoch).arg(gesturePhaseName(report.finalPhase));
    out << QCoreApplication::translate("CLI", "Requests: %1 (hits %2, dispatched %3, coalesced %4, fallbacks %5)\n")
               .arg(report.tilesRequested).arg(report.cacheHits).arg(report.dispatched)
               .arg(report.coalesced).arg(report.fallbacksShown);
    out << QCoreApplication::translate("CLI", "Results: accepted %1, stale %2, scale %3, failed %4\n")
               .arg(report.verdicts.value(TileResultVerdict::Accepted))
               .arg(report.verdicts.value(TileResultVerdict::RejectedEpoch))
               .arg(report.verdicts.value(TileResultVerdict::RejectedScale))
               .arg(report.verdicts.value(TileResultVerdict::RenderFailed));
    out << QCoreApplication::translate("CLI", "Cache: L1 %1, L2 %2, hit rate %3%, evictions %4\n")
               .arg(report.cache.l1Count).arg(report.cache.l2Count)
               .arg(report.cache.hitRate() * 100.0, 0, 'f', 1)
               .arg(report.cache.evictions);
    out << QCoreApplication::translate("CLI", "Breaker: %1, trips %2, rejections %3\n")
               .arg(report.breaker.isTripped ? QStringLiteral("TRIPPED") : QStringLiteral("closed"))
               .arg(report.breaker.tripCount).arg(report.breaker.totalRejections);

    if (report.isConsistent()) {
        out << QCoreApplication::translate("CLI", "Consistent: yes\n");
    } else {
        out << QCoreApplication::translate("CLI", "Consistent: NO\n");
        for (const QString& failure : report.consistencyFailures) {
            out << "  - " << failure << "\n";
        }
    }
}

// =============================================================================
// Run Handler
// =============================================================================

int handleRun(QCoreApplication& app, const QCommandLineParser& parser)
{
    Q_UNUSED(app)

    const OutputMode outputMode = getOutputMode(parser);
    TileEngineConfig config = TileEngineConfig::loadDefault();
    Stress::ReplayOptions options;
    options.zoomTo = config.zoom.maxZoom;

    double stepsValue = options.steps;
    double tileSizeValue = config.tileSize;
    double timeoutSeconds = options.settleTimeoutMs / 1000.0;

    if (!readPositive(parser, QStringLiteral("zoom-from"), options.zoomFrom)
        || !readPositive(parser, QStringLiteral("zoom-to"), options.zoomTo)
        || !readPositive(parser, QStringLiteral("steps"), stepsValue)
        || !readPositive(parser, QStringLiteral("pixel-ratio"), config.zoom.pixelRatio)
        || !readPositive(parser, QStringLiteral("max-zoom"), config.zoom.maxZoom)
        || !readPositive(parser, QStringLiteral("tile-size"), tileSizeValue)
        || !readPositive(parser, QStringLiteral("timeout"), timeoutSeconds)
        || !readNonNegative(parser, QStringLiteral("latency-ms"), options.latencyMs)
        || !readNonNegative(parser, QStringLiteral("step-interval"), options.stepIntervalMs)
        || !readNonNegative(parser, QStringLiteral("fail-every"), options.failEveryN)) {
        return ExitCode::InvalidArgs;
    }

    options.steps = static_cast<int>(stepsValue);
    config.tileSize = static_cast<int>(tileSizeValue);
    options.settleTimeoutMs = static_cast<int>(timeoutSeconds * 1000.0);
    if (!parser.isSet(QStringLiteral("max-zoom")) && !parser.isSet(QStringLiteral("zoom-to"))) {
        options.zoomTo = config.zoom.maxZoom;
    }

    const QStringList problems = config.validate();
    if (!problems.isEmpty()) {
        QTextStream err(stderr);
        for (const QString& problem : problems) {
            err << QCoreApplication::translate("CLI", "Error: ") << problem << "\n";
        }
        return ExitCode::InvalidArgs;
    }

    Stress::ProgressCallback progress;
    if (outputMode == OutputMode::Verbose) {
        progress = [](int step, int total, double zoom) {
            QTextStream out(stdout);
            out << QStringLiteral("[%1/%2] zoom %3\n").arg(step + 1).arg(total).arg(zoom, 0, 'f', 3);
        };
    }

    Stress::StopFlags stop;
    stop.stopGesture = stopGestureFlag();
    stop.skipSettle = skipSettleFlag();

    resetInterrupts();
    const Stress::ReplayReport report = Stress::replayGesture(config, options, progress, stop);
    printReport(report, outputMode);

    if (report.cancelled || report.settleSkipped) {
        return ExitCode::Cancelled;
    }
    return report.isConsistent() ? ExitCode::Success : ExitCode::ConsistencyFailure;
}

// =============================================================================
// Config Handler
// =============================================================================

// Prints nested objects as "group/key = value" lines, matching the QSettings layout.
static void printFlat(QTextStream& out, const QJsonObject& obj, const QString& prefix)
{
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QString key = prefix.isEmpty() ? it.key() : prefix + QLatin1Char('/') + it.key();
        if (it.value().isObject()) {
            printFlat(out, it.value().toObject(), key);
        } else if (it.value().isBool()) {
            out << "  " << key << " = " << (it.value().toBool() ? "true" : "false") << "\n";
        } else {
            out << "  " << key << " = " << it.value().toDouble() << "\n";
        }
    }
}

int handleConfig(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    const QString action = positional.isEmpty() ? QStringLiteral("show") : positional.first();

    QSettings settings(TileEngineConfig::ORGANIZATION, TileEngineConfig::APPLICATION);
    QTextStream out(stdout);
    QTextStream err(stderr);

    if (action == QLatin1String("show")) {
        QStringList warnings;
        const TileEngineConfig config = TileEngineConfig::load(settings, &warnings);
        for (const QString& warning : warnings) {
            err << QCoreApplication::translate("CLI", "Warning: ") << warning << "\n";
        }
        const QJsonObject json = configToJson(config);
        if (parser.isSet(QStringLiteral("json"))) {
            out << QJsonDocument(json).toJson(QJsonDocument::Indented);
        } else {
            out << QCoreApplication::translate("CLI", "Settings file: %1\n").arg(settings.fileName());
            printFlat(out, json, QString());
        }
        return ExitCode::Success;
    }

    if (action == QLatin1String("save-defaults") || action == QLatin1String("reset")) {
        if (action == QLatin1String("reset")) {
            settings.remove(QStringLiteral("TileEngine"));
        }
        TileEngineConfig().save(settings);
        settings.sync();
        if (settings.status() != QSettings::NoError) {
            err << QCoreApplication::translate("CLI", "Error: could not write %1\n").arg(settings.fileName());
            return ExitCode::GeneralError;
        }
        out << QCoreApplication::translate("CLI", "Wrote default configuration to %1\n").arg(settings.fileName());
        return ExitCode::Success;
    }

    err << QCoreApplication::translate("CLI", "Error: unknown config action '%1'\n").arg(action);
    return ExitCode::InvalidArgs;
}

} // namespace Cli
