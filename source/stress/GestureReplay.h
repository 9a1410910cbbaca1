#ifndef GESTUREREPLAY_H
#define GESTUREREPLAY_H

/**
 * @file GestureReplay.h
 * @brief Headless replay of a zoom gesture through the whole tile engine.
 * 
 * Builds a ZoomEpochAuthority, TileCache, TileCircuitBreaker and
 * TileRenderCoordinator backed by a SyntheticTileRenderer, feeds a geometric
 * zoom ramp at gesture cadence, lets the engine settle, and checks the end
 * state for consistency.
 * 
 * Used by:
 * - tessera-stress run
 * - GestureReplayTests
 * 
 * Must run on a thread with a Qt event loop available (QCoreApplication);
 * the replay pumps events itself.
 */

#include "../core/TileEngineConfig.h"
#include "../telemetry/TileLifecycleTelemetry.h"
#include "../tiles/TileRenderCoordinator.h"

#include <QMap>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <functional>
#include <atomic>

namespace Stress {

// =============================================================================
// Options / Result Types
// =============================================================================

/**
 * @brief Gesture and renderer parameters.
 */
struct ReplayOptions {
    double zoomFrom = 1.0;
    double zoomTo = 32.0;
    int steps = 60;
    int stepIntervalMs = 16;
    QSizeF viewport = QSizeF(1280, 800);    ///< Screen pixels
    QSizeF pageSize = QSizeF(612, 792);     ///< Page units at zoom 1
    int latencyMs = 5;                      ///< Synthetic render time per tile
    int failEveryN = 0;                     ///< 0 = renders never fail
    int settleTimeoutMs = 10000;
};

/**
 * @brief Everything observed during one replay.
 */
struct ReplayReport {
    int stepsRun = 0;
    bool cancelled = false;             ///< Gesture stopped before its last sample
    bool settleSkipped = false;         ///< Settle wait abandoned on request
    bool settled = false;               ///< Idle with nothing in flight before the timeout
    qint64 elapsedMs = 0;

    double finalZoom = 1.0;
    double finalTier = 1.0;
    double finalCssStretch = 1.0;
    int finalEpoch = 0;
    GesturePhase finalPhase = GesturePhase::Idle;

    int tilesRequested = 0;
    int cacheHits = 0;
    int dispatched = 0;
    int coalesced = 0;
    int fallbacksShown = 0;
    QMap<TileResultVerdict, int> verdicts;

    TileCacheStats cache;
    CircuitBreakerStats breaker;
    TelemetryCounters telemetry;

    QStringList consistencyFailures;    ///< Empty when the engine ended consistent

    bool isConsistent() const { return settled && consistencyFailures.isEmpty(); }
};

/**
 * @brief Progress callback: step index (0-based), total steps, zoom fed.
 */
using ProgressCallback = std::function<void(int step, int total, double zoom)>;

/**
 * @brief Externally owned stop requests, polled between samples.
 */
struct StopFlags {
    std::atomic<bool>* stopGesture = nullptr;   ///< Stop feeding samples, still settle
    std::atomic<bool>* skipSettle = nullptr;    ///< Stop waiting for the engine to settle
};

// =============================================================================
// Operations
// =============================================================================

/**
 * @brief Replay one zoom gesture and report.
 * 
 * @param config Engine configuration (zoom limits, cache, breaker)
 * @param options Gesture / renderer parameters
 * @param progress Optional per-step callback
 * @param stop Optional stop requests; a stopped gesture is still given time
 *             to settle unless skipSettle is raised too
 */
ReplayReport replayGesture(const TileEngineConfig& config, const ReplayOptions& options,
                           ProgressCallback progress = nullptr,
                           const StopFlags& stop = StopFlags());

/**
 * @brief Page-unit rectangle visible at @p zoom with the camera at the origin.
 */
QRectF visiblePageRect(const QSizeF& viewport, const QSizeF& pageSize, double zoom);

} // namespace Stress

#endif // GESTUREREPLAY_H
