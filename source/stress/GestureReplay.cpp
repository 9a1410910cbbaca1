#include "GestureReplay.h"
#include "../tiles/SyntheticTileRenderer.h"
#include "../tiles/TileCircuitBreaker.h"

#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <cmath>

/**
 * @file GestureReplay.cpp
 * @brief Implementation of the gesture replay.
 * 
 * @see GestureReplay.h for API documentation
 */

namespace Stress {

namespace {

void pumpEvents(int durationMs)
{
    QElapsedTimer timer;
    timer.start();
    do {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    } while (timer.elapsed() < durationMs);
}

bool isRaised(const std::atomic<bool>* flag)
{
    return flag && flag->load();
}

void checkConsistency(ReplayReport& report, const TileEngineConfig& config,
                      TileRenderCoordinator& coordinator, TileCache& cache,
                      const ReplayOptions& options)
{
    const double tier = report.finalTier;

    if (ScaleMath::quantizeScale(tier) != tier) {
        report.consistencyFailures << QStringLiteral("final tier %1 is not on the ladder").arg(tier);
    }
    if (ScaleMath::applyScaleCaps(tier, config.zoom.pixelRatio, config.zoom.maxZoom) != tier) {
        report.consistencyFailures << QStringLiteral("final tier %1 changes under applyScaleCaps").arg(tier);
    }
    if (tier > ScaleMath::effectiveScaleCeiling(config.zoom.pixelRatio, config.zoom.maxZoom)) {
        report.consistencyFailures << QStringLiteral("final tier %1 exceeds the scale ceiling").arg(tier);
    }

    if (!report.settled) {
        if (report.settleSkipped) {
            report.consistencyFailures << QStringLiteral("settle wait skipped (phase %1, %2 in flight)")
                                              .arg(gesturePhaseName(report.finalPhase))
                                              .arg(coordinator.inFlightCount());
            return;
        }
        report.consistencyFailures << QStringLiteral("engine did not settle (phase %1, %2 in flight)")
                                          .arg(gesturePhaseName(report.finalPhase))
                                          .arg(coordinator.inFlightCount());
        return;
    }

    // Something must cover the focal point: the ideal tier, or a lower tier the breaker fell back to
    const QRectF visible = visiblePageRect(options.viewport, options.pageSize, report.finalZoom);
    const double tileSpan = config.tileSize / tier;
    const int cx = static_cast<int>(std::floor(visible.center().x() / tileSpan));
    const int cy = static_cast<int>(std::floor(visible.center().y() / tileSpan));
    const TileIdentity center(0, cx, cy, tier, config.tileSize);
    if (!cache.has(center) && !cache.findFallback(center).found) {
        report.consistencyFailures << QStringLiteral("no cached tile covers %1 after settle")
                                          .arg(cache.getTileKey(center));
    }

    if (report.cache.integrityViolations > 0) {
        report.consistencyFailures << QStringLiteral("%1 integrity violations")
                                          .arg(report.cache.integrityViolations);
    }
}

} // namespace

QRectF visiblePageRect(const QSizeF& viewport, const QSizeF& pageSize, double zoom)
{
    const double z = zoom > 0.0 ? zoom : 1.0;
    const QRectF visible(0.0, 0.0, viewport.width() / z, viewport.height() / z);
    return visible.intersected(QRectF(QPointF(0.0, 0.0), pageSize));
}

ReplayReport replayGesture(const TileEngineConfig& config, const ReplayOptions& options,
                           ProgressCallback progress, const StopFlags& stop)
{
    ReplayReport report;
    QElapsedTimer clock;
    clock.start();

    ZoomEpochAuthority authority(config.zoom);
    TileCache cache(config.cache);
    TileCircuitBreaker breaker(config.breaker);

    SyntheticTileRenderer::Options rendererOptions;
    rendererOptions.latencyMs = options.latencyMs;
    rendererOptions.failEveryN = options.failEveryN;
    auto renderer = std::make_shared<SyntheticTileRenderer>(rendererOptions);

    TileRenderCoordinator coordinator(&authority, &cache, &breaker, renderer);
    coordinator.setMaxRetries(config.maxRetries);

    TileLifecycleTelemetry telemetry(config.telemetryCapacity);
    telemetry.setEnabled(config.telemetryEnabled);
    telemetry.attach(&cache);
    telemetry.attach(&authority);
    telemetry.attach(&coordinator);

    QObject::connect(&coordinator, &TileRenderCoordinator::resultRejected,
                     [&report](const TileIdentity&, TileResultVerdict verdict) {
                         ++report.verdicts[verdict];
                     });
    QObject::connect(&coordinator, &TileRenderCoordinator::tileReady,
                     [&report](const TileIdentity&, const CameraSnapshot&) {
                         ++report.verdicts[TileResultVerdict::Accepted];
                     });

    cache.setDocument(QStringLiteral("replay"));
    PageMetadata page;
    page.page = 0;
    page.width = options.pageSize.width();
    page.height = options.pageSize.height();
    cache.setPageMetadata(page);

    const int steps = qMax(1, options.steps);
    const double from = authority.constrainZoom(options.zoomFrom);
    const double to = authority.constrainZoom(options.zoomTo);
    const QPointF focal(options.viewport.width() / 2.0, options.viewport.height() / 2.0);

    // ===== Gesture =====
    for (int i = 0; i < steps; ++i) {
        if (isRaised(stop.stopGesture)) {
            report.cancelled = true;
            break;
        }

        const double t = steps > 1 ? double(i) / (steps - 1) : 1.0;
        const double zoom = from * std::pow(to / from, t);

        CameraState camera;
        camera.zoom = zoom;
        authority.onZoomGesture(zoom, focal, camera);

        const QRectF visible = visiblePageRect(options.viewport, options.pageSize, authority.getZoom());
        coordinator.setVisibleRegion(0, visible, config.tileSize);

        const QVector<TileRequestResult> results =
            coordinator.requestVisibleTiles(0, visible, config.tileSize);
        for (const TileRequestResult& result : results) {
            ++report.tilesRequested;
            switch (result.status) {
                case TileRequestStatus::CacheHit:   ++report.cacheHits; break;
                case TileRequestStatus::Dispatched: ++report.dispatched; break;
                case TileRequestStatus::Coalesced:  ++report.coalesced; break;
                case TileRequestStatus::Invalid:    break;
            }
            if (result.fallback.found) {
                ++report.fallbacksShown;
            }
        }

        ++report.stepsRun;
        if (progress) {
            progress(i, steps, zoom);
        }
        pumpEvents(options.stepIntervalMs);
    }

    // ===== Settle =====
    authority.endGesture();

    QElapsedTimer settleClock;
    settleClock.start();
    while (settleClock.elapsed() < options.settleTimeoutMs) {
        if (isRaised(stop.skipSettle)) {
            report.settleSkipped = true;
            break;
        }
        pumpEvents(10);
        if (authority.getGesturePhase() == GesturePhase::Idle && coordinator.inFlightCount() == 0) {
            report.settled = true;
            break;
        }
    }

    report.finalZoom = authority.getZoom();
    const ScaleMath::ScaleTier tier = authority.getStaticScaleTier();
    report.finalTier = tier.tier;
    report.finalCssStretch = tier.cssStretch;
    report.finalEpoch = authority.getEpoch();
    report.finalPhase = authority.getGesturePhase();
    report.cache = cache.getStats();
    report.breaker = breaker.getStats();
    report.telemetry = telemetry.counters();

    checkConsistency(report, config, coordinator, cache, options);

    if (!report.settled && !report.settleSkipped) {
        qWarning() << "GestureReplay: engine still" << gesturePhaseName(report.finalPhase)
                   << "after" << options.settleTimeoutMs << "ms";
    }

    coordinator.waitForAll();
    report.elapsedMs = clock.elapsed();
    return report;
}

} // namespace Stress
