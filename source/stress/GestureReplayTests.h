#ifndef GESTUREREPLAYTESTS_H
#define GESTUREREPLAYTESTS_H

#include <QObject>
#include <QTest>
#include "GestureReplay.h"

/**
 * End-to-end replay of short zoom gestures through the full engine.
 * Run with: tessera-tests --test-replay
 */
class GestureReplayTests : public QObject {
    Q_OBJECT

private:
    static TileEngineConfig quickConfig()
    {
        TileEngineConfig config;
        config.zoom.gestureEndDelayMs = 40;
        config.zoom.settlingDelayMs = 40;
        return config;
    }

    static Stress::ReplayOptions quickOptions()
    {
        Stress::ReplayOptions options;
        options.steps = 12;
        options.stepIntervalMs = 5;
        options.latencyMs = 1;
        options.settleTimeoutMs = 8000;
        return options;
    }

private slots:
    void testVisiblePageRect() {
        const QRectF full = Stress::visiblePageRect(QSizeF(1280, 800), QSizeF(612, 792), 1.0);
        QCOMPARE(full, QRectF(0, 0, 612, 792));

        const QRectF zoomed = Stress::visiblePageRect(QSizeF(1280, 800), QSizeF(612, 792), 32.0);
        QCOMPARE(zoomed, QRectF(0, 0, 40, 25));
    }

    // Zoom 1 -> 32 on a 2x display ends at tier 64 with nothing inconsistent
    void testZoomToMaxHighDensity() {
        TileEngineConfig config = quickConfig();
        config.zoom.pixelRatio = 2.0;
        config.zoom.maxZoom = 32.0;

        const Stress::ReplayReport report = Stress::replayGesture(config, quickOptions());

        QVERIFY2(report.isConsistent(), qPrintable(report.consistencyFailures.join("; ")));
        QCOMPARE(report.stepsRun, 12);
        QCOMPARE(report.finalZoom, 32.0);
        QCOMPARE(report.finalTier, 64.0);
        QCOMPARE(report.finalPhase, GesturePhase::Idle);
        QVERIFY(report.verdicts.value(TileResultVerdict::Accepted) > 0);
        QCOMPARE(report.cache.integrityViolations, 0);
        QVERIFY(report.telemetry.phaseTransitions >= 3);
    }

    // Injected render failures are retried or dropped, never cached
    void testRenderFailures() {
        Stress::ReplayOptions options = quickOptions();
        options.zoomTo = 8.0;
        options.failEveryN = 3;

        const Stress::ReplayReport report = Stress::replayGesture(quickConfig(), options);

        QVERIFY(report.settled);
        QVERIFY(report.verdicts.value(TileResultVerdict::RenderFailed) > 0);
        QVERIFY(report.telemetry.eventsByType.value(TileEventType::RetryAttempt) > 0);
        QCOMPARE(report.cache.integrityViolations, 0);
        QCOMPARE(report.finalTier, 8.0);
    }

    void testStoppedBeforeStart() {
        std::atomic<bool> stopGesture(true);
        Stress::StopFlags stop;
        stop.stopGesture = &stopGesture;

        const Stress::ReplayReport report =
            Stress::replayGesture(quickConfig(), quickOptions(), nullptr, stop);

        QVERIFY(report.cancelled);
        QVERIFY(!report.settleSkipped);
        QCOMPARE(report.stepsRun, 0);
        QVERIFY(report.settled);
    }

    // Stopping mid-gesture still settles; skipping the settle reports it as unsettled
    void testStopStages() {
        std::atomic<bool> stopGesture(false);
        std::atomic<bool> skipSettle(false);
        Stress::StopFlags stop;
        stop.stopGesture = &stopGesture;
        stop.skipSettle = &skipSettle;

        Stress::ReplayOptions options = quickOptions();
        options.steps = 10;
        const Stress::ReplayReport report = Stress::replayGesture(
            quickConfig(), options,
            [&](int step, int, double) {
                if (step == 2) {
                    stopGesture = true;
                    skipSettle = true;
                }
            },
            stop);

        QVERIFY(report.cancelled);
        QVERIFY(report.settleSkipped);
        QCOMPARE(report.stepsRun, 3);
        QVERIFY(!report.settled);
        QVERIFY(!report.isConsistent());
    }

    void testProgressCallback() {
        Stress::ReplayOptions options = quickOptions();
        options.steps = 4;
        options.zoomTo = 2.0;

        QVector<double> zooms;
        Stress::replayGesture(quickConfig(), options,
                              [&zooms](int, int total, double zoom) {
                                  QCOMPARE(total, 4);
                                  zooms.append(zoom);
                              });

        QCOMPARE(zooms.size(), 4);
        QCOMPARE(zooms.first(), 1.0);
        QCOMPARE(zooms.last(), 2.0);
    }
};

#endif // GESTUREREPLAYTESTS_H
