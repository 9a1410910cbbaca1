#ifndef ZOOMEPOCHAUTHORITYTESTS_H
#define ZOOMEPOCHAUTHORITYTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <cmath>
#include <limits>
#include "ZoomEpochAuthority.h"

/**
 * Unit tests for ZoomEpochAuthority.
 * Run with: tessera-tests --test-epoch
 */
class ZoomEpochAuthorityTests : public QObject {
    Q_OBJECT

private:
    static ZoomAuthorityConfig fastConfig()
    {
        ZoomAuthorityConfig config;
        config.gestureEndDelayMs = 20;
        config.settlingDelayMs = 20;
        config.phaseWatchdogMs = 2000;
        return config;
    }

    static PhaseTransitionEvent transitionAt(const QSignalSpy& spy, int index)
    {
        return spy.at(index).at(0).value<PhaseTransitionEvent>();
    }

private slots:
    void testEpochTolerance_data() {
        QTest::addColumn<double>("zoom");
        QTest::addColumn<int>("expected");

        QTest::newRow("1") << 1.0 << 5;
        QTest::newRow("2") << 2.0 << 5;
        QTest::newRow("4") << 4.0 << 5;
        QTest::newRow("5") << 5.0 << 10;
        QTest::newRow("8") << 8.0 << 10;
        QTest::newRow("16") << 16.0 << 10;
        QTest::newRow("17") << 17.0 << 15;
        QTest::newRow("32") << 32.0 << 15;
        QTest::newRow("64") << 64.0 << 15;
        QTest::newRow("zero") << 0.0 << 5;
        QTest::newRow("negative") << -3.0 << 5;
        QTest::newRow("infinity") << std::numeric_limits<double>::infinity() << 15;
        QTest::newRow("nan") << std::numeric_limits<double>::quiet_NaN() << 5;
    }

    void testEpochTolerance() {
        QFETCH(double, zoom);
        QFETCH(int, expected);
        QCOMPARE(ZoomEpochAuthority::getEpochTolerance(zoom), expected);
    }

    // Idle -> active on the first sample
    void testGestureStart() {
        ZoomEpochAuthority authority(fastConfig());
        QSignalSpy spy(&authority, &ZoomEpochAuthority::phaseChanged);

        authority.onZoomGesture(2.0, QPointF(100, 100), CameraState());

        QCOMPARE(authority.getGesturePhase(), GesturePhase::Active);
        QCOMPARE(authority.getEpoch(), 1);
        QCOMPARE(authority.getFocalPoint(), QPointF(100, 100));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(transitionAt(spy, 0).trigger, QString("gesture-start"));
        QCOMPARE(transitionAt(spy, 0).from, GesturePhase::Idle);
    }

    void testZoomChangeInsideGestureBumpsEpoch() {
        ZoomEpochAuthority authority(fastConfig());
        authority.onZoomGesture(2.0, QPointF(), CameraState());
        const int afterStart = authority.getEpoch();

        authority.onZoomGesture(3.0, QPointF(), CameraState());
        QCOMPARE(authority.getEpoch(), afterStart + 1);

        // Same zoom, no bump
        authority.onZoomGesture(3.0, QPointF(10, 10), CameraState());
        QCOMPARE(authority.getEpoch(), afterStart + 1);
    }

    void testPanCommitBumpsEpochOnly() {
        ZoomEpochAuthority authority(fastConfig());
        QSignalSpy phaseSpy(&authority, &ZoomEpochAuthority::phaseChanged);

        CameraState camera;
        camera.x = 40;
        authority.onPanCommit(camera);

        QCOMPARE(authority.getEpoch(), 1);
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Idle);
        QCOMPARE(phaseSpy.count(), 0);
        QCOMPARE(authority.getCameraState().x, 40.0);
    }

    // active -> settling -> idle when nobody dispatches on settlingComplete
    void testSettleWithoutDispatch() {
        ZoomEpochAuthority authority(fastConfig());
        QSignalSpy phaseSpy(&authority, &ZoomEpochAuthority::phaseChanged);
        QSignalSpy settleSpy(&authority, &ZoomEpochAuthority::settlingComplete);

        authority.onZoomGesture(4.0, QPointF(), CameraState());
        QTRY_COMPARE(authority.getGesturePhase(), GesturePhase::Idle);

        QCOMPARE(settleSpy.count(), 1);
        QCOMPARE(phaseSpy.count(), 3);
        QCOMPARE(transitionAt(phaseSpy, 1).to, GesturePhase::Settling);
        QCOMPARE(transitionAt(phaseSpy, 2).trigger, QString("settle-complete"));
        QCOMPARE(authority.getEpoch(), 3);
    }

    // settlingComplete receiver dispatches -> rendering -> accepted -> idle
    void testRenderPath() {
        ZoomEpochAuthority authority(fastConfig());
        connect(&authority, &ZoomEpochAuthority::settlingComplete, &authority,
                [&authority](double, double) { authority.notifyRenderDispatched(); });

        authority.onZoomGesture(8.0, QPointF(), CameraState());
        QTRY_COMPARE(authority.getGesturePhase(), GesturePhase::Rendering);

        authority.notifyRenderAccepted();
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Idle);
        QCOMPARE(authority.transitionCount(), 4);
    }

    void testGestureResume() {
        ZoomAuthorityConfig config = fastConfig();
        config.settlingDelayMs = 10000;
        ZoomEpochAuthority authority(config);
        QSignalSpy spy(&authority, &ZoomEpochAuthority::phaseChanged);

        authority.onZoomGesture(2.0, QPointF(), CameraState());
        authority.endGesture();
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Settling);

        authority.onZoomGesture(2.5, QPointF(), CameraState());
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Active);
        QCOMPARE(transitionAt(spy, spy.count() - 1).trigger, QString("gesture-resume"));
    }

    // Notifications outside their phase are ignored
    void testIgnoredNotifications() {
        ZoomEpochAuthority authority(fastConfig());
        authority.notifyRenderDispatched();
        authority.notifyRenderAccepted();
        authority.endGesture();
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Idle);
        QCOMPARE(authority.getEpoch(), 0);
    }

    void testWatchdog() {
        ZoomAuthorityConfig config;
        config.gestureEndDelayMs = 10000;
        config.settlingDelayMs = 10000;
        config.phaseWatchdogMs = 50;
        ZoomEpochAuthority authority(config);
        QSignalSpy spy(&authority, &ZoomEpochAuthority::phaseChanged);

        authority.onZoomGesture(2.0, QPointF(), CameraState());
        QTRY_COMPARE_WITH_TIMEOUT(authority.getGesturePhase(), GesturePhase::Idle, 2000);
        QCOMPARE(transitionAt(spy, spy.count() - 1).trigger, QString("watchdog"));
    }

    void testNanZoomIgnored() {
        ZoomEpochAuthority authority(fastConfig());
        authority.onZoomGesture(std::numeric_limits<double>::quiet_NaN(), QPointF(), CameraState());
        QCOMPARE(authority.getGesturePhase(), GesturePhase::Idle);
        QCOMPARE(authority.getZoom(), 1.0);
    }

    // Fast gestures drop quality while active, then snap back
    void testVelocityReconvergence() {
        ZoomAuthorityConfig config = fastConfig();
        config.gestureEndDelayMs = 10000;
        config.settlingDelayMs = 10000;
        ZoomEpochAuthority authority(config);

        authority.onZoomGesture(16.0, QPointF(), CameraState());
        authority.setGestureVelocity(QPointF(5.0, 0.0));
        QCOMPARE(authority.getScaleTier().tier, 8.0);
        QCOMPARE(authority.getScaleTier().cssStretch, 2.0);
        QCOMPARE(authority.getStaticScaleTier().tier, 16.0);

        authority.endGesture();
        QCOMPARE(authority.getScaleTier().tier, authority.getStaticScaleTier().tier);
        QCOMPARE(authority.getScale(), 16.0);
    }

    void testSnapshotValidation() {
        ZoomEpochAuthority authority(fastConfig());
        const ZoomSnapshot snapshot = authority.captureSnapshot();
        const ZoomSnapshot second = authority.captureSnapshot();
        QVERIFY(second.snapshotId != snapshot.snapshotId);

        for (int i = 0; i < 5; ++i) {
            authority.incrementEpoch();
        }
        QVERIFY(authority.validateSnapshot(snapshot));

        authority.incrementEpoch();
        QVERIFY(!authority.validateSnapshot(snapshot));
        QVERIFY(!authority.isEpochAcceptable(0));
        QVERIFY(authority.isEpochAcceptable(6));
    }

    void testRenderModeHysteresis() {
        ZoomAuthorityConfig config = fastConfig();
        config.gestureEndDelayMs = 10000;
        ZoomEpochAuthority authority(config);
        QSignalSpy spy(&authority, &ZoomEpochAuthority::renderModeChanged);
        QCOMPARE(authority.getRenderMode(), RenderMode::Full);

        authority.onZoomGesture(2.0, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Adaptive);
        authority.onZoomGesture(1.4, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Adaptive);
        authority.onZoomGesture(1.3, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Full);

        authority.onZoomGesture(5.0, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Tiled);
        authority.onZoomGesture(3.8, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Tiled);
        authority.onZoomGesture(3.5, QPointF(), CameraState());
        QCOMPARE(authority.getRenderMode(), RenderMode::Adaptive);

        QCOMPARE(spy.count(), 4);
    }

    void testTilePriority() {
        ZoomEpochAuthority authority(fastConfig());
        authority.onZoomGesture(2.0, QPointF(0, 0), CameraState());

        QCOMPARE(authority.getTilePriority(QPointF(100, 0), 256), TilePriority::Critical);
        QCOMPARE(authority.getTilePriority(QPointF(400, 0), 256), TilePriority::High);
        QCOMPARE(authority.getTilePriority(QPointF(900, 0), 256), TilePriority::Medium);
        QCOMPARE(authority.getTilePriority(QPointF(2000, 0), 256), TilePriority::Low);
    }

    void testConstrainZoom() {
        ZoomEpochAuthority authority(fastConfig());
        QCOMPARE(authority.constrainZoom(0.01), 0.25);
        QCOMPARE(authority.constrainZoom(100.0), 32.0);
        QCOMPARE(authority.constrainZoom(3.0), 3.0);

        authority.setZoomLimits(0.5, 8.0);
        QCOMPARE(authority.constrainZoom(16.0), 8.0);

        // Inverted limits are rejected
        authority.setZoomLimits(10.0, 2.0);
        QCOMPARE(authority.config().maxZoom, 8.0);
    }

    // Zoom 32 at dpr 2 renders at tier 64
    void testMaxZoomHighDensity() {
        ZoomAuthorityConfig config = fastConfig();
        config.pixelRatio = 2.0;
        config.maxZoom = 32.0;
        ZoomEpochAuthority authority(config);

        authority.onZoomGesture(32.0, QPointF(), CameraState());
        authority.endGesture();
        QCOMPARE(authority.getScale(), 64.0);
        QCOMPARE(authority.getScaleTier().cssStretch, 1.0);
    }

    void testReset() {
        ZoomEpochAuthority authority(fastConfig());
        authority.onZoomGesture(6.0, QPointF(), CameraState());
        authority.reset();

        QCOMPARE(authority.getGesturePhase(), GesturePhase::Idle);
        QCOMPARE(authority.getEpoch(), 0);
        QCOMPARE(authority.getZoom(), 1.0);
        QCOMPARE(authority.transitionCount(), 0);
    }
};

#endif // ZOOMEPOCHAUTHORITYTESTS_H
