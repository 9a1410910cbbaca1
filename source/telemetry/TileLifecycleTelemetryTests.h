#ifndef TILELIFECYCLETELEMETRYTESTS_H
#define TILELIFECYCLETELEMETRYTESTS_H

#include <QObject>
#include <QTest>
#include "TileLifecycleTelemetry.h"
#include "../core/ZoomEpochAuthority.h"
#include "../tiles/TileCache.h"

/**
 * Unit tests for TileLifecycleTelemetry.
 * Run with: tessera-tests --test-telemetry
 */
class TileLifecycleTelemetryTests : public QObject {
    Q_OBJECT

private:
    static TileLifecycleEvent requestEvent(int tileX)
    {
        const TileIdentity identity(0, tileX, 0, 1.0, 16);
        return TileLifecycleEvent::forTile(TileEventType::Request, identity,
                                           QStringLiteral("p0-t%1x0-s1-ts16").arg(tileX));
    }

private slots:
    void testForTileFillsIdentity() {
        const TileLifecycleEvent event = TileLifecycleEvent::forTile(
            TileEventType::RenderStart, TileIdentity(3, 4, 5, 7.0, 256), QStringLiteral("k"));

        QCOMPARE(TileLifecycleEvent::SCHEMA_VERSION, 1);
        QVERIFY(event.hasCoordinates);
        QCOMPARE(event.page, 3);
        QCOMPARE(event.tileX, 4);
        QCOMPARE(event.tileY, 5);
        QCOMPARE(event.scale, 8.0);
        QCOMPARE(event.tileSize, 256);
        QVERIFY(event.timestampMs > 0);
    }

    // Oldest records fall off once the ring is full; counters keep counting
    void testRingBuffer() {
        TileLifecycleTelemetry telemetry(5);
        for (int i = 0; i < 12; ++i) {
            telemetry.recordTileEvent(requestEvent(i));
        }

        QCOMPARE(telemetry.bufferedCount(), 5);
        QCOMPARE(telemetry.counters().totalRecorded, 12);
        QCOMPARE(telemetry.counters().eventsByType.value(TileEventType::Request), 12);

        const QVector<TelemetryRecord> records = telemetry.records();
        QCOMPARE(records.first().tile.tileX, 7);
        QCOMPARE(records.last().tile.tileX, 11);
    }

    void testDefaultCapacity() {
        TileLifecycleTelemetry telemetry(0);
        QCOMPARE(telemetry.capacity(), TileLifecycleTelemetry::DEFAULT_CAPACITY);
        QCOMPARE(telemetry.capacity(), 1000);
    }

    void testEventsForTile() {
        TileLifecycleTelemetry telemetry;
        telemetry.recordTileEvent(requestEvent(1));
        telemetry.recordTileEvent(requestEvent(2));
        telemetry.recordTileEvent(requestEvent(1));

        QCOMPARE(telemetry.eventsForTile(QStringLiteral("p0-t1x0-s1-ts16")).size(), 2);
        QCOMPARE(telemetry.eventsForTile(QStringLiteral("missing")).size(), 0);
    }

    void testDisabledRecordsNothing() {
        TileLifecycleTelemetry telemetry;
        telemetry.setEnabled(false);
        telemetry.recordTileEvent(requestEvent(1));
        telemetry.recordEviction(EvictionEvent());
        QCOMPARE(telemetry.bufferedCount(), 0);
        QCOMPARE(telemetry.counters().totalRecorded, 0);
    }

    void testAttachedCache() {
        TileCache cache;
        TileLifecycleTelemetry telemetry;
        telemetry.attach(&cache);

        const TileIdentity identity(0, 0, 0, 1.0, 16);
        QVERIFY(cache.set(identity, CachedTileData::rawRgba(16, 16, QByteArray(16 * 16 * 4, 0))).success);
        cache.clear(EvictionReason::Manual);

        const TelemetryCounters counters = telemetry.counters();
        QCOMPARE(counters.eventsByType.value(TileEventType::CacheStore), 1);
        QCOMPARE(counters.eventsByType.value(TileEventType::CacheEvict), 1);
        QCOMPARE(counters.evictionsByReason.value(EvictionReason::Manual), 1);
        QCOMPARE(counters.evictionsByLevel.value(CacheLevel::L2), 1);
        QCOMPARE(counters.bytesEvicted, qint64(16 * 16 * 4));

        const QVector<TelemetryRecord> records = telemetry.records();
        QCOMPARE(records.size(), 2);
        QCOMPARE(records.at(1).kind, TelemetryRecord::Kind::Eviction);
    }

    void testAttachedAuthority() {
        ZoomAuthorityConfig config;
        config.gestureEndDelayMs = 60000;
        config.settlingDelayMs = 60000;
        ZoomEpochAuthority authority(config);
        TileLifecycleTelemetry telemetry;
        telemetry.attach(&authority);

        authority.onZoomGesture(2.0, QPointF(), CameraState());
        authority.endGesture();
        authority.forceIdle();

        const TelemetryCounters counters = telemetry.counters();
        QCOMPARE(counters.phaseTransitions, 3);
        QVERIFY(counters.phaseDurationMs.contains(GesturePhase::Idle));
        QVERIFY(counters.phaseDurationMs.contains(GesturePhase::Settling));
        QCOMPARE(telemetry.records().last().phase.trigger, QString("force-idle"));
    }

    void testDropReasons() {
        TileLifecycleTelemetry telemetry;
        TileLifecycleEvent drop = requestEvent(0);
        drop.type = TileEventType::Drop;
        drop.drop.reason = TileDropReason::ScaleMismatch;
        telemetry.recordTileEvent(drop);
        telemetry.recordTileEvent(drop);

        QCOMPARE(telemetry.counters().dropsByReason.value(TileDropReason::ScaleMismatch), 2);

        telemetry.clear();
        QCOMPARE(telemetry.bufferedCount(), 0);
        QVERIFY(telemetry.counters().dropsByReason.isEmpty());
    }
};

#endif // TILELIFECYCLETELEMETRYTESTS_H
