#include "TileLifecycleTelemetry.h"
#include "../core/ZoomEpochAuthority.h"
#include "../tiles/TileCache.h"
#include "../tiles/TileRenderCoordinator.h"


TileLifecycleTelemetry::TileLifecycleTelemetry(int capacity, QObject* parent)
    : QObject(parent)
    , m_capacity(capacity > 0 ? capacity : DEFAULT_CAPACITY)
{
}

void TileLifecycleTelemetry::attach(TileCache* cache)
{
    connect(cache, &TileCache::tileEvent, this, &TileLifecycleTelemetry::recordTileEvent);
    connect(cache, &TileCache::tileEvicted, this, &TileLifecycleTelemetry::recordEviction);
}

void TileLifecycleTelemetry::attach(ZoomEpochAuthority* authority)
{
    connect(authority, &ZoomEpochAuthority::phaseChanged,
            this, &TileLifecycleTelemetry::recordPhaseTransition);
}

void TileLifecycleTelemetry::attach(TileRenderCoordinator* coordinator)
{
    connect(coordinator, &TileRenderCoordinator::tileEvent,
            this, &TileLifecycleTelemetry::recordTileEvent);
}

QVector<TelemetryRecord> TileLifecycleTelemetry::records() const
{
    QVector<TelemetryRecord> result;
    result.reserve(static_cast<int>(m_buffer.size()));
    for (const TelemetryRecord& record : m_buffer) {
        result.append(record);
    }
    return result;
}

QVector<TileLifecycleEvent> TileLifecycleTelemetry::eventsForTile(const QString& tileKey) const
{
    QVector<TileLifecycleEvent> result;
    for (const TelemetryRecord& record : m_buffer) {
        if (record.kind == TelemetryRecord::Kind::Tile && record.tile.tileKey == tileKey) {
            result.append(record.tile);
        }
    }
    return result;
}

void TileLifecycleTelemetry::clear()
{
    m_buffer.clear();
    m_counters = TelemetryCounters();
}

void TileLifecycleTelemetry::recordTileEvent(const TileLifecycleEvent& event)
{
    if (!m_enabled) {
        return;
    }

    ++m_counters.eventsByType[event.type];
    if (event.type == TileEventType::Drop) {
        ++m_counters.dropsByReason[event.drop.reason];
    }

    TelemetryRecord record;
    record.kind = TelemetryRecord::Kind::Tile;
    record.tile = event;
    append(record);
}

void TileLifecycleTelemetry::recordPhaseTransition(const PhaseTransitionEvent& event)
{
    if (!m_enabled) {
        return;
    }

    ++m_counters.phaseTransitions;
    m_counters.phaseDurationMs[event.from] += event.durationMs;

    TelemetryRecord record;
    record.kind = TelemetryRecord::Kind::Phase;
    record.phase = event;
    append(record);
}

void TileLifecycleTelemetry::recordEviction(const EvictionEvent& event)
{
    if (!m_enabled) {
        return;
    }

    ++m_counters.eventsByType[TileEventType::CacheEvict];
    ++m_counters.evictionsByReason[event.reason];
    ++m_counters.evictionsByLevel[event.level];
    m_counters.bytesEvicted += event.bytesFreed;

    TelemetryRecord record;
    record.kind = TelemetryRecord::Kind::Eviction;
    record.eviction = event;
    append(record);
}

void TileLifecycleTelemetry::append(const TelemetryRecord& record)
{
    ++m_counters.totalRecorded;
    m_buffer.push_back(record);
    while (static_cast<int>(m_buffer.size()) > m_capacity) {
        m_buffer.pop_front();
    }
}
