#pragma once

// ============================================================================
// TileLifecycleTelemetry - In-memory recorder for engine events
// ============================================================================
// Keeps the most recent events in a fixed-size ring and running counters for
// everything it has seen. The engine does not depend on it: components emit
// signals and work the same whether or not a recorder is connected.
// ============================================================================

#include "TileEvents.h"

#include <QObject>
#include <QMap>
#include <QVector>
#include <deque>

class TileCache;
class ZoomEpochAuthority;
class TileRenderCoordinator;

/**
 * @brief One entry in the ring buffer.
 */
struct TelemetryRecord {
    enum class Kind {
        Tile,
        Phase,
        Eviction
    };

    Kind kind = Kind::Tile;
    TileLifecycleEvent tile;        ///< Kind::Tile
    PhaseTransitionEvent phase;     ///< Kind::Phase
    EvictionEvent eviction;         ///< Kind::Eviction
};

/**
 * @brief Running totals since construction or the last clear().
 */
struct TelemetryCounters {
    QMap<TileEventType, int> eventsByType;
    QMap<EvictionReason, int> evictionsByReason;
    QMap<CacheLevel, int> evictionsByLevel;
    QMap<TileDropReason, int> dropsByReason;
    QMap<GesturePhase, qint64> phaseDurationMs;   ///< Keyed by the phase being left
    int phaseTransitions = 0;
    qint64 bytesEvicted = 0;
    int totalRecorded = 0;
};

class TileLifecycleTelemetry : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_CAPACITY = 1000;

    explicit TileLifecycleTelemetry(int capacity = DEFAULT_CAPACITY, QObject* parent = nullptr);

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    // Convenience wiring to the engine's signals
    void attach(TileCache* cache);
    void attach(ZoomEpochAuthority* authority);
    void attach(TileRenderCoordinator* coordinator);

    /**
     * @brief Buffered records, oldest first.
     */
    QVector<TelemetryRecord> records() const;

    /**
     * @brief Buffered tile events for one key, oldest first.
     */
    QVector<TileLifecycleEvent> eventsForTile(const QString& tileKey) const;

    TelemetryCounters counters() const { return m_counters; }
    int bufferedCount() const { return static_cast<int>(m_buffer.size()); }
    int capacity() const { return m_capacity; }

    void clear();

public slots:
    void recordTileEvent(const TileLifecycleEvent& event);
    void recordPhaseTransition(const PhaseTransitionEvent& event);
    void recordEviction(const EvictionEvent& event);

private:
    void append(const TelemetryRecord& record);

    int m_capacity = DEFAULT_CAPACITY;
    bool m_enabled = true;
    std::deque<TelemetryRecord> m_buffer;
    TelemetryCounters m_counters;
};
