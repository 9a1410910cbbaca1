#pragma once

// ============================================================================
// TileCache - Multi-level tile store with an integrity gate
// ============================================================================
// L1: hot tiles for the current viewport (small, promoted on L2 hits)
// L2: every admitted tile lands here (larger, byte limited)
// L3: per-page metadata, no pixels
//
// Every insertion goes through validateTileData(). A rejected payload never
// touches any level. Every removal is reported through tileEvicted() with its
// reason; clear() and setDocument() empty all levels before reporting, so no
// observer can see a half-cleared cache.
//
// All calls are expected on the thread that owns the cache.
// ============================================================================

#include "TileTypes.h"
#include "TileLruStore.h"
#include "../telemetry/TileEvents.h"

#include <QObject>
#include <QHash>
#include <QMap>
#include <QPointF>
#include <QVector>

/**
 * @brief Size limits per level. Zero or negative values fall back to defaults.
 */
struct TileCacheLimits {
    int l1MaxEntries = 200;
    qint64 l1MaxBytes = 128LL * 1024 * 1024;
    int l2MaxEntries = 360;
    qint64 l2MaxBytes = 360LL * 1024 * 1024;
    int l3MaxPages = 2000;
};

/**
 * @brief Snapshot of cache counters.
 */
struct TileCacheStats {
    int l1Count = 0;
    int l2Count = 0;
    int l3Count = 0;
    qint64 l1Bytes = 0;
    qint64 l2Bytes = 0;
    int l1Hits = 0;
    int l2Hits = 0;
    int misses = 0;
    int consecutiveMisses = 0;
    int stores = 0;
    int integrityViolations = 0;
    QMap<TileIntegrityViolation, int> violationsByReason;
    int evictions = 0;
    QMap<EvictionReason, int> evictionsByReason;

    double hitRate() const
    {
        const int lookups = l1Hits + l2Hits + misses;
        return lookups > 0 ? double(l1Hits + l2Hits) / lookups : 0.0;
    }
};

/**
 * @brief A lower-tier tile that can stand in for a missing one.
 */
struct FallbackTile {
    bool found = false;
    TileIdentity identity;      ///< Identity of the cached stand-in
    CachedTileData data;
    double cssStretch = 1.0;    ///< requested tier / fallback tier
    QPointF sourceOffset;       ///< Top-left of the requested region inside the stand-in, in its pixels
};

class TileCache : public QObject {
    Q_OBJECT

public:
    /// Consecutive-miss counts at which a warning is logged.
    static const QVector<int>& missWarningThresholds();

    explicit TileCache(const TileCacheLimits& limits = TileCacheLimits(), QObject* parent = nullptr);
    ~TileCache() override;

    // ===== Admission =====

    /**
     * @brief Validate and store a tile.
     *
     * Always stores in L2, and in L1 as well when @p promoteToL1 is set.
     * On an integrity failure the cache is unchanged, the violation counter
     * is incremented and the classified error is returned.
     */
    TileCacheInsertResult set(const TileIdentity& identity, const CachedTileData& data,
                              bool promoteToL1 = false);

    /**
     * @brief Check a payload against the admission invariant.
     * @param message Optional human-readable description of the failure.
     */
    static TileIntegrityViolation validateTileData(const CachedTileData& data,
                                                   QString* message = nullptr);

    // ===== Lookup =====

    bool has(const TileIdentity& identity) const;

    /**
     * @brief Cached payload, or a null CachedTileData on a miss.
     *
     * L2 hits are promoted to L1. Updates hit/miss statistics.
     */
    CachedTileData getCachedData(const TileIdentity& identity);

    /**
     * @brief Lookup without promotion or statistics.
     */
    CachedTileData peekCachedData(const TileIdentity& identity) const;

    /**
     * @brief Deterministic key: [doc-]p<page>-t<x>x<y>-s<tier>-ts<size>.
     */
    QString getTileKey(const TileIdentity& identity) const;

    /**
     * @brief Best cached lower tier covering the same region as @p identity.
     *
     * Searches downward from the tier just below the requested one.
     */
    FallbackTile findFallback(const TileIdentity& identity);

    /**
     * @brief Distinct tiers currently held in L1 or L2, ascending.
     */
    QVector<double> cachedTiers() const;

    // ===== L3 =====

    void setPageMetadata(const PageMetadata& metadata);
    PageMetadata getPageMetadata(int page) const;

    // ===== Eviction =====

    /**
     * @brief Drop every L1/L2 tile whose tier is not in @p keepTiers.
     * @return Number of entries removed.
     */
    int evictOtherTiers(const QVector<double>& keepTiers,
                        EvictionReason reason = EvictionReason::ZoomChange);

    /**
     * @brief Empty one level.
     * @return Number of entries removed.
     */
    int clearLevel(CacheLevel level, EvictionReason reason);

    /**
     * @brief Evict least-recent tiles, L1 first, until L1+L2 bytes <= targetBytes.
     * @return Number of entries removed.
     */
    int handleMemoryPressure(qint64 targetBytes);

    /**
     * @brief Switch to another document. Clears all levels if the id changes.
     */
    void setDocument(const QString& documentId);
    QString documentId() const { return m_documentId; }

    /**
     * @brief Empty every level.
     */
    void clear(EvictionReason reason = EvictionReason::Manual);

    // ===== Configuration / statistics =====

    void updateLimits(const TileCacheLimits& limits);
    const TileCacheLimits& limits() const { return m_limits; }

    TileCacheStats getStats() const;
    int getIntegrityViolationCount() const { return m_integrityViolations; }

signals:
    void tileEvicted(const EvictionEvent& event);
    void tileEvent(const TileLifecycleEvent& event);
    void integrityViolation(const TileIdentity& identity, const TileDataIntegrityError& error);

    /**
     * @brief Emitted after an all-level clear, once the cache is empty.
     */
    void cleared(EvictionReason reason, int tilesRemoved);

private:
    TileLruStore& store(CacheLevel level);
    void enforceLimits(QVector<EvictionEvent>& evicted);
    void evictFrom(CacheLevel level, int maxEntries, qint64 maxBytes,
                   QVector<EvictionEvent>& evicted);
    void collectAll(CacheLevel level, EvictionReason reason, QVector<EvictionEvent>& out);
    EvictionEvent makeEviction(const QString& key, const TileLruStore::Entry& entry,
                               CacheLevel level, EvictionReason reason) const;
    void reportEvictions(const QVector<EvictionEvent>& evicted);
    void recordMiss(const TileIdentity& identity);
    static TileCacheLimits sanitized(const TileCacheLimits& limits);

    TileCacheLimits m_limits;
    QString m_documentId;

    TileLruStore m_l1;
    TileLruStore m_l2;
    QHash<int, PageMetadata> m_l3;

    int m_l1Hits = 0;
    int m_l2Hits = 0;
    int m_misses = 0;
    int m_consecutiveMisses = 0;
    int m_stores = 0;
    int m_integrityViolations = 0;
    QMap<TileIntegrityViolation, int> m_violationsByReason;
    int m_evictions = 0;
    QMap<EvictionReason, int> m_evictionsByReason;
};

Q_DECLARE_METATYPE(TileDataIntegrityError)
