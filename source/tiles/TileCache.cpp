#include "TileCache.h"
#include "ScaleMath.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

TileCache::TileCache(const TileCacheLimits& limits, QObject* parent)
    : QObject(parent)
    , m_limits(sanitized(limits))
{
    qRegisterMetaType<EvictionEvent>("EvictionEvent");
    qRegisterMetaType<TileLifecycleEvent>("TileLifecycleEvent");
    qRegisterMetaType<TileIdentity>("TileIdentity");
    qRegisterMetaType<TileDataIntegrityError>("TileDataIntegrityError");
    qRegisterMetaType<EvictionReason>("EvictionReason");
}

TileCache::~TileCache() = default;

const QVector<int>& TileCache::missWarningThresholds()
{
    static const QVector<int> thresholds = { 50, 100, 250, 500, 1000 };
    return thresholds;
}

// ============================================================================
// Admission
// ============================================================================

TileIntegrityViolation TileCache::validateTileData(const CachedTileData& data, QString* message)
{
    auto fail = [message](TileIntegrityViolation reason, const QString& text) {
        if (message) {
            *message = text;
        }
        return reason;
    };

    if (!data.hasExplicitDimensions) {
        return fail(TileIntegrityViolation::MissingDimensions,
                    QStringLiteral("legacy encoded tile without explicit dimensions"));
    }
    if (data.width <= 0) {
        return fail(TileIntegrityViolation::ZeroWidth,
                    QStringLiteral("tile width is %1").arg(data.width));
    }
    if (data.height <= 0) {
        return fail(TileIntegrityViolation::ZeroHeight,
                    QStringLiteral("tile height is %1").arg(data.height));
    }

    switch (data.format) {
        case TileDataFormat::RawRgba: {
            const qint64 expected = qint64(data.width) * data.height * 4;
            if (data.byteSize() != expected) {
                return fail(TileIntegrityViolation::BufferSizeMismatch,
                            QStringLiteral("RGBA buffer is %1 bytes, expected %2 (%3x%4x4)")
                                .arg(data.byteSize()).arg(expected)
                                .arg(data.width).arg(data.height));
            }
            break;
        }
        case TileDataFormat::EncodedImage:
            if (data.bytes.isEmpty()) {
                return fail(TileIntegrityViolation::BufferSizeMismatch,
                            QStringLiteral("encoded tile has an empty blob"));
            }
            break;
        case TileDataFormat::None:
            return fail(TileIntegrityViolation::BufferSizeMismatch,
                        QStringLiteral("tile has no payload"));
    }

    if (message) {
        message->clear();
    }
    return TileIntegrityViolation::None;
}

TileCacheInsertResult TileCache::set(const TileIdentity& identity, const CachedTileData& data,
                                     bool promoteToL1)
{
    TileCacheInsertResult result;
    const QString key = getTileKey(identity);

    QString message;
    const TileIntegrityViolation violation = validateTileData(data, &message);
    if (violation != TileIntegrityViolation::None) {
        ++m_integrityViolations;
        ++m_violationsByReason[violation];

        result.error.reason = violation;
        result.error.message = message;

        qWarning() << "TileCache: integrity violation for" << key << "-"
                   << integrityViolationName(violation) << ":" << message
                   << "(total" << m_integrityViolations << ")";
        emit integrityViolation(identity, result.error);
        return result;
    }

    TileLruStore::Entry entry;
    entry.identity = identity;
    entry.data = data;

    m_l2.insert(key, entry);
    // Keep an existing L1 copy in sync even when not promoting
    if (promoteToL1 || m_l1.contains(key)) {
        m_l1.insert(key, entry);
    }
    ++m_stores;
    result.success = true;

    TileLifecycleEvent stored = TileLifecycleEvent::forTile(TileEventType::CacheStore, identity, key);
    stored.cache.level = promoteToL1 ? CacheLevel::L1 : CacheLevel::L2;
    stored.cache.bytes = data.byteSize();

    QVector<EvictionEvent> evicted;
    enforceLimits(evicted);

    emit tileEvent(stored);
    reportEvictions(evicted);
    return result;
}

// ============================================================================
// Lookup
// ============================================================================

QString TileCache::getTileKey(const TileIdentity& identity) const
{
    const double tier = ScaleMath::scaleForCacheKey(identity.scaleTier());
    const QString body = QStringLiteral("p%1-t%2x%3-s%4-ts%5")
        .arg(identity.page())
        .arg(identity.tileX())
        .arg(identity.tileY())
        .arg(QString::number(tier, 'g', 6))
        .arg(identity.tileSize());

    if (m_documentId.isEmpty()) {
        return body;
    }
    return m_documentId + QLatin1Char('-') + body;
}

bool TileCache::has(const TileIdentity& identity) const
{
    const QString key = getTileKey(identity);
    return m_l1.contains(key) || m_l2.contains(key);
}

CachedTileData TileCache::peekCachedData(const TileIdentity& identity) const
{
    const QString key = getTileKey(identity);
    if (const TileLruStore::Entry* entry = m_l1.peek(key)) {
        return entry->data;
    }
    if (const TileLruStore::Entry* entry = m_l2.peek(key)) {
        return entry->data;
    }
    return CachedTileData();
}

CachedTileData TileCache::getCachedData(const TileIdentity& identity)
{
    const QString key = getTileKey(identity);

    if (const TileLruStore::Entry* entry = m_l1.touch(key)) {
        ++m_l1Hits;
        m_consecutiveMisses = 0;
        const CachedTileData data = entry->data;
        // Keep the L2 copy warm too
        m_l2.touch(key);

        TileLifecycleEvent hit = TileLifecycleEvent::forTile(TileEventType::CacheHit, identity, key);
        hit.cache.level = CacheLevel::L1;
        hit.cache.bytes = data.byteSize();
        emit tileEvent(hit);
        return data;
    }

    if (const TileLruStore::Entry* entry = m_l2.touch(key)) {
        ++m_l2Hits;
        m_consecutiveMisses = 0;
        const TileLruStore::Entry promoted = *entry;
        m_l1.insert(key, promoted);

        TileLifecycleEvent hit = TileLifecycleEvent::forTile(TileEventType::CacheHit, identity, key);
        hit.cache.level = CacheLevel::L2;
        hit.cache.bytes = promoted.data.byteSize();

        QVector<EvictionEvent> evicted;
        enforceLimits(evicted);

        emit tileEvent(hit);
        reportEvictions(evicted);
        return promoted.data;
    }

    recordMiss(identity);
    return CachedTileData();
}

FallbackTile TileCache::findFallback(const TileIdentity& identity)
{
    FallbackTile fallback;
    const double requested = identity.scaleTier();
    const QVector<double>& ladder = ScaleMath::tierLadder();

    for (int i = ladder.size() - 1; i >= 0; --i) {
        const double tier = ladder[i];
        if (tier >= requested) {
            continue;
        }

        const double ratio = tier / requested;
        const int fx = static_cast<int>(std::floor(identity.tileX() * ratio));
        const int fy = static_cast<int>(std::floor(identity.tileY() * ratio));
        const TileIdentity candidate(identity.page(), fx, fy, tier, identity.tileSize());
        const QString key = getTileKey(candidate);

        const TileLruStore::Entry* entry = m_l1.touch(key);
        if (!entry) {
            entry = m_l2.touch(key);
        }
        if (!entry) {
            continue;
        }

        fallback.found = true;
        fallback.identity = candidate;
        fallback.data = entry->data;
        fallback.cssStretch = requested / tier;
        fallback.sourceOffset = QPointF(
            identity.tileX() * identity.tileSize() * ratio - fx * identity.tileSize(),
            identity.tileY() * identity.tileSize() * ratio - fy * identity.tileSize());
        return fallback;
    }
    return fallback;
}

QVector<double> TileCache::cachedTiers() const
{
    QVector<double> tiers;
    auto collect = [this, &tiers](const TileLruStore& level) {
        for (const QString& key : level.keys()) {
            const TileLruStore::Entry* entry = level.peek(key);
            if (entry && !tiers.contains(entry->identity.scaleTier())) {
                tiers.append(entry->identity.scaleTier());
            }
        }
    };
    collect(m_l1);
    collect(m_l2);
    std::sort(tiers.begin(), tiers.end());
    return tiers;
}

// ============================================================================
// L3 page metadata
// ============================================================================

void TileCache::setPageMetadata(const PageMetadata& metadata)
{
    if (!metadata.isValid()) {
        qWarning() << "TileCache: ignoring invalid page metadata for page" << metadata.page;
        return;
    }
    if (!m_l3.contains(metadata.page) && m_l3.size() >= m_limits.l3MaxPages) {
        // Metadata is cheap to recompute; drop an arbitrary page
        m_l3.erase(m_l3.begin());
    }
    m_l3.insert(metadata.page, metadata);
}

PageMetadata TileCache::getPageMetadata(int page) const
{
    return m_l3.value(page);
}

// ============================================================================
// Eviction
// ============================================================================

int TileCache::evictOtherTiers(const QVector<double>& keepTiers, EvictionReason reason)
{
    QVector<EvictionEvent> evicted;

    for (CacheLevel level : { CacheLevel::L1, CacheLevel::L2 }) {
        TileLruStore& levelStore = store(level);
        for (const QString& key : levelStore.keys()) {
            const TileLruStore::Entry* entry = levelStore.peek(key);
            if (!entry || keepTiers.contains(entry->identity.scaleTier())) {
                continue;
            }
            TileLruStore::Entry removed;
            if (levelStore.take(key, &removed)) {
                evicted.append(makeEviction(key, removed, level, reason));
            }
        }
    }

    reportEvictions(evicted);
    return evicted.size();
}

int TileCache::clearLevel(CacheLevel level, EvictionReason reason)
{
    if (level == CacheLevel::L3) {
        const int removed = m_l3.size();
        m_l3.clear();
        return removed;
    }

    QVector<EvictionEvent> evicted;
    collectAll(level, reason, evicted);
    store(level).clear();
    reportEvictions(evicted);
    return evicted.size();
}

int TileCache::handleMemoryPressure(qint64 targetBytes)
{
    QVector<EvictionEvent> evicted;
    const qint64 target = std::max<qint64>(0, targetBytes);

    for (CacheLevel level : { CacheLevel::L1, CacheLevel::L2 }) {
        TileLruStore& levelStore = store(level);
        while (m_l1.bytes() + m_l2.bytes() > target && !levelStore.isEmpty()) {
            QString key;
            TileLruStore::Entry removed;
            if (!levelStore.takeLeastRecent(&key, &removed)) {
                break;
            }
            evicted.append(makeEviction(key, removed, level, EvictionReason::MemoryPressure));
        }
    }

    if (!evicted.isEmpty()) {
        qDebug() << "TileCache: memory pressure evicted" << evicted.size() << "tiles";
    }
    reportEvictions(evicted);
    return evicted.size();
}

void TileCache::setDocument(const QString& documentId)
{
    if (documentId == m_documentId) {
        return;
    }
    clear(EvictionReason::DocumentSwitch);
    m_documentId = documentId;
}

void TileCache::clear(EvictionReason reason)
{
    // Capture everything first, then empty all levels in one step, then report
    QVector<EvictionEvent> evicted;
    collectAll(CacheLevel::L1, reason, evicted);
    collectAll(CacheLevel::L2, reason, evicted);

    m_l1.clear();
    m_l2.clear();
    m_l3.clear();
    m_consecutiveMisses = 0;

    qDebug() << "TileCache: CLEARED" << evicted.size() << "entries ("
             << evictionReasonName(reason) << ")";

    reportEvictions(evicted);
    emit cleared(reason, evicted.size());
}

// ============================================================================
// Configuration / statistics
// ============================================================================

void TileCache::updateLimits(const TileCacheLimits& limits)
{
    m_limits = sanitized(limits);

    QVector<EvictionEvent> evicted;
    enforceLimits(evicted);
    reportEvictions(evicted);

    while (m_l3.size() > m_limits.l3MaxPages) {
        m_l3.erase(m_l3.begin());
    }
}

TileCacheStats TileCache::getStats() const
{
    TileCacheStats stats;
    stats.l1Count = m_l1.count();
    stats.l2Count = m_l2.count();
    stats.l3Count = m_l3.size();
    stats.l1Bytes = m_l1.bytes();
    stats.l2Bytes = m_l2.bytes();
    stats.l1Hits = m_l1Hits;
    stats.l2Hits = m_l2Hits;
    stats.misses = m_misses;
    stats.consecutiveMisses = m_consecutiveMisses;
    stats.stores = m_stores;
    stats.integrityViolations = m_integrityViolations;
    stats.violationsByReason = m_violationsByReason;
    stats.evictions = m_evictions;
    stats.evictionsByReason = m_evictionsByReason;
    return stats;
}

// ============================================================================
// Internals
// ============================================================================

TileLruStore& TileCache::store(CacheLevel level)
{
    return level == CacheLevel::L1 ? m_l1 : m_l2;
}

void TileCache::enforceLimits(QVector<EvictionEvent>& evicted)
{
    evictFrom(CacheLevel::L1, m_limits.l1MaxEntries, m_limits.l1MaxBytes, evicted);
    evictFrom(CacheLevel::L2, m_limits.l2MaxEntries, m_limits.l2MaxBytes, evicted);
}

void TileCache::evictFrom(CacheLevel level, int maxEntries, qint64 maxBytes,
                          QVector<EvictionEvent>& evicted)
{
    TileLruStore& levelStore = store(level);

    while (levelStore.bytes() > maxBytes && levelStore.count() > 1) {
        QString key;
        TileLruStore::Entry removed;
        if (!levelStore.takeLeastRecent(&key, &removed)) {
            break;
        }
        evicted.append(makeEviction(key, removed, level, EvictionReason::MemoryPressure));
    }

    while (levelStore.count() > maxEntries) {
        QString key;
        TileLruStore::Entry removed;
        if (!levelStore.takeLeastRecent(&key, &removed)) {
            break;
        }
        evicted.append(makeEviction(key, removed, level, EvictionReason::Lru));
    }
}

void TileCache::collectAll(CacheLevel level, EvictionReason reason, QVector<EvictionEvent>& out)
{
    TileLruStore& levelStore = store(level);
    for (const QString& key : levelStore.keys()) {
        if (const TileLruStore::Entry* entry = levelStore.peek(key)) {
            out.append(makeEviction(key, *entry, level, reason));
        }
    }
}

EvictionEvent TileCache::makeEviction(const QString& key, const TileLruStore::Entry& entry,
                                      CacheLevel level, EvictionReason reason) const
{
    EvictionEvent event;
    event.tileKey = key;
    event.level = level;
    event.reason = reason;
    event.scale = entry.identity.scaleTier();
    event.bytesFreed = entry.data.byteSize();
    return event;
}

void TileCache::reportEvictions(const QVector<EvictionEvent>& evicted)
{
    for (const EvictionEvent& event : evicted) {
        ++m_evictions;
        ++m_evictionsByReason[event.reason];
        emit tileEvicted(event);
    }
}

void TileCache::recordMiss(const TileIdentity& identity)
{
    ++m_misses;
    ++m_consecutiveMisses;

    if (missWarningThresholds().contains(m_consecutiveMisses)) {
        qWarning() << "TileCache:" << m_consecutiveMisses << "consecutive misses, last"
                   << getTileKey(identity) << "- cached tiers:" << cachedTiers();
    }
}

TileCacheLimits TileCache::sanitized(const TileCacheLimits& limits)
{
    const TileCacheLimits defaults;
    TileCacheLimits result = limits;
    if (result.l1MaxEntries <= 0) result.l1MaxEntries = defaults.l1MaxEntries;
    if (result.l1MaxBytes <= 0) result.l1MaxBytes = defaults.l1MaxBytes;
    if (result.l2MaxEntries <= 0) result.l2MaxEntries = defaults.l2MaxEntries;
    if (result.l2MaxBytes <= 0) result.l2MaxBytes = defaults.l2MaxBytes;
    if (result.l3MaxPages <= 0) result.l3MaxPages = defaults.l3MaxPages;
    return result;
}
