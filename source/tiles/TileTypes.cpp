#include "TileTypes.h"
#include "ScaleMath.h"


TileIdentity::TileIdentity(int page, int tileX, int tileY, double rawScale, int tileSize)
    : m_page(page)
    , m_tileX(tileX)
    , m_tileY(tileY)
    , m_scaleTier(ScaleMath::scaleForCacheKey(rawScale))
    , m_tileSize(tileSize)
{
}

TileIdentity TileIdentity::withScale(double rawScale) const
{
    return TileIdentity(m_page, m_tileX, m_tileY, rawScale, m_tileSize);
}

bool TileIdentity::isValid() const
{
    return m_page >= 0 && m_tileSize > 0 && m_scaleTier > 0.0;
}

bool TileIdentity::operator==(const TileIdentity& other) const
{
    // Tiers come from the same ladder, so exact comparison is safe
    return m_page == other.m_page
        && m_tileX == other.m_tileX
        && m_tileY == other.m_tileY
        && m_scaleTier == other.m_scaleTier
        && m_tileSize == other.m_tileSize;
}

// ===== CachedTileData =====

CachedTileData CachedTileData::rawRgba(int width, int height, const QByteArray& pixels)
{
    CachedTileData data;
    data.format = TileDataFormat::RawRgba;
    data.width = width;
    data.height = height;
    data.bytes = pixels;
    return data;
}

CachedTileData CachedTileData::encodedImage(int width, int height, const QByteArray& blob)
{
    CachedTileData data;
    data.format = TileDataFormat::EncodedImage;
    data.width = width;
    data.height = height;
    data.bytes = blob;
    return data;
}

CachedTileData CachedTileData::legacyEncoded(const QByteArray& blob)
{
    CachedTileData data;
    data.format = TileDataFormat::EncodedImage;
    data.bytes = blob;
    data.hasExplicitDimensions = false;
    return data;
}

// ===== Names for logging =====

QString cacheLevelName(CacheLevel level)
{
    switch (level) {
        case CacheLevel::L1: return QStringLiteral("L1");
        case CacheLevel::L2: return QStringLiteral("L2");
        case CacheLevel::L3: return QStringLiteral("L3");
    }
    return QString();
}

QString evictionReasonName(EvictionReason reason)
{
    switch (reason) {
        case EvictionReason::Lru:            return QStringLiteral("lru");
        case EvictionReason::MemoryPressure: return QStringLiteral("memory-pressure");
        case EvictionReason::ZoomChange:     return QStringLiteral("zoom-change");
        case EvictionReason::ModeTransition: return QStringLiteral("mode-transition");
        case EvictionReason::DocumentSwitch: return QStringLiteral("document-switch");
        case EvictionReason::Manual:         return QStringLiteral("manual");
    }
    return QString();
}

QString integrityViolationName(TileIntegrityViolation reason)
{
    switch (reason) {
        case TileIntegrityViolation::None:               return QStringLiteral("none");
        case TileIntegrityViolation::ZeroWidth:          return QStringLiteral("zero-width");
        case TileIntegrityViolation::ZeroHeight:         return QStringLiteral("zero-height");
        case TileIntegrityViolation::BufferSizeMismatch: return QStringLiteral("buffer-size-mismatch");
        case TileIntegrityViolation::MissingDimensions:  return QStringLiteral("missing-dimensions");
    }
    return QString();
}
