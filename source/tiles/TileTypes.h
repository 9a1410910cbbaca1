#pragma once

// ============================================================================
// TileTypes - Tile identity, cached payloads and cache enums
// ============================================================================
// A TileIdentity is the five-field key shared by the request path and the
// lookup path. Its scale tier is quantized on construction, so two raw scales
// that fall in the same ladder bucket produce identical identities.
// ============================================================================

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

/**
 * @brief Five-field tile key: page, tile column/row, scale tier, tile size.
 *
 * Value type. There are no setters; build a new identity to change a field.
 */
class TileIdentity {
public:
    TileIdentity() = default;

    /**
     * @brief Create an identity. rawScale is passed through ScaleMath::scaleForCacheKey().
     */
    TileIdentity(int page, int tileX, int tileY, double rawScale, int tileSize);

    int page() const { return m_page; }
    int tileX() const { return m_tileX; }
    int tileY() const { return m_tileY; }
    double scaleTier() const { return m_scaleTier; }
    int tileSize() const { return m_tileSize; }

    /**
     * @brief Same tile position and size at a different scale tier.
     */
    TileIdentity withScale(double rawScale) const;

    /**
     * @brief False for negative pages or non-positive tile sizes.
     */
    bool isValid() const;

    bool operator==(const TileIdentity& other) const;
    bool operator!=(const TileIdentity& other) const { return !(*this == other); }

private:
    int m_page = 0;
    int m_tileX = 0;
    int m_tileY = 0;
    double m_scaleTier = 1.0;
    int m_tileSize = 256;
};

/**
 * @brief Storage format of a cached tile.
 */
enum class TileDataFormat {
    None,           ///< Empty / absent
    RawRgba,        ///< Uncompressed RGBA8888, 4 bytes per pixel
    EncodedImage    ///< Compressed image (PNG, WebP...) with explicit dimensions
};

/**
 * @brief Rendered tile payload.
 *
 * Invariant for admission into TileCache: width > 0, height > 0, and for
 * RawRgba bytes.size() == width * height * 4. Encoded blobs from the legacy
 * path carry no dimensions and are never admitted.
 */
struct CachedTileData {
    TileDataFormat format = TileDataFormat::None;
    int width = 0;
    int height = 0;
    QByteArray bytes;                   ///< Pixel buffer or encoded blob (implicitly shared)
    bool hasExplicitDimensions = true;  ///< false for legacy encoded blobs

    static CachedTileData rawRgba(int width, int height, const QByteArray& pixels);
    static CachedTileData encodedImage(int width, int height, const QByteArray& blob);
    static CachedTileData legacyEncoded(const QByteArray& blob);

    bool isNull() const { return format == TileDataFormat::None; }
    qint64 byteSize() const { return bytes.size(); }
};

/**
 * @brief Cache level a tile lives in.
 */
enum class CacheLevel {
    L1,     ///< Hot tiles for the current viewport
    L2,     ///< Larger secondary store, every admitted tile lands here
    L3      ///< Page metadata only
};

/**
 * @brief Why a tile left the cache.
 */
enum class EvictionReason {
    Lru,
    MemoryPressure,
    ZoomChange,
    ModeTransition,
    DocumentSwitch,
    Manual
};

/**
 * @brief Classification of a rejected cache insertion.
 */
enum class TileIntegrityViolation {
    None,
    ZeroWidth,
    ZeroHeight,
    BufferSizeMismatch,
    MissingDimensions
};

/**
 * @brief Returned by TileCache::set() when the payload fails the integrity gate.
 */
struct TileDataIntegrityError {
    TileIntegrityViolation reason = TileIntegrityViolation::None;
    QString message;
};

/**
 * @brief Outcome of TileCache::set().
 */
struct TileCacheInsertResult {
    bool success = false;
    TileDataIntegrityError error;   ///< Set when success is false
};

/**
 * @brief Per-page information kept in L3.
 */
struct PageMetadata {
    int page = -1;
    double width = 0.0;     ///< Page width in document units
    double height = 0.0;    ///< Page height in document units

    bool isValid() const { return page >= 0 && width > 0.0 && height > 0.0; }
};

QString cacheLevelName(CacheLevel level);
QString evictionReasonName(EvictionReason reason);
QString integrityViolationName(TileIntegrityViolation reason);

Q_DECLARE_METATYPE(TileIdentity)
Q_DECLARE_METATYPE(CacheLevel)
Q_DECLARE_METATYPE(EvictionReason)
