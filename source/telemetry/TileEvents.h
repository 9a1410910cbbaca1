#pragma once

// ============================================================================
// TileEvents - Structured events emitted by the tile engine
// ============================================================================
// Tile lifecycle, gesture phase transitions and cache evictions are reported
// through these value types. Payloads are a closed set: each event type reads
// exactly one of the detail structs below. SCHEMA_VERSION bumps whenever a
// field is added or its meaning changes.
//
// Emitters never wait for a consumer. With nothing connected the events are
// simply discarded.
// ============================================================================

#include "../tiles/TileTypes.h"

#include <QMetaType>
#include <QString>
#include <QtGlobal>

/**
 * @brief Viewport interaction phase owned by ZoomEpochAuthority.
 */
enum class GesturePhase {
    Idle,       ///< No gesture, no pending render
    Active,     ///< Gesture input is arriving
    Settling,   ///< Input stopped, waiting for the settle delay
    Rendering   ///< Render dispatched, waiting for an accepted result
};

/**
 * @brief Tile lifecycle event kinds.
 */
enum class TileEventType {
    Request,
    RenderStart,
    RenderComplete,
    RenderError,
    CacheStore,
    CacheHit,
    CacheEvict,
    FallbackUsed,
    Drop,
    RetryQueue,
    RetryAttempt,
    RetrySuccess,
    RetryExpired,
    Abort
};

/**
 * @brief Why a rendered tile result was dropped instead of cached.
 */
enum class TileDropReason {
    None,
    EpochExpired,       ///< Result epoch outside the zoom-dependent tolerance
    ScaleMismatch,      ///< Result tier differs from the tier currently wanted
    IntegrityViolation, ///< Payload failed the cache admission gate
    DocumentChanged     ///< Result belongs to a document that is no longer loaded
};

/**
 * @brief Why a lower tier was shown instead of the requested one.
 */
enum class FallbackReason {
    NotCached,
    RenderPending,
    RenderFailed
};

// ----- Per-type payloads -----

/// RenderStart, RenderComplete, RenderError
struct TileRenderDetails {
    qint64 durationMs = 0;
    int requestEpoch = 0;
    QString errorMessage;       ///< RenderError only
};

/// CacheStore, CacheHit, CacheEvict
struct TileCacheDetails {
    CacheLevel level = CacheLevel::L2;
    qint64 bytes = 0;
    EvictionReason evictionReason = EvictionReason::Lru; ///< CacheEvict only
};

/// FallbackUsed
struct TileFallbackDetails {
    QString fallbackKey;
    double requestedScale = 0.0;
    double fallbackScale = 0.0;
    double cssStretch = 1.0;
    FallbackReason reason = FallbackReason::NotCached;
};

/// Drop, Abort
struct TileDropDetails {
    TileDropReason reason = TileDropReason::None;
    int tileEpoch = 0;
    int currentEpoch = 0;
    int tolerance = 0;
    double expectedScale = 0.0;
    TileIntegrityViolation violation = TileIntegrityViolation::None;
};

/// RetryQueue, RetryAttempt, RetrySuccess, RetryExpired
struct TileRetryDetails {
    int attempt = 0;
    int maxAttempts = 0;
};

/**
 * @brief One tile lifecycle event.
 *
 * Only the detail struct matching @c type is meaningful; the rest stay default.
 */
struct TileLifecycleEvent {
    static constexpr int SCHEMA_VERSION = 1;

    TileEventType type = TileEventType::Request;
    QString tileKey;
    int page = -1;
    bool hasCoordinates = false;
    int tileX = 0;
    int tileY = 0;
    double scale = 0.0;
    int tileSize = 0;
    qint64 timestampMs = 0;     ///< Milliseconds since epoch

    TileRenderDetails render;
    TileCacheDetails cache;
    TileFallbackDetails fallback;
    TileDropDetails drop;
    TileRetryDetails retry;

    /**
     * @brief Event stamped with the current time and the identity's fields.
     */
    static TileLifecycleEvent forTile(TileEventType type, const TileIdentity& identity,
                                      const QString& tileKey);
};

/**
 * @brief Gesture phase transition with the time spent in the previous phase.
 */
struct PhaseTransitionEvent {
    GesturePhase from = GesturePhase::Idle;
    GesturePhase to = GesturePhase::Idle;
    qint64 durationMs = 0;      ///< Time spent in @c from
    QString trigger;            ///< e.g. "gesture-start", "gesture-end", "watchdog"
    double zoom = 1.0;
    double scale = 1.0;
    int epoch = 0;              ///< Epoch after the transition
};

/**
 * @brief A tile left the cache.
 */
struct EvictionEvent {
    QString tileKey;
    CacheLevel level = CacheLevel::L2;
    EvictionReason reason = EvictionReason::Lru;
    double scale = 0.0;
    qint64 bytesFreed = 0;
};

QString gesturePhaseName(GesturePhase phase);
QString tileEventTypeName(TileEventType type);
QString dropReasonName(TileDropReason reason);
QString fallbackReasonName(FallbackReason reason);

Q_DECLARE_METATYPE(TileLifecycleEvent)
Q_DECLARE_METATYPE(PhaseTransitionEvent)
Q_DECLARE_METATYPE(EvictionEvent)
