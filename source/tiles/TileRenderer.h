#pragma once

// ============================================================================
// TileRenderer - Abstract interface for tile rasterization
// ============================================================================
// The engine never rasterizes anything itself. A TileRenderer turns a request
// into pixels and is called from QtConcurrent worker threads, so
// implementations must be reentrant: no shared mutable state without a lock.
//
// Design: requests and results are plain value structs so results can travel
// back to the main thread through QFuture without any backend types.
// ============================================================================

#include "TileTypes.h"
#include "../core/CameraSnapshot.h"

#include <QString>
#include <QtGlobal>

/**
 * @brief Everything a renderer needs, plus the tags used to judge the result.
 */
struct TileRenderRequest {
    TileIdentity identity;
    QString tileKey;
    QString documentId;
    int epoch = 0;                  ///< Authority epoch at dispatch
    quint64 generation = 0;         ///< Coordinator generation at dispatch
    CameraSnapshot camera;          ///< Camera at request time, used for placement
    double cssStretch = 1.0;
    double requestedTier = 0.0;     ///< Request tier chosen at dispatch, breaker reduction included
    int attempt = 0;                ///< 0 for the first try
    qint64 dispatchedAtMs = 0;
};

/**
 * @brief Renderer output for one tile.
 */
struct TileRenderOutput {
    bool success = false;
    CachedTileData data;
    QString errorMessage;
};

/**
 * @brief Output paired with its request, as delivered back to the main timeline.
 */
struct TileRenderResult {
    TileRenderRequest request;
    TileRenderOutput output;
    qint64 renderMs = 0;
};

class TileRenderer {
public:
    virtual ~TileRenderer() = default;

    /**
     * @brief Rasterize one tile.
     *
     * Called on a worker thread. A failure is reported through
     * TileRenderOutput::success / errorMessage, never by throwing.
     */
    virtual TileRenderOutput renderTile(const TileRenderRequest& request) const = 0;

    /**
     * @brief Backend name for logs.
     */
    virtual QString name() const = 0;
};

Q_DECLARE_METATYPE(TileRenderResult)
