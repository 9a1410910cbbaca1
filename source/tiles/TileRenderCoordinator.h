#pragma once

// ============================================================================
// TileRenderCoordinator - Request, render and integrate tiles
// ============================================================================
// Ties the engine together:
//   request  -> tier from ZoomEpochAuthority (reduced while the breaker is
//               tripped) -> TileCache lookup -> coalesce or dispatch
//   dispatch -> TileRenderer on a QtConcurrent worker, tagged with the epoch
//               and a CameraSnapshot
//   finish   -> QFutureWatcher::finished on the main thread -> integrateResult()
//
// integrateResult() is the only place a rendered tile becomes current. A
// result is either accepted and cached, or rejected and counted, never both.
// Results are judged in completion order; there is no cancellation, a stale
// result is simply dropped when it arrives.
// ============================================================================

#include "TileTypes.h"
#include "TileRenderer.h"
#include "TileCache.h"
#include "../telemetry/TileEvents.h"
#include "../tiles/ScaleMath.h"

#include <QObject>
#include <QHash>
#include <QRectF>
#include <QSet>
#include <QVector>
#include <memory>

class ZoomEpochAuthority;
class TileCircuitBreaker;

template <typename T> class QFutureWatcher;

/**
 * @brief What requestTile() did.
 */
enum class TileRequestStatus {
    CacheHit,       ///< Data returned immediately
    Coalesced,      ///< Same identity already rendering
    Dispatched,     ///< New render started
    Invalid         ///< Bad page / tile size
};

/**
 * @brief Final judgement on a rendered result.
 */
enum class TileResultVerdict {
    Accepted,
    RejectedEpoch,
    RejectedScale,
    RejectedIntegrity,
    RenderFailed,
    Aborted         ///< Belonged to a previous document / generation
};

struct TileRequestResult {
    TileRequestStatus status = TileRequestStatus::Invalid;
    TileIdentity identity;      ///< Identity actually requested (after tier selection)
    CachedTileData data;        ///< CacheHit only
    FallbackTile fallback;      ///< Lower-tier stand-in while rendering, if cached
};

class TileRenderCoordinator : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_MAX_RETRIES = 2;
    static constexpr int MAX_TILES_PER_REGION = 1024;  ///< Per requestVisibleTiles() call

    TileRenderCoordinator(ZoomEpochAuthority* authority, TileCache* cache,
                          TileCircuitBreaker* breaker, std::shared_ptr<TileRenderer> renderer,
                          QObject* parent = nullptr);
    ~TileRenderCoordinator() override;

    /**
     * @brief Tier to request right now: the authority's tier, divided by the
     *        breaker's reduction and re-capped while tripped.
     */
    ScaleMath::ScaleTier requestTier() const;

    /**
     * @brief Look up or render one tile at the current request tier.
     */
    TileRequestResult requestTile(int page, int tileX, int tileY, int tileSize);

    /**
     * @brief Request every tile intersecting @p pageRect (page units at zoom 1).
     *
     * Tiles are dispatched in focal-point priority order.
     */
    QVector<TileRequestResult> requestVisibleTiles(int page, const QRectF& pageRect, int tileSize);

    /**
     * @brief Region re-requested when the authority finishes settling.
     */
    void setVisibleRegion(int page, const QRectF& pageRect, int tileSize);

    /**
     * @brief Judge a finished render and cache it if still current.
     */
    TileResultVerdict integrateResult(const TileRenderResult& result);

    /**
     * @brief Start a new generation; results from older generations are aborted on arrival.
     *
     * Call after TileCache::setDocument().
     */
    void abortAll();

    quint64 generation() const { return m_generation; }
    int inFlightCount() const { return m_inFlight.size(); }
    bool isInFlight(const TileIdentity& identity) const;

    void setMaxRetries(int retries) { m_maxRetries = qMax(0, retries); }
    int maxRetries() const { return m_maxRetries; }

    /**
     * @brief Block until every in-flight render has finished. Results are discarded.
     */
    void waitForAll();

signals:
    void tileEvent(const TileLifecycleEvent& event);

    /**
     * @brief A result was accepted and cached.
     * @param camera Camera captured when the tile was requested; place the tile with it.
     */
    void tileReady(const TileIdentity& identity, const CameraSnapshot& camera);

    void resultRejected(const TileIdentity& identity, TileResultVerdict verdict);

private slots:
    void onSettlingComplete(double scale, double zoom);

private:
    TileRenderRequest makeRequest(const TileIdentity& identity, double requestedTier, double cssStretch,
                                  int attempt) const;
    void dispatch(const TileRenderRequest& request);
    void onRenderFinished(QFutureWatcher<TileRenderResult>* watcher);
    bool retry(const TileRenderRequest& request);
    void finishRenderPhaseIfDone();
    TileLifecycleEvent eventFor(TileEventType type, const TileRenderRequest& request) const;

    ZoomEpochAuthority* m_authority = nullptr;
    TileCache* m_cache = nullptr;
    TileCircuitBreaker* m_breaker = nullptr;
    std::shared_ptr<TileRenderer> m_renderer;

    QSet<QString> m_inFlight;                               ///< Keys currently rendering
    QVector<QFutureWatcher<TileRenderResult>*> m_watchers;
    quint64 m_generation = 1;
    int m_maxRetries = DEFAULT_MAX_RETRIES;
    int m_acceptedSinceDispatch = 0;

    bool m_hasVisibleRegion = false;
    int m_visiblePage = 0;
    QRectF m_visibleRect;
    int m_visibleTileSize = 256;
};

QString tileResultVerdictName(TileResultVerdict verdict);

Q_DECLARE_METATYPE(TileResultVerdict)
