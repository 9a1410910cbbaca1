#include "TileRenderCoordinator.h"
#include "TileCircuitBreaker.h"
#include "../core/ZoomEpochAuthority.h"

#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QFutureWatcher>
#include <QtConcurrent>
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

// Tile index range [first, last] covering [low, high) in page units, clamped
// before the cast so huge rects cannot overflow int. Empty when last < first.
struct TileSpan {
    int first = 0;
    int last = -1;
};

TileSpan tileSpanFor(double low, double high, double tileSpan)
{
    const double maxIndex = std::numeric_limits<int>::max() - 1;
    const double first = std::floor(low / tileSpan);
    const double last = std::ceil(high / tileSpan) - 1.0;
    TileSpan span;
    if (!(last >= 0.0) || !(first <= maxIndex) || last < first) {
        return span;
    }
    span.first = static_cast<int>(qBound(0.0, first, maxIndex));
    span.last = static_cast<int>(qBound(0.0, last, maxIndex));
    return span;
}

} // namespace

TileRenderCoordinator::TileRenderCoordinator(ZoomEpochAuthority* authority, TileCache* cache,
                                             TileCircuitBreaker* breaker,
                                             std::shared_ptr<TileRenderer> renderer,
                                             QObject* parent)
    : QObject(parent)
    , m_authority(authority)
    , m_cache(cache)
    , m_breaker(breaker)
    , m_renderer(std::move(renderer))
{
    qRegisterMetaType<TileRenderResult>("TileRenderResult");
    qRegisterMetaType<CameraSnapshot>("CameraSnapshot");
    qRegisterMetaType<TileResultVerdict>("TileResultVerdict");

    connect(m_authority, &ZoomEpochAuthority::settlingComplete,
            this, &TileRenderCoordinator::onSettlingComplete);
}

TileRenderCoordinator::~TileRenderCoordinator()
{
    waitForAll();
}

// ============================================================================
// Requests
// ============================================================================

ScaleMath::ScaleTier TileRenderCoordinator::requestTier() const
{
    ScaleMath::ScaleTier tier = m_authority->getScaleTier();
    const double reduction = m_breaker->getFallbackScaleReduction();
    if (reduction <= 1.0) {
        return tier;
    }

    const ZoomAuthorityConfig& config = m_authority->config();
    double reduced = ScaleMath::applyScaleCaps(tier.tier / reduction, config.pixelRatio, config.maxZoom);
    if (reduced >= tier.tier) {
        reduced = ScaleMath::nextLowerTier(tier.tier);
    }

    const double exact = ScaleMath::exactTargetScale(m_authority->getZoom(), config.pixelRatio,
                                                     config.maxZoom);
    tier.tier = reduced;
    tier.cssStretch = exact / reduced;
    return tier;
}

TileRequestResult TileRenderCoordinator::requestTile(int page, int tileX, int tileY, int tileSize)
{
    TileRequestResult result;
    const ScaleMath::ScaleTier tier = requestTier();
    result.identity = TileIdentity(page, tileX, tileY, tier.tier, tileSize);

    if (!result.identity.isValid()) {
        qWarning() << "TileRenderCoordinator: invalid tile request page" << page
                   << "size" << tileSize;
        return result;
    }

    const QString key = m_cache->getTileKey(result.identity);
    TileLifecycleEvent requested = TileLifecycleEvent::forTile(TileEventType::Request,
                                                               result.identity, key);
    requested.render.requestEpoch = m_authority->getEpoch();
    emit tileEvent(requested);

    if (m_cache->has(result.identity)) {
        result.status = TileRequestStatus::CacheHit;
        result.data = m_cache->getCachedData(result.identity);
        return result;
    }

    if (m_inFlight.contains(key)) {
        result.status = TileRequestStatus::Coalesced;
    } else {
        dispatch(makeRequest(result.identity, tier.tier, tier.cssStretch, 0));
        result.status = TileRequestStatus::Dispatched;
    }

    result.fallback = m_cache->findFallback(result.identity);
    if (result.fallback.found) {
        TileLifecycleEvent used = TileLifecycleEvent::forTile(TileEventType::FallbackUsed,
                                                              result.identity, key);
        used.fallback.fallbackKey = m_cache->getTileKey(result.fallback.identity);
        used.fallback.requestedScale = result.identity.scaleTier();
        used.fallback.fallbackScale = result.fallback.identity.scaleTier();
        used.fallback.cssStretch = result.fallback.cssStretch;
        used.fallback.reason = FallbackReason::RenderPending;
        emit tileEvent(used);
    }
    return result;
}

QVector<TileRequestResult> TileRenderCoordinator::requestVisibleTiles(int page, const QRectF& pageRect,
                                                                      int tileSize)
{
    QVector<TileRequestResult> results;
    if (tileSize <= 0 || pageRect.isEmpty()) {
        return results;
    }

    const double tier = requestTier().tier;
    const double tileSpan = tileSize / tier;   // page units covered by one tile

    // Never walk past the page when its size is known
    QRectF region = pageRect;
    const PageMetadata metadata = m_cache->getPageMetadata(page);
    if (metadata.isValid()) {
        region = region.intersected(QRectF(0.0, 0.0, metadata.width, metadata.height));
        if (region.isEmpty()) {
            return results;
        }
    }

    const TileSpan columns = tileSpanFor(region.left(), region.right(), tileSpan);
    const TileSpan rows = tileSpanFor(region.top(), region.bottom(), tileSpan);
    if (columns.last < columns.first || rows.last < rows.first) {
        return results;
    }

    struct Candidate {
        int x;
        int y;
        TilePriority priority;
    };
    QVector<Candidate> candidates;

    const CameraState camera = m_authority->getCameraState();
    bool truncated = false;
    for (int y = rows.first; y <= rows.last && !truncated; ++y) {
        for (int x = columns.first; x <= columns.last; ++x) {
            if (candidates.size() >= MAX_TILES_PER_REGION) {
                truncated = true;
                break;
            }
            const QPointF center((x + 0.5) * tileSpan, (y + 0.5) * tileSpan);
            const QPointF screenCenter = canvasToScreen(center, camera);
            candidates.append({ x, y, m_authority->getTilePriority(screenCenter, tileSize) });
        }
    }

    if (truncated) {
        qWarning() << "TileRenderCoordinator: visible region truncated to"
                   << MAX_TILES_PER_REGION << "tiles";
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return static_cast<int>(a.priority) < static_cast<int>(b.priority);
                     });

    results.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        results.append(requestTile(page, candidate.x, candidate.y, tileSize));
    }
    return results;
}

void TileRenderCoordinator::setVisibleRegion(int page, const QRectF& pageRect, int tileSize)
{
    m_hasVisibleRegion = true;
    m_visiblePage = page;
    m_visibleRect = pageRect;
    m_visibleTileSize = tileSize;
}

bool TileRenderCoordinator::isInFlight(const TileIdentity& identity) const
{
    return m_inFlight.contains(m_cache->getTileKey(identity));
}

// ============================================================================
// Integration
// ============================================================================

TileResultVerdict TileRenderCoordinator::integrateResult(const TileRenderResult& result)
{
    const TileRenderRequest& request = result.request;
    const TileIdentity& identity = request.identity;

    if (request.generation != m_generation) {
        TileLifecycleEvent aborted = eventFor(TileEventType::Abort, request);
        aborted.drop.reason = TileDropReason::DocumentChanged;
        aborted.drop.tileEpoch = request.epoch;
        aborted.drop.currentEpoch = m_authority->getEpoch();
        emit tileEvent(aborted);
        emit resultRejected(identity, TileResultVerdict::Aborted);
        return TileResultVerdict::Aborted;
    }

    if (!result.output.success) {
        TileLifecycleEvent failed = eventFor(TileEventType::RenderError, request);
        failed.render.durationMs = result.renderMs;
        failed.render.errorMessage = result.output.errorMessage;
        emit tileEvent(failed);

        qWarning() << "TileRenderCoordinator: render failed for" << request.tileKey
                   << "-" << result.output.errorMessage;
        m_breaker->recordRejection(TileRejectionReason::RenderFailed);
        if (!retry(request)) {
            emit resultRejected(identity, TileResultVerdict::RenderFailed);
        }
        return TileResultVerdict::RenderFailed;
    }

    const int currentEpoch = m_authority->getEpoch();
    if (!m_authority->isEpochAcceptable(request.epoch)) {
        TileLifecycleEvent dropped = eventFor(TileEventType::Drop, request);
        dropped.drop.reason = TileDropReason::EpochExpired;
        dropped.drop.tileEpoch = request.epoch;
        dropped.drop.currentEpoch = currentEpoch;
        dropped.drop.tolerance = ZoomEpochAuthority::getEpochTolerance(m_authority->getZoom());
        emit tileEvent(dropped);

        m_breaker->recordRejection(TileRejectionReason::EpochExpired);
        emit resultRejected(identity, TileResultVerdict::RejectedEpoch);
        return TileResultVerdict::RejectedEpoch;
    }

    // Accept the ideal tier, or the tier recorded at dispatch while it is not above the ideal
    const double tier = identity.scaleTier();
    const double ideal = m_authority->getStaticScaleTier().tier;
    const bool matchesIdeal = qFuzzyCompare(tier, ideal);
    const bool matchesDispatch = request.requestedTier > 0.0
                                 && qFuzzyCompare(tier, request.requestedTier)
                                 && tier <= ideal;
    if (!matchesIdeal && !matchesDispatch) {
        TileLifecycleEvent dropped = eventFor(TileEventType::Drop, request);
        dropped.drop.reason = TileDropReason::ScaleMismatch;
        dropped.drop.tileEpoch = request.epoch;
        dropped.drop.currentEpoch = currentEpoch;
        dropped.drop.expectedScale = ideal;
        emit tileEvent(dropped);

        m_breaker->recordRejection(TileRejectionReason::ScaleMismatch);
        emit resultRejected(identity, TileResultVerdict::RejectedScale);
        return TileResultVerdict::RejectedScale;
    }

    const TileCacheInsertResult inserted = m_cache->set(identity, result.output.data, true);
    if (!inserted.success) {
        TileLifecycleEvent dropped = eventFor(TileEventType::Drop, request);
        dropped.drop.reason = TileDropReason::IntegrityViolation;
        dropped.drop.violation = inserted.error.reason;
        dropped.drop.tileEpoch = request.epoch;
        dropped.drop.currentEpoch = currentEpoch;
        emit tileEvent(dropped);

        emit resultRejected(identity, TileResultVerdict::RejectedIntegrity);
        return TileResultVerdict::RejectedIntegrity;
    }

    m_breaker->recordSuccess();
    ++m_acceptedSinceDispatch;

    TileLifecycleEvent completed = eventFor(TileEventType::RenderComplete, request);
    completed.render.durationMs = result.renderMs;
    emit tileEvent(completed);

    if (request.attempt > 0) {
        TileLifecycleEvent recovered = eventFor(TileEventType::RetrySuccess, request);
        recovered.retry.attempt = request.attempt;
        recovered.retry.maxAttempts = m_maxRetries;
        emit tileEvent(recovered);
    }

    emit tileReady(identity, request.camera);
    return TileResultVerdict::Accepted;
}

void TileRenderCoordinator::abortAll()
{
    ++m_generation;
    m_inFlight.clear();
    m_acceptedSinceDispatch = 0;
    qDebug() << "TileRenderCoordinator: generation" << m_generation << "-"
             << m_watchers.size() << "renders still running will be aborted";
}

void TileRenderCoordinator::waitForAll()
{
    for (QFutureWatcher<TileRenderResult>* watcher : m_watchers) {
        disconnect(watcher, nullptr, this, nullptr);
        watcher->waitForFinished();
        delete watcher;
    }
    m_watchers.clear();
    m_inFlight.clear();
}

// ============================================================================
// Internals
// ============================================================================

void TileRenderCoordinator::onSettlingComplete(double scale, double zoom)
{
    if (!m_hasVisibleRegion) {
        return;
    }

    m_acceptedSinceDispatch = 0;
    const QVector<TileRequestResult> results =
        requestVisibleTiles(m_visiblePage, m_visibleRect, m_visibleTileSize);

    int dispatched = 0;
    for (const TileRequestResult& result : results) {
        if (result.status == TileRequestStatus::Dispatched) {
            ++dispatched;
        }
    }

    if (dispatched > 0) {
        qDebug() << "TileRenderCoordinator: settled at zoom" << zoom << "scale" << scale
                 << "- dispatched" << dispatched << "of" << results.size() << "tiles";
        m_authority->notifyRenderDispatched();
    }
}

TileRenderRequest TileRenderCoordinator::makeRequest(const TileIdentity& identity, double requestedTier,
                                                     double cssStretch, int attempt) const
{
    TileRenderRequest request;
    request.identity = identity;
    request.tileKey = m_cache->getTileKey(identity);
    request.documentId = m_cache->documentId();
    request.epoch = m_authority->getEpoch();
    request.generation = m_generation;
    request.camera = CameraSnapshot::capture(m_authority->getCameraState());
    request.cssStretch = cssStretch;
    request.requestedTier = requestedTier;
    request.attempt = attempt;
    request.dispatchedAtMs = QDateTime::currentMSecsSinceEpoch();
    return request;
}

void TileRenderCoordinator::dispatch(const TileRenderRequest& request)
{
    m_inFlight.insert(request.tileKey);
    emit tileEvent(eventFor(TileEventType::RenderStart, request));

    QFutureWatcher<TileRenderResult>* watcher = new QFutureWatcher<TileRenderResult>(this);
    m_watchers.append(watcher);

    connect(watcher, &QFutureWatcher<TileRenderResult>::finished, this, [this, watcher]() {
        onRenderFinished(watcher);
    });

    // Worker thread: only the renderer runs here, engine state stays on this thread
    std::shared_ptr<TileRenderer> renderer = m_renderer;
    QFuture<TileRenderResult> future = QtConcurrent::run([renderer, request]() -> TileRenderResult {
        TileRenderResult result;
        result.request = request;
        QElapsedTimer timer;
        timer.start();
        result.output = renderer->renderTile(request);
        result.renderMs = timer.elapsed();
        return result;
    });
    watcher->setFuture(future);
}

void TileRenderCoordinator::onRenderFinished(QFutureWatcher<TileRenderResult>* watcher)
{
    m_watchers.removeOne(watcher);
    const TileRenderResult result = watcher->result();
    watcher->deleteLater();

    if (result.request.generation == m_generation) {
        m_inFlight.remove(result.request.tileKey);
    }

    integrateResult(result);
    finishRenderPhaseIfDone();
}

bool TileRenderCoordinator::retry(const TileRenderRequest& request)
{
    if (request.attempt >= m_maxRetries || !m_authority->isEpochAcceptable(request.epoch)) {
        TileLifecycleEvent expired = eventFor(TileEventType::RetryExpired, request);
        expired.retry.attempt = request.attempt;
        expired.retry.maxAttempts = m_maxRetries;
        emit tileEvent(expired);
        return false;
    }

    TileLifecycleEvent queued = eventFor(TileEventType::RetryQueue, request);
    queued.retry.attempt = request.attempt + 1;
    queued.retry.maxAttempts = m_maxRetries;
    emit tileEvent(queued);

    const TileRenderRequest next = makeRequest(request.identity, request.requestedTier,
                                               request.cssStretch, request.attempt + 1);
    TileLifecycleEvent attempt = eventFor(TileEventType::RetryAttempt, next);
    attempt.retry.attempt = next.attempt;
    attempt.retry.maxAttempts = m_maxRetries;
    emit tileEvent(attempt);

    dispatch(next);
    return true;
}

void TileRenderCoordinator::finishRenderPhaseIfDone()
{
    if (!m_inFlight.isEmpty() || m_authority->getGesturePhase() != GesturePhase::Rendering) {
        return;
    }

    if (m_acceptedSinceDispatch > 0) {
        m_authority->notifyRenderAccepted();
    } else {
        qDebug() << "TileRenderCoordinator: no result accepted for this render pass";
        m_authority->forceIdle(QStringLiteral("render-abandoned"));
    }
    m_acceptedSinceDispatch = 0;
}

TileLifecycleEvent TileRenderCoordinator::eventFor(TileEventType type,
                                                   const TileRenderRequest& request) const
{
    TileLifecycleEvent event = TileLifecycleEvent::forTile(type, request.identity, request.tileKey);
    event.render.requestEpoch = request.epoch;
    return event;
}

QString tileResultVerdictName(TileResultVerdict verdict)
{
    switch (verdict) {
        case TileResultVerdict::Accepted:          return QStringLiteral("accepted");
        case TileResultVerdict::RejectedEpoch:     return QStringLiteral("rejected-epoch");
        case TileResultVerdict::RejectedScale:     return QStringLiteral("rejected-scale");
        case TileResultVerdict::RejectedIntegrity: return QStringLiteral("rejected-integrity");
        case TileResultVerdict::RenderFailed:      return QStringLiteral("render-failed");
        case TileResultVerdict::Aborted:           return QStringLiteral("aborted");
    }
    return QString();
}
