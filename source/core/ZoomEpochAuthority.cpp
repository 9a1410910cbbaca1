#include "ZoomEpochAuthority.h"

#include <QTimer>
#include <QDebug>
#include <QLineF>
#include <algorithm>
#include <cmath>

ZoomEpochAuthority::ZoomEpochAuthority(const ZoomAuthorityConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_phaseDurations(4, 0)
{
    qRegisterMetaType<PhaseTransitionEvent>("PhaseTransitionEvent");
    qRegisterMetaType<RenderMode>("RenderMode");

    m_zoom = constrainZoom(m_config.initialZoom);
    m_camera.zoom = m_zoom;
    m_renderMode = renderModeForZoom(m_zoom);

    m_gestureEndTimer = new QTimer(this);
    m_gestureEndTimer->setSingleShot(true);
    m_gestureEndTimer->setInterval(m_config.gestureEndDelayMs);
    connect(m_gestureEndTimer, &QTimer::timeout, this, &ZoomEpochAuthority::onGestureEndTimeout);

    m_settlingTimer = new QTimer(this);
    m_settlingTimer->setSingleShot(true);
    m_settlingTimer->setInterval(m_config.settlingDelayMs);
    connect(m_settlingTimer, &QTimer::timeout, this, &ZoomEpochAuthority::onSettlingTimeout);

    m_watchdogTimer = new QTimer(this);
    m_watchdogTimer->setSingleShot(true);
    m_watchdogTimer->setInterval(m_config.phaseWatchdogMs);
    connect(m_watchdogTimer, &QTimer::timeout, this, &ZoomEpochAuthority::onWatchdogTimeout);

    m_phaseClock.start();
}

ZoomEpochAuthority::~ZoomEpochAuthority() = default;

// ============================================================================
// Input
// ============================================================================

void ZoomEpochAuthority::onZoomGesture(double zoom, const QPointF& focalPoint,
                                       const CameraState& cameraState)
{
    if (std::isnan(zoom)) {
        qWarning() << "ZoomEpochAuthority: ignoring NaN zoom";
        return;
    }

    const double newZoom = constrainZoom(zoom);
    const bool zoomChanged = !qFuzzyCompare(newZoom, m_zoom);

    m_zoom = newZoom;
    m_focalPoint = focalPoint;
    m_camera = cameraState;
    m_camera.zoom = newZoom;

    switch (m_phase) {
        case GesturePhase::Idle:
        case GesturePhase::Rendering:
            transitionTo(GesturePhase::Active, QStringLiteral("gesture-start"));
            break;
        case GesturePhase::Settling:
            m_settlingTimer->stop();
            transitionTo(GesturePhase::Active, QStringLiteral("gesture-resume"));
            break;
        case GesturePhase::Active:
            if (zoomChanged) {
                bumpEpoch();
            }
            break;
    }

    updateRenderMode();
    m_gestureEndTimer->start();
    // Continuous input keeps the watchdog from firing mid-gesture
    m_watchdogTimer->start();
}

void ZoomEpochAuthority::onPanCommit(const CameraState& cameraState)
{
    m_camera = cameraState;
    m_camera.zoom = m_zoom;
    bumpEpoch();
}

void ZoomEpochAuthority::setGestureVelocity(const QPointF& velocity)
{
    m_velocity = velocity;
}

void ZoomEpochAuthority::endGesture()
{
    if (m_phase != GesturePhase::Active) {
        return;
    }
    m_gestureEndTimer->stop();
    m_velocity = QPointF();
    transitionTo(GesturePhase::Settling, QStringLiteral("gesture-end"));
    m_settlingTimer->start();
}

void ZoomEpochAuthority::notifyRenderDispatched()
{
    if (m_phase != GesturePhase::Settling) {
        return;
    }
    m_settlingTimer->stop();
    transitionTo(GesturePhase::Rendering, QStringLiteral("render-dispatched"));
}

void ZoomEpochAuthority::notifyRenderAccepted()
{
    if (m_phase != GesturePhase::Rendering) {
        return;
    }
    transitionTo(GesturePhase::Idle, QStringLiteral("render-accepted"));
}

int ZoomEpochAuthority::incrementEpoch()
{
    bumpEpoch();
    return m_epoch;
}

void ZoomEpochAuthority::forceIdle(const QString& trigger)
{
    m_gestureEndTimer->stop();
    m_settlingTimer->stop();
    m_watchdogTimer->stop();
    m_velocity = QPointF();
    transitionTo(GesturePhase::Idle, trigger);
}

void ZoomEpochAuthority::reset()
{
    m_gestureEndTimer->stop();
    m_settlingTimer->stop();
    m_watchdogTimer->stop();

    m_phase = GesturePhase::Idle;
    m_epoch = 0;
    m_zoom = constrainZoom(m_config.initialZoom);
    m_focalPoint = QPointF();
    m_velocity = QPointF();
    m_camera = CameraState();
    m_camera.zoom = m_zoom;
    m_renderMode = renderModeForZoom(m_zoom);
    m_nextSnapshotId = 1;
    m_phaseDurations.fill(0);
    m_transitionCount = 0;
    m_phaseClock.restart();
}

// ============================================================================
// Queries
// ============================================================================

ScaleMath::ScaleTier ZoomEpochAuthority::getStaticScaleTier() const
{
    return ScaleMath::targetScaleTier(m_zoom, m_config.pixelRatio, m_config.maxZoom);
}

ScaleMath::ScaleTier ZoomEpochAuthority::getScaleTier() const
{
    if (m_phase != GesturePhase::Active) {
        return getStaticScaleTier();
    }

    const double speed = std::hypot(m_velocity.x(), m_velocity.y());
    const double quality = ScaleMath::velocityQualityFactor(speed, m_config.fastGestureSpeed);
    if (quality >= 1.0) {
        return getStaticScaleTier();
    }

    ScaleMath::ScaleTier reduced = ScaleMath::targetScaleTier(
        m_zoom * quality, m_config.pixelRatio, m_config.maxZoom);
    const double exact = ScaleMath::exactTargetScale(m_zoom, m_config.pixelRatio, m_config.maxZoom);
    reduced.cssStretch = exact / reduced.tier;
    return reduced;
}

int ZoomEpochAuthority::getEpochTolerance(double zoom)
{
    int tolerance = MIN_EPOCH_TOLERANCE;
    if (std::isnan(zoom) || zoom <= 4.0) {
        tolerance = 5;
    } else if (zoom <= 16.0) {
        tolerance = 10;
    } else {
        tolerance = 15;
    }
    return std::clamp(tolerance, MIN_EPOCH_TOLERANCE, MAX_EPOCH_TOLERANCE);
}

bool ZoomEpochAuthority::isEpochAcceptable(int tileEpoch) const
{
    const qint64 distance = std::llabs(static_cast<qint64>(m_epoch) - tileEpoch);
    return distance <= getEpochTolerance(m_zoom);
}

ZoomSnapshot ZoomEpochAuthority::captureSnapshot()
{
    const ScaleMath::ScaleTier tier = getScaleTier();

    ZoomSnapshot snapshot;
    snapshot.zoom = m_zoom;
    snapshot.epoch = m_epoch;
    snapshot.scale = tier.tier;
    snapshot.cssStretch = tier.cssStretch;
    snapshot.renderMode = m_renderMode;
    snapshot.pixelRatio = m_config.pixelRatio;
    snapshot.snapshotId = m_nextSnapshotId++;
    return snapshot;
}

bool ZoomEpochAuthority::validateSnapshot(const ZoomSnapshot& snapshot) const
{
    return isEpochAcceptable(snapshot.epoch);
}

TilePriority ZoomEpochAuthority::getTilePriority(const QPointF& tileCenter, int tileSize) const
{
    if (tileSize <= 0) {
        return TilePriority::Low;
    }
    const double distance = QLineF(m_focalPoint, tileCenter).length() / tileSize;
    if (distance <= 1.0) {
        return TilePriority::Critical;
    }
    if (distance <= 2.0) {
        return TilePriority::High;
    }
    if (distance <= 4.0) {
        return TilePriority::Medium;
    }
    return TilePriority::Low;
}

double ZoomEpochAuthority::constrainZoom(double zoom) const
{
    if (std::isnan(zoom)) {
        return m_config.minZoom;
    }
    return std::clamp(zoom, m_config.minZoom, m_config.maxZoom);
}

void ZoomEpochAuthority::setPixelRatio(double pixelRatio)
{
    if (!std::isfinite(pixelRatio) || pixelRatio <= 0.0) {
        qWarning() << "ZoomEpochAuthority: invalid pixel ratio" << pixelRatio;
        return;
    }
    if (qFuzzyCompare(pixelRatio, m_config.pixelRatio)) {
        return;
    }
    m_config.pixelRatio = pixelRatio;
    bumpEpoch();
}

void ZoomEpochAuthority::setZoomLimits(double minZoom, double maxZoom)
{
    if (!(minZoom > 0.0) || !(maxZoom >= minZoom)) {
        qWarning() << "ZoomEpochAuthority: invalid zoom limits" << minZoom << maxZoom;
        return;
    }
    m_config.minZoom = minZoom;
    m_config.maxZoom = maxZoom;
    const double clamped = constrainZoom(m_zoom);
    if (!qFuzzyCompare(clamped, m_zoom)) {
        m_zoom = clamped;
        m_camera.zoom = clamped;
        bumpEpoch();
        updateRenderMode();
    }
}

qint64 ZoomEpochAuthority::phaseDurationMs(GesturePhase phase) const
{
    return m_phaseDurations.value(static_cast<int>(phase), 0);
}

// ============================================================================
// Timers
// ============================================================================

void ZoomEpochAuthority::onGestureEndTimeout()
{
    endGesture();
}

void ZoomEpochAuthority::onSettlingTimeout()
{
    if (m_phase != GesturePhase::Settling) {
        return;
    }

    emit settlingComplete(getScale(), m_zoom);

    // Receivers that dispatched work already moved us to rendering
    if (m_phase == GesturePhase::Settling) {
        transitionTo(GesturePhase::Idle, QStringLiteral("settle-complete"));
    }
}

void ZoomEpochAuthority::onWatchdogTimeout()
{
    if (m_phase == GesturePhase::Idle) {
        return;
    }
    qWarning() << "ZoomEpochAuthority: phase" << gesturePhaseName(m_phase)
               << "exceeded" << m_config.phaseWatchdogMs << "ms, forcing idle";
    forceIdle(QStringLiteral("watchdog"));
}

// ============================================================================
// Internals
// ============================================================================

void ZoomEpochAuthority::transitionTo(GesturePhase phase, const QString& trigger)
{
    if (phase == m_phase) {
        return;
    }

    const GesturePhase from = m_phase;
    const qint64 elapsed = m_phaseClock.restart();
    m_phaseDurations[static_cast<int>(from)] += elapsed;
    ++m_transitionCount;

    m_phase = phase;
    ++m_epoch;

    if (phase == GesturePhase::Idle) {
        m_watchdogTimer->stop();
    } else {
        m_watchdogTimer->start();
    }

    PhaseTransitionEvent event;
    event.from = from;
    event.to = phase;
    event.durationMs = elapsed;
    event.trigger = trigger;
    event.zoom = m_zoom;
    event.scale = getScale();
    event.epoch = m_epoch;

    emit epochChanged(m_epoch);
    emit phaseChanged(event);
}

void ZoomEpochAuthority::bumpEpoch()
{
    ++m_epoch;
    emit epochChanged(m_epoch);
}

RenderMode ZoomEpochAuthority::renderModeForZoom(double zoom)
{
    if (zoom > ADAPTIVE_TO_TILED_ZOOM) {
        return RenderMode::Tiled;
    }
    if (zoom > FULL_TO_ADAPTIVE_ZOOM) {
        return RenderMode::Adaptive;
    }
    return RenderMode::Full;
}

void ZoomEpochAuthority::updateRenderMode()
{
    const double keep = 1.0 - RENDER_MODE_HYSTERESIS;
    RenderMode mode = m_renderMode;

    switch (m_renderMode) {
        case RenderMode::Full:
            mode = renderModeForZoom(m_zoom);
            break;
        case RenderMode::Adaptive:
            if (m_zoom > ADAPTIVE_TO_TILED_ZOOM) {
                mode = RenderMode::Tiled;
            } else if (m_zoom < FULL_TO_ADAPTIVE_ZOOM * keep) {
                mode = RenderMode::Full;
            }
            break;
        case RenderMode::Tiled:
            if (m_zoom < ADAPTIVE_TO_TILED_ZOOM * keep) {
                mode = m_zoom < FULL_TO_ADAPTIVE_ZOOM * keep ? RenderMode::Full
                                                             : RenderMode::Adaptive;
            }
            break;
    }

    if (mode != m_renderMode) {
        qDebug() << "ZoomEpochAuthority: render mode" << renderModeName(m_renderMode)
                 << "->" << renderModeName(mode) << "at zoom" << m_zoom;
        m_renderMode = mode;
        emit renderModeChanged(mode);
    }
}

QString renderModeName(RenderMode mode)
{
    switch (mode) {
        case RenderMode::Full:     return QStringLiteral("full");
        case RenderMode::Adaptive: return QStringLiteral("adaptive");
        case RenderMode::Tiled:    return QStringLiteral("tiled");
    }
    return QString();
}

QString tilePriorityName(TilePriority priority)
{
    switch (priority) {
        case TilePriority::Critical: return QStringLiteral("critical");
        case TilePriority::High:     return QStringLiteral("high");
        case TilePriority::Medium:   return QStringLiteral("medium");
        case TilePriority::Low:      return QStringLiteral("low");
    }
    return QString();
}
