#pragma once

// ============================================================================
// ZoomEpochAuthority - Owner of zoom, gesture phase, epoch and focal point
// ============================================================================
// Single source of truth for "is this tile result still current?".
//
// Phase flow:
//   idle ──gesture-start──▶ active ──gesture-end──▶ settling
//     ▲                       ▲                        │
//     │                       └──gesture-resume────────┤
//     │                                                ▼ settle timer
//     └──render-accepted── rendering ◀──render-dispatched
//
// If nothing was dispatched when the settle timer fires (every tile already
// cached) settling goes straight back to idle. A watchdog forces idle when a
// non-idle phase goes phaseWatchdogMs without gesture input.
//
// Every phase transition increments the epoch. A zoom change inside an active
// gesture, and every pan commit, increments it too.
// ============================================================================

#include "CameraSnapshot.h"
#include "../telemetry/TileEvents.h"
#include "../tiles/ScaleMath.h"

#include <QObject>
#include <QPointF>
#include <QElapsedTimer>
#include <QVector>

class QTimer;

/**
 * @brief Tunables for ZoomEpochAuthority.
 */
struct ZoomAuthorityConfig {
    double pixelRatio = 1.0;
    double minZoom = 0.25;
    double maxZoom = 32.0;
    double initialZoom = 1.0;
    int gestureEndDelayMs = 300;    ///< Silence before active -> settling
    int settlingDelayMs = 200;      ///< settling -> render dispatch
    int phaseWatchdogMs = 3000;     ///< Longest a non-idle phase may go without input
    double fastGestureSpeed = 2.0;  ///< px/ms above which in-gesture quality drops
};

/**
 * @brief Rendering strategy for the current zoom.
 */
enum class RenderMode {
    Full,       ///< Whole-page bitmaps
    Adaptive,   ///< Whole page at low zoom, tiles for the visible region
    Tiled       ///< Tiles only
};

/**
 * @brief Dispatch priority of a tile relative to the gesture focal point.
 */
enum class TilePriority {
    Critical,   ///< Within one tile of the focal point
    High,       ///< Within two tiles
    Medium,     ///< Within four tiles
    Low
};

/**
 * @brief Consistent capture of the values a render request is tagged with.
 */
struct ZoomSnapshot {
    double zoom = 1.0;
    int epoch = 0;
    double scale = 1.0;         ///< Tier from getScaleTier()
    double cssStretch = 1.0;
    RenderMode renderMode = RenderMode::Full;
    double pixelRatio = 1.0;
    quint64 snapshotId = 0;
};

class ZoomEpochAuthority : public QObject {
    Q_OBJECT

public:
    // Render-mode thresholds; leaving a mode requires dropping below
    // threshold * (1 - RENDER_MODE_HYSTERESIS).
    static constexpr double FULL_TO_ADAPTIVE_ZOOM = 1.5;
    static constexpr double ADAPTIVE_TO_TILED_ZOOM = 4.0;
    static constexpr double RENDER_MODE_HYSTERESIS = 0.1;

    static constexpr int MIN_EPOCH_TOLERANCE = 5;
    static constexpr int MAX_EPOCH_TOLERANCE = 15;

    explicit ZoomEpochAuthority(const ZoomAuthorityConfig& config = ZoomAuthorityConfig(),
                                QObject* parent = nullptr);
    ~ZoomEpochAuthority() override;

    // ===== Input =====

    /**
     * @brief Feed a zoom gesture sample.
     *
     * Clamps zoom, stores the focal point and camera, enters (or resumes)
     * the active phase and restarts the gesture-end timer. NaN zoom is ignored.
     */
    void onZoomGesture(double zoom, const QPointF& focalPoint, const CameraState& cameraState);

    /**
     * @brief Record a committed pan. Increments the epoch, phase is unchanged.
     */
    void onPanCommit(const CameraState& cameraState);

    /**
     * @brief Current gesture velocity in px/ms. Only used while active.
     */
    void setGestureVelocity(const QPointF& velocity);

    /**
     * @brief End the active gesture now instead of waiting for the timer.
     */
    void endGesture();

    /**
     * @brief Settling -> rendering. Ignored in other phases.
     */
    void notifyRenderDispatched();

    /**
     * @brief Rendering -> idle. Ignored in other phases.
     */
    void notifyRenderAccepted();

    /**
     * @brief Bump the epoch without a phase change.
     * @return The new epoch.
     */
    int incrementEpoch();

    /**
     * @brief Stop all timers and go to idle.
     */
    void forceIdle(const QString& trigger = QStringLiteral("force-idle"));

    /**
     * @brief Back to the constructed state: idle, epoch 0, initial zoom, statistics cleared.
     */
    void reset();

    // ===== Queries =====

    int getEpoch() const { return m_epoch; }
    GesturePhase getGesturePhase() const { return m_phase; }
    QPointF getFocalPoint() const { return m_focalPoint; }
    double getZoom() const { return m_zoom; }
    CameraState getCameraState() const { return m_camera; }
    RenderMode getRenderMode() const { return m_renderMode; }
    const ZoomAuthorityConfig& config() const { return m_config; }

    /**
     * @brief Committed scale tier.
     *
     * While active with a fast gesture the tier is computed from a reduced
     * zoom. In every other phase it equals the static ScaleMath tier.
     */
    ScaleMath::ScaleTier getScaleTier() const;

    /// Tier component of getScaleTier().
    double getScale() const { return getScaleTier().tier; }

    /// ScaleMath tier for the current zoom with no velocity reduction.
    ScaleMath::ScaleTier getStaticScaleTier() const;

    /**
     * @brief Epoch tolerance for a zoom level.
     *
     * 5 up to zoom 4, 10 up to zoom 16, 15 above. Always within
     * [MIN_EPOCH_TOLERANCE, MAX_EPOCH_TOLERANCE]; NaN maps to the minimum.
     */
    static int getEpochTolerance(double zoom);

    /// |currentEpoch - tileEpoch| <= getEpochTolerance(current zoom)
    bool isEpochAcceptable(int tileEpoch) const;

    /**
     * @brief Capture zoom, epoch and scale as one consistent value.
     */
    ZoomSnapshot captureSnapshot();

    /**
     * @brief Whether a snapshot's epoch is still within tolerance.
     */
    bool validateSnapshot(const ZoomSnapshot& snapshot) const;

    TilePriority getTilePriority(const QPointF& tileCenter, int tileSize) const;

    /// Clamp to [minZoom, maxZoom].
    double constrainZoom(double zoom) const;

    void setPixelRatio(double pixelRatio);
    void setZoomLimits(double minZoom, double maxZoom);

    // ===== Statistics =====

    /// Cumulative milliseconds spent in @p phase (completed intervals only).
    qint64 phaseDurationMs(GesturePhase phase) const;
    int transitionCount() const { return m_transitionCount; }

signals:
    void phaseChanged(const PhaseTransitionEvent& event);
    void epochChanged(int epoch);

    /**
     * @brief Settle delay elapsed; the receiver should dispatch renders
     *        and call notifyRenderDispatched().
     */
    void settlingComplete(double scale, double zoom);

    void renderModeChanged(RenderMode mode);

private slots:
    void onGestureEndTimeout();
    void onSettlingTimeout();
    void onWatchdogTimeout();

private:
    void transitionTo(GesturePhase phase, const QString& trigger);
    void bumpEpoch();
    void updateRenderMode();
    static RenderMode renderModeForZoom(double zoom);

    ZoomAuthorityConfig m_config;

    GesturePhase m_phase = GesturePhase::Idle;
    int m_epoch = 0;
    double m_zoom = 1.0;
    QPointF m_focalPoint;
    QPointF m_velocity;
    CameraState m_camera;
    RenderMode m_renderMode = RenderMode::Full;
    quint64 m_nextSnapshotId = 1;

    QTimer* m_gestureEndTimer = nullptr;
    QTimer* m_settlingTimer = nullptr;
    QTimer* m_watchdogTimer = nullptr;

    QElapsedTimer m_phaseClock;
    QVector<qint64> m_phaseDurations;   ///< Indexed by GesturePhase
    int m_transitionCount = 0;
};

QString renderModeName(RenderMode mode);
QString tilePriorityName(TilePriority priority);

Q_DECLARE_METATYPE(RenderMode)
