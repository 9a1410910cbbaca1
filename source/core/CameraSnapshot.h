#pragma once

// ============================================================================
// CameraSnapshot - Frozen viewport camera and screen/canvas transforms
// ============================================================================
// The viewport controller owns a mutable CameraState. A tile request captures
// a CameraSnapshot so the tile is composited with the camera it was requested
// under, not the camera the user has scrolled to since.
//
// Transform (uniform zoom, translation in canvas units):
//   canvas = screen / zoom - camera
//   screen = (canvas + camera) * zoom
// ============================================================================

#include <QPointF>
#include <QMetaType>
#include <QtGlobal>

/**
 * @brief Live camera owned by the viewport controller.
 */
struct CameraState {
    double x = 0.0;     ///< Canvas translation X
    double y = 0.0;     ///< Canvas translation Y
    double zoom = 1.0;  ///< Uniform scale
};

/**
 * @brief Immutable copy of a CameraState with its capture time.
 *
 * The snapshot owns plain copies of the values, has no setters and keeps no
 * reference back to the source state, so nothing done to the live camera can
 * reach it. Assigning one snapshot to another replaces it as a whole.
 */
class CameraSnapshot {
public:
    static constexpr double MIN_ZOOM = 0.1;
    static constexpr double MAX_ZOOM = 64.0;

    /// Origin camera at zoom 1, timestamp 0.
    CameraSnapshot() = default;

    /**
     * @brief Capture a snapshot of @p state at the current time.
     *
     * Zoom is clamped to [MIN_ZOOM, MAX_ZOOM] and x/y to >= 0.
     * Non-finite values clamp to the nearest bound (NaN maps to the lower bound).
     */
    static CameraSnapshot capture(const CameraState& state);

    /**
     * @brief Capture with an explicit timestamp (milliseconds since epoch).
     */
    static CameraSnapshot capture(const CameraState& state, qint64 timestampMs);

    double x() const { return m_x; }
    double y() const { return m_y; }
    double zoom() const { return m_zoom; }
    qint64 timestampMs() const { return m_timestampMs; }

    /**
     * @brief Copy of the snapshot values as a CameraState.
     */
    CameraState toState() const;

private:
    CameraSnapshot(double x, double y, double zoom, qint64 timestampMs);

    double m_x = 0.0;
    double m_y = 0.0;
    double m_zoom = 1.0;
    qint64 m_timestampMs = 0;
};

/**
 * @brief Free-function spelling of CameraSnapshot::capture().
 */
CameraSnapshot createCameraSnapshot(const CameraState& state);

QPointF screenToCanvas(const QPointF& screenPoint, const CameraState& camera);
QPointF canvasToScreen(const QPointF& canvasPoint, const CameraState& camera);
QPointF screenToCanvas(const QPointF& screenPoint, const CameraSnapshot& camera);
QPointF canvasToScreen(const QPointF& canvasPoint, const CameraSnapshot& camera);

/**
 * @brief Translate the camera by a screen-space delta.
 */
CameraState panCamera(const CameraState& camera, double dx, double dy);

/**
 * @brief Zoom by (1 - delta) while keeping @p screenPoint over the same canvas point.
 *
 * The new zoom is clamped to [minZoom, maxZoom]. If the clamp leaves the zoom
 * unchanged, the camera is returned untouched.
 */
CameraState zoomCameraToPoint(const CameraState& camera, const QPointF& screenPoint,
                              double delta, double minZoom, double maxZoom);

Q_DECLARE_METATYPE(CameraState)
Q_DECLARE_METATYPE(CameraSnapshot)
