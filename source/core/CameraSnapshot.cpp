#include "CameraSnapshot.h"

#include <QDateTime>
#include <algorithm>
#include <cmath>

namespace {

double clampZoom(double zoom)
{
    if (std::isnan(zoom)) {
        return CameraSnapshot::MIN_ZOOM;
    }
    return std::clamp(zoom, CameraSnapshot::MIN_ZOOM, CameraSnapshot::MAX_ZOOM);
}

double clampPosition(double value)
{
    if (std::isnan(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

// Zoom used by the transforms; a zero or negative zoom would divide by zero.
double transformZoom(double zoom)
{
    if (!std::isfinite(zoom) || zoom <= 0.0) {
        return CameraSnapshot::MIN_ZOOM;
    }
    return zoom;
}

} // namespace

// ===== CameraSnapshot =====

CameraSnapshot::CameraSnapshot(double x, double y, double zoom, qint64 timestampMs)
    : m_x(x)
    , m_y(y)
    , m_zoom(zoom)
    , m_timestampMs(timestampMs)
{
}

CameraSnapshot CameraSnapshot::capture(const CameraState& state)
{
    return capture(state, QDateTime::currentMSecsSinceEpoch());
}

CameraSnapshot CameraSnapshot::capture(const CameraState& state, qint64 timestampMs)
{
    return CameraSnapshot(clampPosition(state.x), clampPosition(state.y),
                          clampZoom(state.zoom), timestampMs);
}

CameraState CameraSnapshot::toState() const
{
    CameraState state;
    state.x = m_x;
    state.y = m_y;
    state.zoom = m_zoom;
    return state;
}

CameraSnapshot createCameraSnapshot(const CameraState& state)
{
    return CameraSnapshot::capture(state);
}

// ===== Transforms =====

QPointF screenToCanvas(const QPointF& screenPoint, const CameraState& camera)
{
    const double zoom = transformZoom(camera.zoom);
    return QPointF(screenPoint.x() / zoom - camera.x,
                   screenPoint.y() / zoom - camera.y);
}

QPointF canvasToScreen(const QPointF& canvasPoint, const CameraState& camera)
{
    const double zoom = transformZoom(camera.zoom);
    return QPointF((canvasPoint.x() + camera.x) * zoom,
                   (canvasPoint.y() + camera.y) * zoom);
}

QPointF screenToCanvas(const QPointF& screenPoint, const CameraSnapshot& camera)
{
    return screenToCanvas(screenPoint, camera.toState());
}

QPointF canvasToScreen(const QPointF& canvasPoint, const CameraSnapshot& camera)
{
    return canvasToScreen(canvasPoint, camera.toState());
}

// ===== Camera movement =====

CameraState panCamera(const CameraState& camera, double dx, double dy)
{
    const double zoom = transformZoom(camera.zoom);
    CameraState result = camera;
    result.x = camera.x - dx / zoom;
    result.y = camera.y - dy / zoom;
    return result;
}

CameraState zoomCameraToPoint(const CameraState& camera, const QPointF& screenPoint,
                              double delta, double minZoom, double maxZoom)
{
    const double oldZoom = transformZoom(camera.zoom);
    const double newZoom = std::clamp(oldZoom * (1.0 - delta), minZoom, maxZoom);

    if (std::fabs(newZoom - oldZoom) < 1e-9) {
        return camera;
    }

    // Keep the canvas point under the cursor fixed
    const QPointF anchor = screenToCanvas(screenPoint, camera);

    CameraState result;
    result.zoom = newZoom;
    result.x = screenPoint.x() / newZoom - anchor.x();
    result.y = screenPoint.y() / newZoom - anchor.y();
    return result;
}
