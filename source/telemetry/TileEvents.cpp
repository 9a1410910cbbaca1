#include "TileEvents.h"

#include <QDateTime>

TileLifecycleEvent TileLifecycleEvent::forTile(TileEventType type, const TileIdentity& identity,
                                               const QString& tileKey)
{
    TileLifecycleEvent event;
    event.type = type;
    event.tileKey = tileKey;
    event.page = identity.page();
    event.hasCoordinates = true;
    event.tileX = identity.tileX();
    event.tileY = identity.tileY();
    event.scale = identity.scaleTier();
    event.tileSize = identity.tileSize();
    event.timestampMs = QDateTime::currentMSecsSinceEpoch();
    return event;
}

QString gesturePhaseName(GesturePhase phase)
{
    switch (phase) {
        case GesturePhase::Idle:      return QStringLiteral("idle");
        case GesturePhase::Active:    return QStringLiteral("active");
        case GesturePhase::Settling:  return QStringLiteral("settling");
        case GesturePhase::Rendering: return QStringLiteral("rendering");
    }
    return QString();
}

QString tileEventTypeName(TileEventType type)
{
    switch (type) {
        case TileEventType::Request:        return QStringLiteral("request");
        case TileEventType::RenderStart:    return QStringLiteral("render-start");
        case TileEventType::RenderComplete: return QStringLiteral("render-complete");
        case TileEventType::RenderError:    return QStringLiteral("render-error");
        case TileEventType::CacheStore:     return QStringLiteral("cache-store");
        case TileEventType::CacheHit:       return QStringLiteral("cache-hit");
        case TileEventType::CacheEvict:     return QStringLiteral("cache-evict");
        case TileEventType::FallbackUsed:   return QStringLiteral("fallback-used");
        case TileEventType::Drop:           return QStringLiteral("drop");
        case TileEventType::RetryQueue:     return QStringLiteral("retry-queue");
        case TileEventType::RetryAttempt:   return QStringLiteral("retry-attempt");
        case TileEventType::RetrySuccess:   return QStringLiteral("retry-success");
        case TileEventType::RetryExpired:   return QStringLiteral("retry-expired");
        case TileEventType::Abort:          return QStringLiteral("abort");
    }
    return QString();
}

QString dropReasonName(TileDropReason reason)
{
    switch (reason) {
        case TileDropReason::None:               return QStringLiteral("none");
        case TileDropReason::EpochExpired:       return QStringLiteral("epoch-expired");
        case TileDropReason::ScaleMismatch:      return QStringLiteral("scale-mismatch");
        case TileDropReason::IntegrityViolation: return QStringLiteral("integrity-violation");
        case TileDropReason::DocumentChanged:    return QStringLiteral("document-changed");
    }
    return QString();
}

QString fallbackReasonName(FallbackReason reason)
{
    switch (reason) {
        case FallbackReason::NotCached:     return QStringLiteral("not-cached");
        case FallbackReason::RenderPending: return QStringLiteral("render-pending");
        case FallbackReason::RenderFailed:  return QStringLiteral("render-failed");
    }
    return QString();
}
