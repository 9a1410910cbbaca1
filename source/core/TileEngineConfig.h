#pragma once

// ============================================================================
// TileEngineConfig - Persisted tunables for the tile engine
// ============================================================================
// Stored with QSettings under the "TileEngine" group:
//
//   TileEngine/zoom/pixelRatio, minZoom, maxZoom, initialZoom,
//              gestureEndDelayMs, settlingDelayMs, phaseWatchdogMs,
//              fastGestureSpeed
//   TileEngine/cache/l1MaxEntries, l1MaxBytes, l2MaxEntries, l2MaxBytes, l3MaxPages
//   TileEngine/breaker/threshold, reductionFactor
//   TileEngine/tileSize, maxRetries, telemetryCapacity, telemetryEnabled
//
// Missing or out-of-range values fall back to the defaults below.
// ============================================================================

#include "ZoomEpochAuthority.h"
#include "../tiles/TileCache.h"
#include "../tiles/TileCircuitBreaker.h"

#include <QStringList>

class QSettings;

struct TileEngineConfig {
    static constexpr const char* ORGANIZATION = "Tessera";
    static constexpr const char* APPLICATION = "Engine";
    static constexpr int DEFAULT_TILE_SIZE = 256;

    ZoomAuthorityConfig zoom;
    TileCacheLimits cache;
    CircuitBreakerConfig breaker;
    int tileSize = DEFAULT_TILE_SIZE;
    int maxRetries = 2;
    int telemetryCapacity = 1000;
    bool telemetryEnabled = true;

    /**
     * @brief Read from @p settings. Invalid entries keep their defaults.
     * @param warnings Optional list receiving one message per rejected entry.
     */
    static TileEngineConfig load(QSettings& settings, QStringList* warnings = nullptr);

    /**
     * @brief Read from QSettings(ORGANIZATION, APPLICATION).
     */
    static TileEngineConfig loadDefault();

    void save(QSettings& settings) const;

    /**
     * @brief Messages for every value outside its valid range. Empty when valid.
     */
    QStringList validate() const;
};
