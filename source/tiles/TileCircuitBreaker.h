#pragma once

// ============================================================================
// TileCircuitBreaker - Consecutive rejection counter with scale fallback
// ============================================================================
// Counts tile results that were rendered but could not be used. After
// `threshold` rejections in a row the breaker trips and the render path asks
// for tier / getFallbackScaleReduction() instead of retrying the same tier.
// One accepted result clears the streak.
//
// Not time based: there is no half-open state and no cool-down timer.
// ============================================================================

#include <QMap>
#include <QString>

/**
 * @brief Why a rendered tile result was not used.
 */
enum class TileRejectionReason {
    EpochExpired,
    ScaleMismatch,
    RenderFailed
};

struct CircuitBreakerConfig {
    int threshold = 10;             ///< Consecutive rejections that trip the breaker
    double reductionFactor = 2.0;   ///< Tier divisor while tripped
};

/**
 * @brief Read-only view of the trip state.
 */
struct CircuitBreakerState {
    bool isTripped = false;
    int consecutiveFailures = 0;
    int threshold = 0;
};

/**
 * @brief Read-only statistics.
 */
struct CircuitBreakerStats {
    QMap<TileRejectionReason, int> rejectionsByReason;
    int totalRejections = 0;
    int totalSuccesses = 0;
    int tripCount = 0;              ///< Times the breaker went from closed to tripped
    int consecutiveFailures = 0;
    bool isTripped = false;
};

class TileCircuitBreaker {
public:
    explicit TileCircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    void recordRejection(TileRejectionReason reason);
    void recordSuccess();

    bool isTripped() const { return m_consecutiveFailures >= m_config.threshold; }
    bool shouldUseFallback() const { return isTripped(); }

    /**
     * @brief reductionFactor while tripped, 1.0 otherwise.
     */
    double getFallbackScaleReduction() const;

    int getConsecutiveFailures() const { return m_consecutiveFailures; }
    CircuitBreakerState getState() const;
    CircuitBreakerStats getStats() const;
    const CircuitBreakerConfig& config() const { return m_config; }

    /**
     * @brief Apply a new configuration. Counters are kept.
     *
     * A threshold below 1 or a reduction factor below 1 is replaced by the default.
     */
    void setConfig(const CircuitBreakerConfig& config);

    /**
     * @brief Zero the streak and every statistic including the reason histogram.
     */
    void reset();

private:
    static CircuitBreakerConfig sanitized(const CircuitBreakerConfig& config);

    CircuitBreakerConfig m_config;
    int m_consecutiveFailures = 0;
    QMap<TileRejectionReason, int> m_rejectionsByReason;
    int m_totalRejections = 0;
    int m_totalSuccesses = 0;
    int m_tripCount = 0;
};

QString rejectionReasonName(TileRejectionReason reason);
