#include "TileCircuitBreaker.h"

#include <QDebug>
#include <cmath>

TileCircuitBreaker::TileCircuitBreaker(const CircuitBreakerConfig& config)
    : m_config(sanitized(config))
{
}

void TileCircuitBreaker::recordRejection(TileRejectionReason reason)
{
    const bool wasTripped = isTripped();

    ++m_consecutiveFailures;
    ++m_totalRejections;
    ++m_rejectionsByReason[reason];

    if (!wasTripped && isTripped()) {
        ++m_tripCount;
        qWarning() << "TileCircuitBreaker: tripped after" << m_consecutiveFailures
                   << "consecutive rejections (last:" << rejectionReasonName(reason)
                   << "), falling back to scale /" << m_config.reductionFactor;
    }
}

void TileCircuitBreaker::recordSuccess()
{
    if (isTripped()) {
        qDebug() << "TileCircuitBreaker: recovered after" << m_consecutiveFailures
                 << "consecutive rejections";
    }
    m_consecutiveFailures = 0;
    ++m_totalSuccesses;
}

double TileCircuitBreaker::getFallbackScaleReduction() const
{
    return isTripped() ? m_config.reductionFactor : 1.0;
}

CircuitBreakerState TileCircuitBreaker::getState() const
{
    CircuitBreakerState state;
    state.isTripped = isTripped();
    state.consecutiveFailures = m_consecutiveFailures;
    state.threshold = m_config.threshold;
    return state;
}

CircuitBreakerStats TileCircuitBreaker::getStats() const
{
    CircuitBreakerStats stats;
    stats.rejectionsByReason = m_rejectionsByReason;
    stats.totalRejections = m_totalRejections;
    stats.totalSuccesses = m_totalSuccesses;
    stats.tripCount = m_tripCount;
    stats.consecutiveFailures = m_consecutiveFailures;
    stats.isTripped = isTripped();
    return stats;
}

void TileCircuitBreaker::setConfig(const CircuitBreakerConfig& config)
{
    m_config = sanitized(config);
}

void TileCircuitBreaker::reset()
{
    m_consecutiveFailures = 0;
    m_rejectionsByReason.clear();
    m_totalRejections = 0;
    m_totalSuccesses = 0;
    m_tripCount = 0;
}

CircuitBreakerConfig TileCircuitBreaker::sanitized(const CircuitBreakerConfig& config)
{
    CircuitBreakerConfig result = config;
    const CircuitBreakerConfig defaults;
    if (result.threshold < 1) {
        qWarning() << "TileCircuitBreaker: invalid threshold" << result.threshold
                   << "- using" << defaults.threshold;
        result.threshold = defaults.threshold;
    }
    if (!std::isfinite(result.reductionFactor) || result.reductionFactor < 1.0) {
        qWarning() << "TileCircuitBreaker: invalid reduction factor" << result.reductionFactor
                   << "- using" << defaults.reductionFactor;
        result.reductionFactor = defaults.reductionFactor;
    }
    return result;
}

QString rejectionReasonName(TileRejectionReason reason)
{
    switch (reason) {
        case TileRejectionReason::EpochExpired:  return QStringLiteral("epoch-expired");
        case TileRejectionReason::ScaleMismatch: return QStringLiteral("scale-mismatch");
        case TileRejectionReason::RenderFailed:  return QStringLiteral("render-failed");
    }
    return QString();
}
