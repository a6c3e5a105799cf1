#include "core/ranking/fallback_controller.h"
#include "core/shared/logging.h"

#include <chrono>

namespace dr {

int64_t TimeoutBreaker::nowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

bool TimeoutBreaker::isOpen(int threshold, int recoveryMs) const
{
    if (consecutiveTimeouts.load() < threshold) {
        return false;
    }
    if (nowMs() - lastTimeoutMs.load() < recoveryMs) {
        return true;
    }
    // Half-open: closed only for the query that takes the trial
    return trialInFlight.load();
}

bool TimeoutBreaker::isHalfOpen(int threshold, int recoveryMs) const
{
    return consecutiveTimeouts.load() >= threshold
           && nowMs() - lastTimeoutMs.load() >= recoveryMs;
}

bool TimeoutBreaker::tryClaimTrial()
{
    bool expected = false;
    return trialInFlight.compare_exchange_strong(expected, true);
}

void TimeoutBreaker::releaseTrial()
{
    trialInFlight.store(false);
}

void TimeoutBreaker::recordSuccess()
{
    consecutiveTimeouts.store(0);
    trialInFlight.store(false);
}

void TimeoutBreaker::recordTimeout()
{
    consecutiveTimeouts.fetch_add(1);
    lastTimeoutMs.store(nowMs());
    trialInFlight.store(false);
}

FallbackController::FallbackController(const RetrievalConfig& config)
    : m_config(config)
{
}

RankingMode FallbackController::modeFor(RankingStrategy strategy)
{
    switch (strategy) {
    case RankingStrategy::VectorOnly:    return RankingMode::VectorOnly;
    case RankingStrategy::DimensionOnly: return RankingMode::DimensionOnly;
    case RankingStrategy::Hybrid:        return RankingMode::Hybrid;
    case RankingStrategy::Adaptive:      return RankingMode::Hybrid;
    }
    return RankingMode::Hybrid;
}

bool FallbackController::adaptiveBreakerActive() const
{
    return m_config.defaultStrategy == RankingStrategy::Adaptive && m_config.enableFallback;
}

bool FallbackController::isDowngraded() const
{
    return adaptiveBreakerActive()
           && m_breaker.isOpen(m_config.adaptiveTimeoutThreshold, m_config.adaptiveRecoveryMs);
}

void FallbackController::releaseTrial()
{
    m_breaker.releaseTrial();
}

RankingDecision FallbackController::decide()
{
    RankingDecision decision;

    if (!m_config.enableDimensionRanking) {
        decision.mode = RankingMode::VectorOnly;
        decision.degraded = true;
        decision.reason = QStringLiteral("dimension_ranking_disabled");
        return decision;
    }

    if (m_config.defaultStrategy != RankingStrategy::Adaptive) {
        decision.mode = modeFor(m_config.defaultStrategy);
        if (decision.mode == RankingMode::VectorOnly) {
            decision.degraded = true;
            decision.reason = QStringLiteral("vector_only_strategy");
        }
        return decision;
    }

    if (adaptiveBreakerActive()
        && m_breaker.isHalfOpen(m_config.adaptiveTimeoutThreshold, m_config.adaptiveRecoveryMs)
        && m_breaker.tryClaimTrial()) {
        LOG_INFO(drRanking, "Adaptive ranking: recovery window passed, trying the full path");
        decision.mode = RankingMode::Hybrid;
        decision.trial = true;
        return decision;
    }

    if (isDowngraded()) {
        decision.mode = modeFor(m_config.fallbackStrategy);
        decision.degraded = true;
        decision.reason = QStringLiteral("adaptive_downgrade");
        LOG_DEBUG(drRanking, "decide: adaptive downgrade to %s after %d consecutive timeouts",
                  qUtf8Printable(rankingModeToString(decision.mode)),
                  m_breaker.consecutiveTimeouts.load());
        return decision;
    }

    decision.mode = RankingMode::Hybrid;
    return decision;
}

void FallbackController::recordOutcome(bool timedOut)
{
    if (!timedOut) {
        m_breaker.recordSuccess();
        return;
    }
    m_breaker.recordTimeout();
    if (m_config.defaultStrategy == RankingStrategy::Adaptive && m_config.enableFallback
        && m_breaker.consecutiveTimeouts.load() == m_config.adaptiveTimeoutThreshold) {
        LOG_WARN(drRanking, "Adaptive ranking: %d consecutive timeouts, downgrading to %s "
                            "for %d ms",
                 m_config.adaptiveTimeoutThreshold,
                 qUtf8Printable(rankingStrategyToString(m_config.fallbackStrategy)),
                 m_config.adaptiveRecoveryMs);
    }
}

} // namespace dr
