#pragma once

#include "core/shared/ranking_config.h"

#include <QString>

#include <atomic>
#include <cstdint>

namespace dr {

struct RankingDecision {
    RankingMode mode = RankingMode::Hybrid;
    bool degraded = false;   // True when the configured strategy was overridden
    bool trial = false;      // The single full-path query admitted while half-open
    QString reason;
};

// Opens after a run of consecutive timed-out queries. Once recoveryMs has
// passed since the last timeout it is half-open and admits exactly one trial
// query to the full path; everyone else stays downgraded until that trial
// reports. A trial finishing in budget closes the breaker, a timed-out trial
// reopens it for another recovery window.
struct TimeoutBreaker {
    std::atomic<int> consecutiveTimeouts{0};
    std::atomic<int64_t> lastTimeoutMs{0};
    std::atomic<bool> trialInFlight{false};

    // Side-effect free: true while queries are being kept off the full path
    bool isOpen(int threshold, int recoveryMs) const;
    bool isHalfOpen(int threshold, int recoveryMs) const;
    // Claims the half-open trial; true for exactly one caller per window
    bool tryClaimTrial();
    void releaseTrial();
    void recordSuccess();
    void recordTimeout();

    static int64_t nowMs();
};

// FallbackController -- decides, per query, which ranking path runs.
//
// Configured strategies map directly to a mode, except "adaptive": it runs
// hybrid until the timeout breaker opens and then uses fallback_strategy
// until the breaker recovers. enable_fallback = false keeps the breaker from
// ever opening. Disabled dimension ranking always means vector-only.
class FallbackController {
public:
    explicit FallbackController(const RetrievalConfig& config);

    // Not const: while half-open, the first caller claims the trial.
    RankingDecision decide();

    // Feed the outcome of every query that ran the scoring stage.
    void recordOutcome(bool timedOut);

    // A trial query that ended before scoring hands the trial back.
    void releaseTrial();

    bool isDowngraded() const;

    // Expose for testing
    TimeoutBreaker& breaker() { return m_breaker; }

private:
    static RankingMode modeFor(RankingStrategy strategy);
    bool adaptiveBreakerActive() const;

    RetrievalConfig m_config;
    TimeoutBreaker m_breaker;
};

} // namespace dr
