#pragma once

#include "core/shared/types.h"

#include <functional>
#include <utility>

namespace gf {

template <typename T>
struct RetryOutcome {
    StageResult<T> result;
    int attempts = 0;
    bool exhausted = false;   // last attempt failed with a retryable error
    bool interrupted = false; // a backoff wait was cut short
};

// Per-stage retry policy: attempt budget, exponential backoff and the
// predicate deciding which errors are worth another attempt. Independent of
// the orchestrator so it can be driven directly in tests.
class RetryPolicy {
public:
    struct Config {
        int maxAttempts = 3;
        int baseDelayMs = 200;
        double multiplier = 2.0;
        int maxDelayMs = 5000;
    };

    using RetryPredicate = std::function<bool(const StageError&)>;

    // Waits delayMs; returns false when the wait was interrupted.
    using Sleeper = std::function<bool(int delayMs)>;

    // Called before each backoff wait with the upcoming attempt number.
    using RetryObserver = std::function<void(int nextAttempt, const StageError& error)>;

    RetryPolicy();
    explicit RetryPolicy(const Config& config, RetryPredicate isRetryable = {});

    // Backoff before retry number |retry| (1 for the first retry).
    int delayForRetry(int retry) const;

    bool isRetryable(const StageError& error) const;
    int maxAttempts() const { return m_config.maxAttempts; }
    const Config& config() const { return m_config; }

    static bool blockingSleep(int delayMs);

    template <typename T, typename Fn>
    RetryOutcome<T> run(Fn&& attempt,
                        const Sleeper& sleep = &RetryPolicy::blockingSleep,
                        const RetryObserver& onRetry = {}) const
    {
        RetryOutcome<T> outcome;
        const int budget = m_config.maxAttempts < 1 ? 1 : m_config.maxAttempts;
        for (int n = 1; n <= budget; ++n) {
            outcome.attempts = n;
            outcome.result = attempt(n);
            if (outcome.result.ok() || !isRetryable(outcome.result.error)) {
                return outcome;
            }
            if (n == budget) {
                outcome.exhausted = true;
                return outcome;
            }
            if (onRetry) {
                onRetry(n + 1, outcome.result.error);
            }
            if (!sleep(delayForRetry(n))) {
                outcome.interrupted = true;
                return outcome;
            }
        }
        return outcome;
    }

private:
    Config m_config;
    RetryPredicate m_isRetryable;
};

} // namespace gf
