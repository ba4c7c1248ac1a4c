#include "core/pipeline/retry_policy.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace gf {

RetryPolicy::RetryPolicy()
    : RetryPolicy(Config{})
{
}

RetryPolicy::RetryPolicy(const Config& config, RetryPredicate isRetryable)
    : m_config(config)
    , m_isRetryable(std::move(isRetryable))
{
}

int RetryPolicy::delayForRetry(int retry) const
{
    if (retry < 1 || m_config.baseDelayMs <= 0) {
        return 0;
    }
    const double multiplier = std::max(m_config.multiplier, 1.0);
    const double delay = static_cast<double>(m_config.baseDelayMs)
                         * std::pow(multiplier, static_cast<double>(retry - 1));
    const double cap = m_config.maxDelayMs > 0 ? static_cast<double>(m_config.maxDelayMs) : delay;
    return static_cast<int>(std::min(delay, cap));
}

bool RetryPolicy::isRetryable(const StageError& error) const
{
    if (m_isRetryable) {
        return m_isRetryable(error);
    }
    return error.isRetryable();
}

bool RetryPolicy::blockingSleep(int delayMs)
{
    if (delayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
    return true;
}

} // namespace gf
