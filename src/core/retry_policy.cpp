/**
 * @file retry_policy.cpp
 * @brief RetryPolicy implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace lumen {
namespace core {

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config)
{
    if (config_.max_retries < 0) {
        LOG_WARN("Retry", "Negative retry count {}, disabling retries", config_.max_retries);
        config_.max_retries = 0;
    }
    if (config_.initial_delay_ms < 0) {
        config_.initial_delay_ms = 0;
    }
    if (config_.multiplier < 1.0) {
        config_.multiplier = 1.0;
    }
    if (config_.max_delay_ms < config_.initial_delay_ms) {
        config_.max_delay_ms = config_.initial_delay_ms;
    }
}

std::chrono::milliseconds RetryPolicy::delayFor(int retry) const {
    double delay = config_.initial_delay_ms * std::pow(config_.multiplier, std::max(retry, 0));
    delay = std::min(delay, static_cast<double>(config_.max_delay_ms));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

}  // namespace core
}  // namespace lumen
