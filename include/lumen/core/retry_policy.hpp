/**
 * @file retry_policy.hpp
 * @brief Bounded retry with increasing backoff for unicast exchanges.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/core/export.hpp"
#include "lumen/utils/logger.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lumen {
namespace core {

/**
 * @struct RetryConfig
 * @brief Retry budget and backoff curve.
 *
 * Retry n (0-based) waits initial_delay_ms * multiplier^n, capped at
 * max_delay_ms. The defaults give 200, 400, 800 ms.
 */
struct LUMEN_CORE_API RetryConfig {
    int max_retries;            ///< Retries after the first attempt
    int initial_delay_ms;       ///< Delay before the first retry
    double multiplier;          ///< Growth factor per retry
    int max_delay_ms;           ///< Upper bound of a single delay

    RetryConfig()
        : max_retries(3)
        , initial_delay_ms(200)
        , multiplier(2.0)
        , max_delay_ms(800)
    {}
};

/**
 * @class RetryPolicy
 * @brief Re-runs an attempt while it fails with a transient TransportError.
 *
 * Timeout, TransientNetwork and MalformedReply are retried. Cancelled,
 * Disposed and any other exception propagate at once. Backoff delays
 * wait on the cancellation token, so cancelling interrupts them.
 *
 * Usage:
 * @code
 * RetryPolicy retry(RetryConfig{});
 * std::string reply = retry.execute([&](int attempt) {
 *     return correlator.send(command, target, timeout, token);
 * }, token, "getPilot");
 * @endcode
 */
class LUMEN_CORE_API RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config = RetryConfig());

    /**
     * @brief Delay before retry @p retry (0-based).
     */
    std::chrono::milliseconds delayFor(int retry) const;

    /**
     * @brief Total attempts, first one included.
     */
    int maxAttempts() const { return config_.max_retries + 1; }

    const RetryConfig& config() const { return config_; }

    /**
     * @brief Run @p attempt until it succeeds or the budget is spent.
     * @param attempt Callable taking the 1-based attempt number.
     * @param token Cancels between and during attempts.
     * @param description Label for log lines.
     * @return Whatever the successful attempt returned.
     * @throws RetryExhaustedError when every attempt failed transiently, or
     *         the token's deadline passed during a backoff.
     * @throws TransportError(Cancelled) if the token is cancelled.
     */
    template<typename Attempt>
    auto execute(Attempt&& attempt,
                 const CancellationToken& token = CancellationToken(),
                 const std::string& description = std::string())
        -> decltype(attempt(1)) {
        std::optional<TransportError> lastError;
        int attempts = 0;

        for (int n = 1; n <= maxAttempts(); ++n) {
            if (token.isCancellationRequested()) {
                throw TransportError(ErrorKind::Cancelled, description + " cancelled");
            }

            ++attempts;
            try {
                return attempt(n);
            } catch (const TransportError& e) {
                if (!e.isTransient()) {
                    throw;
                }
                lastError.emplace(e.kind(), e.what());
            }

            if (n == maxAttempts()) {
                break;
            }

            auto delay = delayFor(n - 1);
            LOG_DEBUG("Retry", "{} attempt {}/{} failed ({}), retrying in {}ms",
                      description, n, maxAttempts(), lastError->what(), delay.count());

            if (token.waitFor(delay)) {
                if (token.isCancellationRequested()) {
                    throw TransportError(ErrorKind::Cancelled, description + " cancelled");
                }
                // Deadline passed; a further attempt could not succeed
                break;
            }
        }

        LOG_WARN("Retry", "{} failed after {} attempt(s): {}",
                 description, attempts, lastError->what());
        throw RetryExhaustedError(*lastError, attempts);
    }

private:
    RetryConfig config_;
};

}  // namespace core
}  // namespace lumen
