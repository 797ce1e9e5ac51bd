/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation with deadline composition.
 *
 * A CancellationSource owns the signal; CancellationTokens observe it.
 * A token may also carry a deadline, after which it reports itself
 * cancelled with reason DeadlineExceeded. Timeouts are expressed this way:
 * CancellationSource::withTimeout() combines a caller's token with a
 * deadline, and CancellationSource::linked() folds several tokens into one.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>

namespace lumen {
namespace core {

namespace detail {
struct CancellationState;
}

/**
 * @enum CancellationReason
 */
enum class CancellationReason {
    None,               ///< Not cancelled
    Requested,          ///< A source was cancelled
    DeadlineExceeded    ///< The token's deadline has passed
};

/**
 * @class CancellationRegistration
 * @brief Keeps a cancellation callback registered for its lifetime.
 *
 * Destroying or resetting the registration removes the callback. A
 * callback that has already started running is not waited for, so
 * callbacks must own whatever they touch.
 */
class LUMEN_CORE_API CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    /**
     * @brief Remove the callback now.
     */
    void reset();

private:
    friend class CancellationToken;

    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_{0};
};

/**
 * @class CancellationToken
 * @brief Read side of a cancellation signal, optionally with a deadline.
 *
 * A default-constructed token is never cancelled and has no deadline.
 * Tokens are cheap to copy.
 */
class LUMEN_CORE_API CancellationToken {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    CancellationToken() = default;

    /**
     * @brief Token that is never cancelled but expires at a deadline.
     */
    static CancellationToken withDeadline(TimePoint deadline);

    /**
     * @brief True if a source can cancel this token or it has a deadline.
     */
    bool canBeCancelled() const { return state_ != nullptr || deadline_.has_value(); }

    /**
     * @brief True once the owning source has been cancelled.
     */
    bool isCancellationRequested() const;

    /**
     * @brief True once the deadline (if any) has passed.
     */
    bool isDeadlineExceeded() const;

    /**
     * @brief Cancelled for either reason.
     */
    bool isCancelled() const { return isCancellationRequested() || isDeadlineExceeded(); }

    /**
     * @brief Why the token is cancelled. Requested wins over the deadline.
     */
    CancellationReason reason() const;

    std::optional<TimePoint> deadline() const { return deadline_; }

    /**
     * @brief Register a callback for when the source is cancelled.
     *
     * Runs immediately on the calling thread if cancellation was already
     * requested; otherwise on the thread that calls cancel(). Deadlines
     * do not trigger callbacks; waiters observe them through waitUntil().
     */
    [[nodiscard]] CancellationRegistration onCancel(std::function<void()> callback) const;

    /**
     * @brief Block until cancelled, the deadline passes, or @p until.
     * @return True if the token is cancelled on return.
     */
    bool waitUntil(TimePoint until) const;

    /**
     * @brief Block until cancelled, the deadline passes, or @p duration elapses.
     * @return True if the token is cancelled on return.
     */
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        return waitUntil(Clock::now() +
                         std::chrono::duration_cast<Clock::duration>(duration));
    }

private:
    friend class CancellationSource;

    CancellationToken(std::shared_ptr<detail::CancellationState> state,
                      std::optional<TimePoint> deadline)
        : state_(std::move(state)), deadline_(deadline) {}

    std::shared_ptr<detail::CancellationState> state_;
    std::optional<TimePoint> deadline_;
};

/**
 * @class CancellationSource
 * @brief Write side of a cancellation signal.
 *
 * Usage:
 * @code
 * CancellationSource source;
 * std::thread worker([token = source.token()] {
 *     while (!token.waitFor(std::chrono::milliseconds(500))) {
 *         // periodic work
 *     }
 * });
 * source.cancel();
 * worker.join();
 * @endcode
 */
class LUMEN_CORE_API CancellationSource {
public:
    CancellationSource();
    ~CancellationSource() = default;

    CancellationSource(CancellationSource&&) noexcept = default;
    CancellationSource& operator=(CancellationSource&&) noexcept = default;

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    /**
     * @brief Source cancelled when any parent is cancelled.
     * Its tokens carry the earliest parent deadline.
     */
    static CancellationSource linked(std::initializer_list<CancellationToken> parents);

    /**
     * @brief Source linked to @p parent whose tokens also expire after @p timeout.
     */
    static CancellationSource withTimeout(const CancellationToken& parent,
                                          std::chrono::milliseconds timeout);

    /**
     * @brief Request cancellation. Idempotent; runs registered callbacks once.
     */
    void cancel();

    bool isCancellationRequested() const;

    CancellationToken token() const;

private:
    static void cancelState(detail::CancellationState& state);

    std::shared_ptr<detail::CancellationState> state_;
    std::optional<CancellationToken::TimePoint> deadline_;
    std::vector<CancellationRegistration> links_;
};

}  // namespace core
}  // namespace lumen
