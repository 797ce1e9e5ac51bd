/**
 * @file cancellation.cpp
 * @brief CancellationSource / CancellationToken implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/cancellation.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace lumen {
namespace core {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    uint64_t nextId = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

namespace {

std::optional<CancellationToken::TimePoint> earliest(
    std::optional<CancellationToken::TimePoint> a,
    std::optional<CancellationToken::TimePoint> b) {
    if (!a) return b;
    if (!b) return a;
    return *a < *b ? a : b;
}

}  // namespace

// ============================================================================
// CancellationRegistration
// ============================================================================

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_))
    , id_(other.id_)
{
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ============================================================================
// CancellationToken
// ============================================================================

CancellationToken CancellationToken::withDeadline(TimePoint deadline) {
    return CancellationToken(nullptr, deadline);
}

bool CancellationToken::isCancellationRequested() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::isDeadlineExceeded() const {
    return deadline_ && Clock::now() >= *deadline_;
}

CancellationReason CancellationToken::reason() const {
    if (isCancellationRequested()) {
        return CancellationReason::Requested;
    }
    if (isDeadlineExceeded()) {
        return CancellationReason::DeadlineExceeded;
    }
    return CancellationReason::None;
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_ || !callback) {
        return CancellationRegistration();
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    // Already cancelled
    callback();
    return CancellationRegistration();
}

bool CancellationToken::waitUntil(TimePoint until) const {
    TimePoint limit = deadline_ ? std::min(until, *deadline_) : until;

    if (state_) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_until(lock, limit, [this] { return state_->cancelled; });
    } else {
        std::this_thread::sleep_until(limit);
    }

    return isCancelled();
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>())
{}

CancellationSource CancellationSource::linked(
    std::initializer_list<CancellationToken> parents) {
    CancellationSource source;

    for (const auto& parent : parents) {
        source.deadline_ = earliest(source.deadline_, parent.deadline());

        std::weak_ptr<detail::CancellationState> weak = source.state_;
        source.links_.push_back(parent.onCancel([weak] {
            if (auto state = weak.lock()) {
                CancellationSource::cancelState(*state);
            }
        }));
    }

    return source;
}

CancellationSource CancellationSource::withTimeout(const CancellationToken& parent,
                                                   std::chrono::milliseconds timeout) {
    CancellationSource source = linked({parent});
    auto deadline = CancellationToken::Clock::now() +
                    std::chrono::duration_cast<CancellationToken::Clock::duration>(timeout);
    source.deadline_ = earliest(source.deadline_, deadline);
    return source;
}

void CancellationSource::cancel() {
    if (state_) {
        cancelState(*state_);
    }
}

void CancellationSource::cancelState(detail::CancellationState& state) {
    std::map<uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.cancelled) {
            return;
        }
        state.cancelled = true;
        callbacks.swap(state.callbacks);
    }
    state.cv.notify_all();

    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool CancellationSource::isCancellationRequested() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_, deadline_);
}

}  // namespace core
}  // namespace lumen
