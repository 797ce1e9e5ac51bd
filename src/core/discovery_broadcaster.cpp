/**
 * @file discovery_broadcaster.cpp
 * @brief DiscoveryBroadcaster implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/discovery_broadcaster.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/utils/logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <stdexcept>

namespace lumen {
namespace core {

using Clock = std::chrono::steady_clock;

struct DiscoveryBroadcaster::Listener {
    uint64_t id;
    ReplyCallback callback;
    Clock::time_point window_start;
    Clock::time_point deadline;

    // Replies accepted by dispatch() wait here for the sweep thread
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Datagram> queue;
    bool active = true;
    bool cancelled = false;
};

namespace {

void deliver(uint64_t id, const ReplyCallback& callback, std::deque<Datagram>& batch) {
    for (const auto& datagram : batch) {
        try {
            callback(datagram);
        } catch (const std::exception& e) {
            LOG_ERROR("Discovery", "Listener #{} threw on reply from {}: {}",
                      id, datagram.source.toString(), e.what());
        }
    }
    batch.clear();
}

}  // namespace

DiscoveryBroadcaster::DiscoveryBroadcaster(DatagramSender& sender,
                                           const DiscoveryConfig& config)
    : sender_(sender)
    , config_(config)
    , nextId_(1)
{
    if (config_.broadcast_interval_ms <= 0) {
        LOG_WARN("Discovery", "Invalid broadcast interval {}ms, using 500ms",
                 config_.broadcast_interval_ms);
        config_.broadcast_interval_ms = 500;
    }
}

void DiscoveryBroadcaster::discover(const CommandEnvelope& command,
                                    ReplyCallback callback,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& token) {
    if (!callback) {
        throw std::invalid_argument("Discovery callback must not be empty");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Discovery timeout must be positive");
    }
    if (token.isCancellationRequested()) {
        throw TransportError(ErrorKind::Cancelled, "Discovery cancelled before start");
    }

    auto listener = std::make_shared<Listener>();
    listener->callback = std::move(callback);
    listener->window_start = Clock::now();
    listener->deadline = listener->window_start + timeout;
    if (token.deadline() && *token.deadline() < listener->deadline) {
        listener->deadline = *token.deadline();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener->id = nextId_++;
        listeners_.push_back(listener);
    }

    // Deregisters however the sweep ends
    struct ListenerGuard {
        DiscoveryBroadcaster* self;
        uint64_t id;
        ~ListenerGuard() { self->removeListener(id); }
    } guard{this, listener->id};

    const net::SocketAddress destination(config_.broadcast_addr, config_.port);
    const std::string payload = command.assemble();
    const auto interval = std::chrono::milliseconds(config_.broadcast_interval_ms);

    LOG_DEBUG("Discovery", "Sweep #{} started: {} to {} for {}ms",
              listener->id, command.method, destination.toString(), timeout.count());

    auto registration = token.onCancel([listener] {
        std::lock_guard<std::mutex> lock(listener->mutex);
        listener->cancelled = true;
        listener->cv.notify_all();
    });

    int sends = 0;
    std::deque<Datagram> batch;
    while (true) {
        try {
            sender_.sendDatagram(payload, destination);
            ++sends;
        } catch (const TransportError& e) {
            LOG_WARN("Discovery", "Broadcast send failed: {}", e.what());
        }

        auto now = Clock::now();
        if (now >= listener->deadline) {
            break;
        }
        const auto nextSend = std::min(now + interval, listener->deadline);

        // Hand queued replies to the callback until the next re-broadcast
        while (true) {
            {
                std::unique_lock<std::mutex> lock(listener->mutex);
                listener->cv.wait_until(lock, nextSend, [&listener] {
                    return listener->cancelled || !listener->queue.empty();
                });
                batch.swap(listener->queue);
            }
            if (token.isCancellationRequested()) {
                LOG_DEBUG("Discovery", "Sweep #{} cancelled", listener->id);
                throw TransportError(ErrorKind::Cancelled, "Discovery cancelled");
            }
            if (batch.empty()) {
                break;
            }
            deliver(listener->id, listener->callback, batch);
        }

        if (Clock::now() >= listener->deadline) {
            break;
        }
    }

    // Replies that arrived inside the window but after the last wait
    removeListener(listener->id);
    {
        std::lock_guard<std::mutex> lock(listener->mutex);
        batch.swap(listener->queue);
    }
    deliver(listener->id, listener->callback, batch);

    LOG_DEBUG("Discovery", "Sweep #{} finished after {} broadcast(s)", listener->id, sends);
}

size_t DiscoveryBroadcaster::dispatch(const Datagram& datagram) {
    std::vector<std::shared_ptr<Listener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = listeners_;
    }

    size_t delivered = 0;
    for (const auto& listener : snapshot) {
        if (datagram.received_at < listener->window_start ||
            datagram.received_at > listener->deadline) {
            continue;
        }

        std::lock_guard<std::mutex> lock(listener->mutex);
        if (!listener->active) {
            continue;
        }
        listener->queue.push_back(datagram);
        listener->cv.notify_one();
        ++delivered;
    }

    return delivered;
}

size_t DiscoveryBroadcaster::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void DiscoveryBroadcaster::removeListener(uint64_t id) {
    std::shared_ptr<Listener> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [id](const std::shared_ptr<Listener>& l) { return l->id == id; });
        if (it == listeners_.end()) {
            return;
        }
        removed = *it;
        listeners_.erase(it);
    }

    std::lock_guard<std::mutex> lock(removed->mutex);
    removed->active = false;
}

}  // namespace core
}  // namespace lumen
