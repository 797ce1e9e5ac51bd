/**
 * @file request_correlator.cpp
 * @brief RequestCorrelator implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/request_correlator.hpp"
#include "lumen/utils/logger.hpp"

#include <condition_variable>
#include <stdexcept>
#include <vector>

namespace lumen {
namespace core {

namespace {

enum class Outcome {
    Waiting,
    Completed,
    Failed
};

}  // namespace

/**
 * One waiting send(). Resolved at most once; the first outcome wins.
 */
struct RequestCorrelator::PendingRequest {
    PendingRequestInfo info;

    std::mutex mutex;
    std::condition_variable cv;
    Outcome outcome = Outcome::Waiting;
    ErrorKind failure = ErrorKind::Timeout;
    std::string response;

    bool complete(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outcome != Outcome::Waiting) {
                return false;
            }
            outcome = Outcome::Completed;
            response = text;
        }
        cv.notify_all();
        return true;
    }

    bool fail(ErrorKind kind) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (outcome != Outcome::Waiting) {
                return false;
            }
            outcome = Outcome::Failed;
            failure = kind;
        }
        cv.notify_all();
        return true;
    }
};

bool matchBySourceAddress(const PendingRequestInfo& request, const Datagram& reply) {
    return request.target.ip == reply.source.ip;
}

RequestCorrelator::RequestCorrelator(DatagramSender& sender)
    : sender_(sender)
    , nextId_(1)
    , matcher_(matchBySourceAddress)
{}

RequestCorrelator::~RequestCorrelator() {
    failAll(ErrorKind::Disposed);
}

std::string RequestCorrelator::send(const CommandEnvelope& command,
                                    const net::SocketAddress& target,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& token) {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }
    if (token.isCancellationRequested()) {
        throw TransportError(ErrorKind::Cancelled, "Request cancelled before send");
    }

    auto request = std::make_shared<PendingRequest>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request->info.id = nextId_++;
        request->info.target = target;
        request->info.method = command.method;
        pending_.emplace(request->info.id, request);
    }

    // Removes the entry however we leave this function
    struct Remover {
        RequestCorrelator* self;
        uint64_t id;
        ~Remover() { self->removePending(id); }
    } remover{this, request->info.id};

    auto registration = token.onCancel([request] {
        request->fail(ErrorKind::Cancelled);
    });

    LOG_TRACE("Correlator", "Request #{} {} -> {}",
              request->info.id, command.method, target.toString());

    sender_.sendDatagram(command.assemble(), target);

    auto deadline = CancellationToken::Clock::now() + timeout;
    if (token.deadline() && *token.deadline() < deadline) {
        deadline = *token.deadline();
    }

    ErrorKind failure;
    {
        std::unique_lock<std::mutex> lock(request->mutex);
        request->cv.wait_until(lock, deadline, [&request] {
            return request->outcome != Outcome::Waiting;
        });
        if (request->outcome == Outcome::Completed) {
            LOG_TRACE("Correlator", "Request #{} completed", request->info.id);
            return request->response;
        }
        if (request->outcome == Outcome::Waiting) {
            request->outcome = Outcome::Failed;
            request->failure = ErrorKind::Timeout;
        }
        failure = request->failure;
    }

    switch (failure) {
        case ErrorKind::Timeout:
            throw TransportError(ErrorKind::Timeout,
                                 "No reply from " + target.toString() + " within " +
                                 std::to_string(timeout.count()) + " ms");
        case ErrorKind::Cancelled:
            throw TransportError(ErrorKind::Cancelled,
                                 "Request to " + target.toString() + " cancelled");
        case ErrorKind::Disposed:
            throw TransportError(ErrorKind::Disposed,
                                 "Transport shut down while waiting for " + target.toString());
        default:
            throw TransportError(failure, std::string("Request to ") + target.toString() +
                                 " failed: " + errorKindToString(failure));
    }
}

bool RequestCorrelator::tryComplete(const Datagram& datagram) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        const auto& request = it->second;
        if (!matcher_ || !matcher_(request->info, datagram)) {
            continue;
        }
        // Skip requests that already timed out or were cancelled but have
        // not yet been removed by their sender
        if (request->complete(datagram.payload)) {
            LOG_DEBUG("Correlator", "Reply from {} matched request #{}",
                      datagram.source.toString(), request->info.id);
            pending_.erase(it);
            return true;
        }
    }

    return false;
}

size_t RequestCorrelator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void RequestCorrelator::failAll(ErrorKind kind) {
    std::vector<std::shared_ptr<PendingRequest>> requests;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.reserve(pending_.size());
        for (const auto& [id, request] : pending_) {
            requests.push_back(request);
        }
    }

    size_t resolved = 0;
    for (const auto& request : requests) {
        if (request->fail(kind)) {
            ++resolved;
        }
    }

    if (resolved > 0) {
        LOG_DEBUG("Correlator", "Failed {} pending request(s): {}",
                  resolved, errorKindToString(kind));
    }
}

void RequestCorrelator::setReplyMatcher(ReplyMatcher matcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    matcher_ = std::move(matcher);
}

void RequestCorrelator::removePending(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
}

}  // namespace core
}  // namespace lumen
