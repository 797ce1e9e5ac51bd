/**
 * @file request_correlator.hpp
 * @brief Matches unicast replies to the requests waiting for them.
 *
 * Devices do not echo a request id, so a reply is attributed by its source
 * address: it goes to the oldest pending request sent to that address.
 * Two concurrent requests to the same device are told apart only by
 * registration order; matching across devices is exact.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/cancellation.hpp"
#include "lumen/core/datagram.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lumen {
namespace core {

/**
 * @struct PendingRequestInfo
 * @brief What a reply matcher may inspect about a waiting request.
 */
struct PendingRequestInfo {
    uint64_t id;                    ///< Registration sequence number
    net::SocketAddress target;      ///< Where the request was sent
    std::string method;             ///< Method of the request
};

/**
 * @brief Decides whether an inbound reply belongs to a pending request.
 */
using ReplyMatcher = std::function<bool(const PendingRequestInfo&, const Datagram&)>;

/**
 * @brief Default matcher: reply source IP equals request target IP.
 * Ports are not compared.
 */
LUMEN_CORE_API bool matchBySourceAddress(const PendingRequestInfo& request,
                                         const Datagram& reply);

/**
 * @class RequestCorrelator
 * @brief Table of pending unicast requests with blocking wait.
 *
 * Each send() registers a pending request, sends the command through the
 * DatagramSender and blocks until exactly one of the following happens:
 * a matching reply arrives, the timeout elapses, the token is cancelled,
 * or failAll() is called. The request is removed from the table on
 * every exit path.
 */
class LUMEN_CORE_API RequestCorrelator {
public:
    explicit RequestCorrelator(DatagramSender& sender);

    /**
     * @brief Fails outstanding requests with ErrorKind::Disposed.
     */
    ~RequestCorrelator();

    // Non-copyable
    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * @brief Send a command and wait for its reply.
     * @param command Command to send.
     * @param target Device endpoint.
     * @param timeout Maximum time to wait for the reply.
     * @param token Cancels the wait; a deadline on the token also bounds it.
     * @return The raw reply text.
     * @throws TransportError with kind Timeout, Cancelled, Disposed, or
     *         TransientNetwork if the send itself failed.
     * @throws std::invalid_argument if @p timeout is not positive.
     */
    std::string send(const CommandEnvelope& command,
                     const net::SocketAddress& target,
                     std::chrono::milliseconds timeout,
                     const CancellationToken& token = CancellationToken());

    /**
     * @brief Offer an inbound reply to the pending requests.
     * @return True if a pending request took it.
     */
    bool tryComplete(const Datagram& datagram);

    size_t pendingCount() const;

    /**
     * @brief Resolve every pending request with @p kind.
     */
    void failAll(ErrorKind kind);

    /**
     * @brief Replace the reply matching policy.
     */
    void setReplyMatcher(ReplyMatcher matcher);

private:
    struct PendingRequest;

    void removePending(uint64_t id);

    DatagramSender& sender_;

    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<PendingRequest>> pending_;   // ordered by id
    uint64_t nextId_;
    ReplyMatcher matcher_;
};

}  // namespace core
}  // namespace lumen
