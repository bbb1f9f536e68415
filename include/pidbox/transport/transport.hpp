#pragma once

/**
 * @file transport.hpp
 * @brief Broker-agnostic ping transport interface
 */

#include "pidbox/collector/response_collector.hpp"
#include "pidbox/config.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pidbox::transport {

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag. A default-constructed token can still be
 * cancelled; it is simply not shared with anyone yet.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class Transport {
public:
    virtual ~Transport() = default;

    /// @throws BrokerError (Connect or Declare); the transport stays disconnected
    virtual void connect() = 0;

    /// Release broker resources once any in-flight ping returns. Idempotent.
    virtual void close() = 0;

    /// @throws BrokerError when the broker is unreachable or never connected
    virtual void health() = 0;

    /**
     * @brief Broadcast one ping and collect replies until a stop condition
     *
     * An empty destinations list targets every worker. Replies are keyed by
     * worker identity. Cancellation returns what was collected so far.
     *
     * @throws BrokerError when setup fails, or when the broker fails before
     *         anything was collected
     */
    virtual PingResult ping(std::chrono::milliseconds timeout,
                            const std::vector<std::string>& destinations,
                            const CancellationToken& cancel = {}) = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Construct (but do not connect) the transport for a broker type
 */
std::unique_ptr<Transport> make_transport(BrokerType type, const BrokerConfig& config);

/// @throws BrokerError (Configuration) for an unknown broker type name
std::unique_ptr<Transport> make_transport(std::string_view type, const BrokerConfig& config);

} // namespace pidbox::transport
