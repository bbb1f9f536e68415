#pragma once

/**
 * @file amqp_transport.hpp
 * @brief Ping over AMQP 0-9-1 exchanges with a temporary reply queue
 *
 * connect() makes sure the fanout broadcast exchange and the direct reply
 * exchange exist. Each ping declares an exclusive auto-delete queue named
 * after a fresh token, binds it to the reply exchange, publishes the raw
 * request and consumes until the deadline or a quiet period after the first
 * reply.
 */

#include "pidbox/config.hpp"
#include "pidbox/transport/amqp_channel.hpp"
#include "pidbox/transport/transport.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace pidbox::transport {

class AmqpTransport : public Transport {
public:
    struct Options {
        /// Stop this long after the most recent reply.
        std::chrono::milliseconds quiet_period{100};
    };

    explicit AmqpTransport(BrokerConfig config);
    AmqpTransport(BrokerConfig config, Options options, AmqpChannelFactory factory);
    ~AmqpTransport() override;

    AmqpTransport(const AmqpTransport&) = delete;
    AmqpTransport& operator=(const AmqpTransport&) = delete;

    void connect() override;
    void close() override;
    void health() override;
    PingResult ping(std::chrono::milliseconds timeout,
                    const std::vector<std::string>& destinations,
                    const CancellationToken& cancel = {}) override;
    const char* name() const override { return "amqp"; }

    bool connected() const { return channel_ != nullptr; }

    /// @throws BrokerError (Connect) for an unparsable or non-amqp URL
    static AmqpEndpoint resolve_endpoint(const BrokerConfig& config);

private:
    void declare_exchanges();
    void ensure_exchange(const std::string& name, ExchangeKind kind);

    BrokerConfig config_;
    Options options_;
    AmqpChannelFactory factory_;
    AmqpEndpoint endpoint_;
    std::unique_ptr<AmqpChannel> channel_;
    std::mutex ping_mutex_;
};

} // namespace pidbox::transport
