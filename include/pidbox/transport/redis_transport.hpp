#pragma once

/**
 * @file redis_transport.hpp
 * @brief Ping over Redis pub/sub with list-based reply queues (kombu layout)
 *
 * Per ping: register a binding for a fresh reply token, publish the
 * enveloped request on the broadcast channel, then BRPOP across the base
 * reply list and its three priority variants until the deadline. The binding
 * and every reply list are removed on all exit paths.
 */

#include "pidbox/config.hpp"
#include "pidbox/transport/redis_client.hpp"
#include "pidbox/transport/transport.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace pidbox::transport {

class RedisTransport : public Transport {
public:
    struct Options {
        /// BRPOP can only block in whole seconds.
        std::chrono::milliseconds poll_granularity{1000};
        /// Pause after publishing so workers can pick the request up.
        std::chrono::milliseconds settle_delay{50};
        /// Spacing of the non-blocking RPOP sweeps once BRPOP can no longer be used.
        std::chrono::milliseconds drain_interval{50};
    };

    explicit RedisTransport(BrokerConfig config);
    RedisTransport(BrokerConfig config, Options options, RedisClientFactory factory);
    ~RedisTransport() override;

    RedisTransport(const RedisTransport&) = delete;
    RedisTransport& operator=(const RedisTransport&) = delete;

    void connect() override;
    void close() override;
    void health() override;
    PingResult ping(std::chrono::milliseconds timeout,
                    const std::vector<std::string>& destinations,
                    const CancellationToken& cancel = {}) override;
    const char* name() const override { return "redis"; }

    bool connected() const { return client_ != nullptr; }

    /**
     * @brief Resolve URL, database and credentials into a client endpoint
     *
     * A non-zero configured database and non-empty configured credentials
     * override what the URL carries.
     *
     * @throws BrokerError (Connect) for an unparsable or non-redis URL
     */
    static RedisEndpoint resolve_endpoint(const BrokerConfig& config);

private:
    PingResult collect(ResponseCollector& collector, const std::vector<std::string>& addresses,
                       const CancellationToken& cancel);
    void drain(ResponseCollector& collector, const std::vector<std::string>& addresses);

    BrokerConfig config_;
    Options options_;
    RedisClientFactory factory_;
    RedisEndpoint endpoint_;
    std::unique_ptr<RedisClient> client_;
    std::mutex ping_mutex_;
};

} // namespace pidbox::transport
