#include "pidbox/transport/redis_transport.hpp"
#include "pidbox/errors.hpp"
#include "pidbox/global/logger.hpp"
#include "pidbox/protocol/codec.hpp"
#include "../utils/random_utils.hpp"
#include <algorithm>
#include <charconv>
#include <thread>

namespace pidbox::transport {

namespace {

/**
 * @brief Removes the reply binding and every reply list when a ping ends
 */
class ReplyQueueGuard {
public:
    ReplyQueueGuard(RedisClient& client, std::string member, std::vector<std::string> keys)
        : client_(client), member_(std::move(member)), keys_(std::move(keys)) {}

    ~ReplyQueueGuard() {
        try {
            client_.srem(std::string(protocol::kReplyBindingKey), member_);
        } catch (const std::exception& e) {
            log_warn("Failed to remove reply binding: ", e.what());
        }
        try {
            client_.del(keys_);
        } catch (const std::exception& e) {
            log_warn("Failed to delete reply queues: ", e.what());
        }
    }

    ReplyQueueGuard(const ReplyQueueGuard&) = delete;
    ReplyQueueGuard& operator=(const ReplyQueueGuard&) = delete;

private:
    RedisClient& client_;
    std::string member_;
    std::vector<std::string> keys_;
};

int parse_database(const std::string& path) {
    if (path.empty()) {
        return 0;
    }
    int value = -1;
    auto [ptr, ec] = std::from_chars(path.data(), path.data() + path.size(), value);
    if (ec != std::errc() || ptr != path.data() + path.size() || value < 0) {
        throw BrokerError(ErrorKind::Connect,
                          "failed to parse Redis URL: invalid database number \"" + path + "\"");
    }
    return value;
}

} // namespace

RedisTransport::RedisTransport(BrokerConfig config)
    : RedisTransport(std::move(config), Options{}, connect_hiredis) {}

RedisTransport::RedisTransport(BrokerConfig config, Options options, RedisClientFactory factory)
    : config_(std::move(config))
    , options_(options)
    , factory_(std::move(factory)) {}

RedisTransport::~RedisTransport() {
    close();
}

RedisEndpoint RedisTransport::resolve_endpoint(const BrokerConfig& config) {
    BrokerUrl url;
    try {
        url = parse_broker_url(config.url);
    } catch (const ConfigError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("failed to parse Redis URL: ") + e.what());
    }
    if (url.scheme == "rediss") {
        throw BrokerError(ErrorKind::Connect, "TLS connections (rediss://) are not supported");
    }
    if (url.scheme != "redis") {
        throw BrokerError(ErrorKind::Connect,
                          "failed to parse Redis URL: invalid scheme \"" + url.scheme + "\"");
    }

    RedisEndpoint endpoint;
    endpoint.host = url.host;
    endpoint.port = url.port;
    endpoint.database = parse_database(url.path);
    endpoint.username = url.username;
    endpoint.password = url.password;
    endpoint.connect_timeout = config.connect_timeout;

    if (config.database != 0) {
        endpoint.database = config.database;
    }
    if (!config.username.empty()) {
        endpoint.username = config.username;
    }
    if (!config.password.empty()) {
        endpoint.password = config.password;
    }
    return endpoint;
}

void RedisTransport::connect() {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    endpoint_ = resolve_endpoint(config_);
    log_info("Connecting to Redis at ", endpoint_.host, ":", endpoint_.port, " db ",
             endpoint_.database);
    try {
        client_ = factory_(endpoint_);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("failed to connect to Redis: ") + e.what());
    }
    try {
        health();
    } catch (const BrokerError&) {
        client_.reset();
        throw;
    }
}

void RedisTransport::close() {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    client_.reset();
}

void RedisTransport::health() {
    if (!client_) {
        throw BrokerError(ErrorKind::Configuration, "Redis client not initialized");
    }
    try {
        client_->ping();
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("Redis health check failed: ") + e.what());
    }
}

PingResult RedisTransport::ping(std::chrono::milliseconds timeout,
                                const std::vector<std::string>& destinations,
                                const CancellationToken& cancel) {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    if (!client_) {
        throw BrokerError(ErrorKind::Configuration, "Redis client not initialized");
    }

    auto token = utils::random_uuid();
    auto base = protocol::reply_base_address(token);
    auto addresses = protocol::reply_addresses(base);
    auto member = protocol::reply_binding_member(token, base);

    auto message = protocol::make_ping(token, destinations);
    auto payload = protocol::Codec::encode(message, protocol::WireFormat::Enveloped,
                                           protocol::make_envelope_options(timeout));

    CollectorPolicy policy;
    policy.timeout = timeout;
    policy.min_wait = options_.poll_granularity;
    ResponseCollector collector(policy);

    ReplyQueueGuard guard(*client_, member, addresses);

    // The binding has to exist before any worker can route a reply to us.
    try {
        client_->sadd(std::string(protocol::kReplyBindingKey), member);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Declare,
                          std::string("failed to register reply binding: ") + e.what());
    }

    auto channel = protocol::broadcast_channel(endpoint_.database);
    try {
        auto receivers = client_->publish(channel, payload);
        log_info("Broadcast ping ", message.ticket, " on ", channel, " to ",
                 destinations.empty() ? std::string("all workers")
                                      : std::to_string(destinations.size()) + " destination(s)",
                 " (", receivers, " subscriber(s))");
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Publish, std::string("failed to publish ping message: ") + e.what());
    }

    if (options_.settle_delay.count() > 0) {
        std::this_thread::sleep_for(options_.settle_delay);
    }

    return collect(collector, addresses, cancel);
}

PingResult RedisTransport::collect(ResponseCollector& collector,
                                   const std::vector<std::string>& addresses,
                                   const CancellationToken& cancel) {
    auto block_for = std::max<std::chrono::seconds>(
        std::chrono::seconds(1), std::chrono::ceil<std::chrono::seconds>(options_.poll_granularity));

    try {
        while (true) {
            if (cancel.cancelled()) {
                log_info("Ping cancelled with ", collector.size(), " response(s)");
                return collector.finish(StopReason::Cancelled);
            }
            if (collector.stop_reason()) {
                break;
            }
            if (auto popped = client_->brpop(addresses, block_for)) {
                collector.add(popped->second);
            }
        }

        // Too little time left to block; poll without blocking until the deadline.
        while (collector.remaining().count() > 0) {
            if (cancel.cancelled()) {
                log_info("Ping cancelled with ", collector.size(), " response(s)");
                return collector.finish(StopReason::Cancelled);
            }
            drain(collector, addresses);
            auto pause = std::min<Clock::duration>(collector.remaining(), options_.drain_interval);
            if (pause.count() <= 0) {
                break;
            }
            std::this_thread::sleep_for(pause);
        }
        drain(collector, addresses);
    } catch (const ClientError& e) {
        if (collector.empty()) {
            throw BrokerError(ErrorKind::Receive, std::string("failed to receive response: ") + e.what());
        }
        log_warn("Redis failed after ", collector.size(), " response(s), returning partial result: ",
                 e.what());
        return collector.finish(StopReason::BrokerFailure);
    }

    log_info("Ping finished (deadline) with ", collector.size(), " response(s)");
    return collector.finish(StopReason::Deadline);
}

void RedisTransport::drain(ResponseCollector& collector, const std::vector<std::string>& addresses) {
    for (const auto& key : addresses) {
        while (auto value = client_->rpop(key)) {
            collector.add(*value);
        }
    }
}

} // namespace pidbox::transport
