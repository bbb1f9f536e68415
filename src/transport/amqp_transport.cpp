#include "pidbox/transport/amqp_transport.hpp"
#include "pidbox/errors.hpp"
#include "pidbox/global/logger.hpp"
#include "pidbox/protocol/codec.hpp"
#include "../utils/random_utils.hpp"

namespace pidbox::transport {

namespace {

/**
 * @brief Cancels the reply consumer and deletes the reply queue when a ping ends
 */
class ReplyConsumerGuard {
public:
    ReplyConsumerGuard(AmqpChannel& channel, std::string queue)
        : channel_(channel), queue_(std::move(queue)) {}

    ~ReplyConsumerGuard() {
        if (!consumer_tag_.empty()) {
            try {
                channel_.cancel(consumer_tag_);
            } catch (const std::exception& e) {
                log_warn("Failed to cancel reply consumer: ", e.what());
            }
        }
        try {
            channel_.delete_queue(queue_);
        } catch (const std::exception& e) {
            log_warn("Failed to delete reply queue ", queue_, ": ", e.what());
        }
    }

    ReplyConsumerGuard(const ReplyConsumerGuard&) = delete;
    ReplyConsumerGuard& operator=(const ReplyConsumerGuard&) = delete;

    void set_consumer(std::string tag) { consumer_tag_ = std::move(tag); }

private:
    AmqpChannel& channel_;
    std::string queue_;
    std::string consumer_tag_;
};

} // namespace

AmqpTransport::AmqpTransport(BrokerConfig config)
    : AmqpTransport(std::move(config), Options{}, connect_simple_amqp) {}

AmqpTransport::AmqpTransport(BrokerConfig config, Options options, AmqpChannelFactory factory)
    : config_(std::move(config))
    , options_(options)
    , factory_(std::move(factory)) {}

AmqpTransport::~AmqpTransport() {
    close();
}

AmqpEndpoint AmqpTransport::resolve_endpoint(const BrokerConfig& config) {
    BrokerUrl url;
    try {
        url = parse_broker_url(config.url);
    } catch (const ConfigError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("failed to parse AMQP URL: ") + e.what());
    }
    if (url.scheme == "amqps") {
        throw BrokerError(ErrorKind::Connect, "TLS connections (amqps://) are not supported");
    }
    if (url.scheme != "amqp") {
        throw BrokerError(ErrorKind::Connect,
                          "failed to parse AMQP URL: invalid scheme \"" + url.scheme + "\"");
    }

    AmqpEndpoint endpoint;
    endpoint.host = url.host;
    endpoint.port = url.port;
    if (!url.username.empty()) endpoint.username = url.username;
    if (!url.password.empty()) endpoint.password = url.password;
    if (!url.path.empty()) endpoint.vhost = url.path;

    if (!config.username.empty()) endpoint.username = config.username;
    if (!config.password.empty()) endpoint.password = config.password;
    return endpoint;
}

void AmqpTransport::connect() {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    endpoint_ = resolve_endpoint(config_);
    log_info("Connecting to AMQP broker at ", endpoint_.host, ":", endpoint_.port, " vhost ",
             endpoint_.vhost);
    try {
        channel_ = factory_(endpoint_);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("failed to connect to AMQP: ") + e.what());
    }
    try {
        declare_exchanges();
    } catch (const BrokerError&) {
        channel_.reset();
        throw;
    }
}

void AmqpTransport::close() {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    channel_.reset();
}

void AmqpTransport::health() {
    if (!channel_) {
        throw BrokerError(ErrorKind::Configuration, "AMQP connection not initialized");
    }
    try {
        channel_->declare_exchange(std::string(protocol::kBroadcastExchange), ExchangeKind::Fanout,
                                   true, false, true);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Connect, std::string("AMQP health check failed: ") + e.what());
    }
}

void AmqpTransport::declare_exchanges() {
    ensure_exchange(std::string(protocol::kBroadcastExchange), ExchangeKind::Fanout);
    ensure_exchange(std::string(protocol::kReplyExchange), ExchangeKind::Direct);
}

void AmqpTransport::ensure_exchange(const std::string& name, ExchangeKind kind) {
    try {
        channel_->declare_exchange(name, kind, true, false, true);
        return;
    } catch (const ClientError& e) {
        log_info("Passive declare of ", name, " failed (", e.what(), "), declaring it");
    }
    try {
        channel_->declare_exchange(name, kind, true, false, false);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Declare,
                          "failed to declare " + name + " exchange: " + e.what());
    }
}

PingResult AmqpTransport::ping(std::chrono::milliseconds timeout,
                               const std::vector<std::string>& destinations,
                               const CancellationToken& cancel) {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    if (!channel_) {
        throw BrokerError(ErrorKind::Configuration, "AMQP connection not initialized");
    }

    auto token = utils::random_uuid();
    auto message = protocol::make_ping(token, destinations);

    CollectorPolicy policy;
    policy.timeout = timeout;
    policy.stop_on_quiet_period = true;
    policy.quiet_period = options_.quiet_period;
    ResponseCollector collector(policy);

    try {
        channel_->declare_queue(token, false, true, true);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Declare, std::string("failed to declare reply queue: ") + e.what());
    }
    ReplyConsumerGuard guard(*channel_, token);

    try {
        channel_->bind_queue(token, std::string(protocol::kReplyExchange), token);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Declare, std::string("failed to bind reply queue: ") + e.what());
    }

    AmqpMessage request;
    request.exchange = std::string(protocol::kBroadcastExchange);
    request.routing_key = "";
    request.body = protocol::Codec::encode(message, protocol::WireFormat::Raw);
    try {
        channel_->publish(request);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Publish, std::string("failed to publish ping message: ") + e.what());
    }
    log_info("Broadcast ping ", message.ticket, " on ", request.exchange, " to ",
             destinations.empty() ? std::string("all workers")
                                  : std::to_string(destinations.size()) + " destination(s)");

    std::string consumer_tag;
    try {
        consumer_tag = channel_->consume(token);
    } catch (const ClientError& e) {
        throw BrokerError(ErrorKind::Declare,
                          std::string("failed to start consuming replies: ") + e.what());
    }
    guard.set_consumer(consumer_tag);

    while (true) {
        if (cancel.cancelled()) {
            log_info("Ping cancelled with ", collector.size(), " response(s)");
            return collector.finish(StopReason::Cancelled);
        }
        if (auto reason = collector.stop_reason()) {
            log_info("Ping finished (", to_string(*reason), ") with ", collector.size(),
                     " response(s)");
            return collector.finish(*reason);
        }

        std::optional<std::string> body;
        try {
            body = channel_->next_message(consumer_tag, collector.next_wait());
        } catch (const ClientError& e) {
            if (e.kind() == ClientError::Kind::StreamClosed) {
                log_info("Reply stream closed by broker with ", collector.size(), " response(s)");
                return collector.finish(StopReason::StreamClosed);
            }
            if (collector.empty()) {
                throw BrokerError(ErrorKind::Receive,
                                  std::string("failed to receive response: ") + e.what());
            }
            log_warn("AMQP failed after ", collector.size(),
                     " response(s), returning partial result: ", e.what());
            return collector.finish(StopReason::BrokerFailure);
        }
        if (body) {
            collector.add(*body);
        }
    }
}

} // namespace pidbox::transport
