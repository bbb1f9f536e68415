#pragma once

/**
 * @file amqp_channel.hpp
 * @brief Minimal AMQP 0-9-1 channel surface used by the AMQP transport
 *
 * Errors are reported by throwing ClientError. A consumer cancelled by the
 * broker surfaces as ClientError::Kind::StreamClosed from next_message().
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pidbox::transport {

struct AmqpEndpoint {
    std::string host{"localhost"};
    uint16_t port = 5672;
    std::string username{"guest"};
    std::string password{"guest"};
    std::string vhost{"/"};
};

enum class ExchangeKind { Direct, Fanout };

struct AmqpMessage {
    std::string exchange;
    std::string routing_key;
    std::string body;
    std::string content_type{"application/json"};
    std::string content_encoding{"utf-8"};
    bool persistent = true;
};

class AmqpChannel {
public:
    virtual ~AmqpChannel() = default;

    /**
     * @brief Declare an exchange
     * @param passive only check that it exists
     */
    virtual void declare_exchange(const std::string& name, ExchangeKind kind, bool durable,
                                  bool auto_delete, bool passive) = 0;

    virtual void declare_queue(const std::string& name, bool durable, bool exclusive,
                               bool auto_delete) = 0;

    virtual void bind_queue(const std::string& queue, const std::string& exchange,
                            const std::string& routing_key) = 0;

    virtual void delete_queue(const std::string& name) = 0;

    virtual void publish(const AmqpMessage& message) = 0;

    /// Start an auto-ack consumer; returns the consumer tag.
    virtual std::string consume(const std::string& queue) = 0;

    /**
     * @brief Wait for the next delivery on a consumer
     * @return the message body, or nullopt when timeout elapsed first
     */
    virtual std::optional<std::string> next_message(const std::string& consumer_tag,
                                                    std::chrono::milliseconds timeout) = 0;

    virtual void cancel(const std::string& consumer_tag) = 0;
};

using AmqpChannelFactory = std::function<std::unique_ptr<AmqpChannel>(const AmqpEndpoint&)>;

/**
 * @brief Open a SimpleAmqpClient channel
 * @throws ClientError (Connection) when the broker cannot be reached
 */
std::unique_ptr<AmqpChannel> connect_simple_amqp(const AmqpEndpoint& endpoint);

} // namespace pidbox::transport
