#include "pidbox/errors.hpp"
#include "pidbox/global/logger.hpp"
#include "pidbox/transport/amqp_channel.hpp"
#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <algorithm>
#include <climits>
#include <cstdint>
#include <utility>

namespace pidbox::transport {

namespace {

/// Run a SimpleAmqpClient call, translating its exceptions into ClientError.
template <typename Fn>
auto translate(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const AmqpClient::ConsumerCancelledException& e) {
        throw ClientError(ClientError::Kind::StreamClosed, e.what());
    } catch (const AmqpClient::ConnectionClosedException& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    } catch (const AmqpClient::ConnectionException& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    } catch (const AmqpClient::AmqpResponseLibraryException& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    } catch (const AmqpClient::AmqpLibraryException& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    } catch (const AmqpClient::AmqpException& e) {
        throw ClientError(ClientError::Kind::Command, e.what());
    } catch (const std::runtime_error& e) {
        throw ClientError(ClientError::Kind::Command, e.what());
    }
}

std::string exchange_type(ExchangeKind kind) {
    return kind == ExchangeKind::Fanout ? AmqpClient::Channel::EXCHANGE_TYPE_FANOUT
                                        : AmqpClient::Channel::EXCHANGE_TYPE_DIRECT;
}

class SimpleAmqpChannel : public AmqpChannel {
public:
    explicit SimpleAmqpChannel(AmqpClient::Channel::ptr_t channel) : channel_(std::move(channel)) {}

    void declare_exchange(const std::string& name, ExchangeKind kind, bool durable,
                          bool auto_delete, bool passive) override {
        translate([&] {
            channel_->DeclareExchange(name, exchange_type(kind), passive, durable, auto_delete);
        });
    }

    void declare_queue(const std::string& name, bool durable, bool exclusive,
                       bool auto_delete) override {
        translate([&] { channel_->DeclareQueue(name, false, durable, exclusive, auto_delete); });
    }

    void bind_queue(const std::string& queue, const std::string& exchange,
                    const std::string& routing_key) override {
        translate([&] { channel_->BindQueue(queue, exchange, routing_key); });
    }

    void delete_queue(const std::string& name) override {
        translate([&] { channel_->DeleteQueue(name); });
    }

    void publish(const AmqpMessage& message) override {
        translate([&] {
            auto basic = AmqpClient::BasicMessage::Create(message.body);
            basic->ContentType(message.content_type);
            basic->ContentEncoding(message.content_encoding);
            basic->DeliveryMode(message.persistent ? AmqpClient::BasicMessage::dm_persistent
                                                   : AmqpClient::BasicMessage::dm_nonpersistent);
            channel_->BasicPublish(message.exchange, message.routing_key, basic);
        });
    }

    std::string consume(const std::string& queue) override {
        // no_local = false, no_ack = true, exclusive = false
        return translate([&] { return channel_->BasicConsume(queue, "", false, true, false); });
    }

    std::optional<std::string> next_message(const std::string& consumer_tag,
                                            std::chrono::milliseconds timeout) override {
        return translate([&]() -> std::optional<std::string> {
            AmqpClient::Envelope::ptr_t envelope;
            auto wait = static_cast<int>(std::min<int64_t>(timeout.count(), INT_MAX));
            if (!channel_->BasicConsumeMessage(consumer_tag, envelope, wait)) {
                return std::nullopt;
            }
            return envelope->Message()->Body();
        });
    }

    void cancel(const std::string& consumer_tag) override {
        translate([&] { channel_->BasicCancel(consumer_tag); });
    }

private:
    AmqpClient::Channel::ptr_t channel_;
};

} // namespace

std::unique_ptr<AmqpChannel> connect_simple_amqp(const AmqpEndpoint& endpoint) {
    AmqpClient::Channel::ptr_t channel;
    try {
        channel = AmqpClient::Channel::Create(endpoint.host, endpoint.port, endpoint.username,
                                              endpoint.password, endpoint.vhost);
    } catch (const std::runtime_error& e) {
        throw ClientError(ClientError::Kind::Connection, e.what());
    }
    log_debug("AMQP channel open to ", endpoint.host, ":", endpoint.port, endpoint.vhost);
    return std::make_unique<SimpleAmqpChannel>(std::move(channel));
}

} // namespace pidbox::transport
