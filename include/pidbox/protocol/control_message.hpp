#pragma once

/**
 * @file control_message.hpp
 * @brief Control-bus (pidbox) message model and protocol constants
 *
 * The names below are the conventions Celery/kombu workers use for the
 * broadcast mailbox. They must match byte for byte or workers will never
 * see the request, or will reply somewhere nobody listens.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pidbox {
namespace protocol {

/// Fanout exchange carrying control requests to every worker mailbox.
inline constexpr std::string_view kBroadcastExchange = "celery.pidbox";
/// Direct exchange workers publish replies to.
inline constexpr std::string_view kReplyExchange = "reply.celery.pidbox";

/// kombu Redis transport: separator between binding fields and priority tags.
inline constexpr std::string_view kControlSequence = "\x06\x16";
/// kombu Redis transport: set holding bindings of the reply exchange.
inline constexpr std::string_view kReplyBindingKey = "_kombu.binding.reply.celery.pidbox";
/// kombu Redis transport: fanout channels are prefixed "/<db>.".
inline constexpr std::string_view kFanoutPrefix = "/";
/// Priority-tagged queue variants a reply may land on (priority 0 is the base name).
inline constexpr char kPrioritySuffixes[] = {'3', '6', '9'};

inline constexpr std::string_view kPingMethod = "ping";
inline constexpr std::string_view kPongStatus = "pong";

enum class WireFormat {
    /// Control message as a flat JSON document (AMQP).
    Raw,
    /// Control message base64-encoded inside a kombu envelope (Redis).
    Enveloped,
};

/**
 * @brief Where workers should send their replies
 */
struct ReplyAddress {
    std::string exchange{kReplyExchange};
    std::string routing_key;
};

/**
 * @brief A control-bus request
 *
 * An unset destination means broadcast to every worker. A set destination
 * is never empty.
 */
struct ControlMessage {
    std::string method{kPingMethod};
    std::optional<std::vector<std::string>> destination;
    std::string ticket;
    ReplyAddress reply_to;
};

/**
 * @brief Extra fields needed by the enveloped wire format
 */
struct EnvelopeOptions {
    int64_t expires = 0;       ///< Absolute unix time (seconds) after which workers drop the request
    int64_t clock = 1;
    std::string delivery_tag;
};

/**
 * @brief A pong observed from one worker
 */
struct WorkerResponse {
    std::string worker_identity;  ///< "name@host"
    std::string status{kPongStatus};
    std::chrono::system_clock::time_point received_at;
};

/**
 * @brief Build a ping request with a fresh ticket
 *
 * An empty destinations list is a broadcast.
 */
ControlMessage make_ping(const std::string& reply_routing_key,
                         const std::vector<std::string>& destinations);

/**
 * @brief Envelope options whose expiry outlives a collection window
 *
 * Expiry is now + max(10s, timeout + 1s) so workers never discard the
 * request before the caller stops listening.
 */
EnvelopeOptions make_envelope_options(std::chrono::milliseconds timeout);

/**
 * @brief Redis reply queue for a token: "<token>.reply.celery.pidbox"
 */
std::string reply_base_address(const std::string& token);

/**
 * @brief Base address followed by the three priority-tagged variants
 */
std::vector<std::string> reply_addresses(const std::string& base_address);

/**
 * @brief Binding registry member routing token back to the base address
 */
std::string reply_binding_member(const std::string& token, const std::string& base_address);

/**
 * @brief Redis fanout channel of the broadcast exchange for a database index
 */
std::string broadcast_channel(int database);

} // namespace protocol
} // namespace pidbox
