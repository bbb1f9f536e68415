#include "pidbox/protocol/control_message.hpp"
#include "../utils/random_utils.hpp"
#include <algorithm>
#include <iterator>

namespace pidbox {
namespace protocol {

namespace {
constexpr std::chrono::seconds kMinimumExpiry{10};
constexpr std::chrono::seconds kExpiryMargin{1};
} // namespace

ControlMessage make_ping(const std::string& reply_routing_key,
                         const std::vector<std::string>& destinations) {
    ControlMessage message;
    message.method = std::string(kPingMethod);
    if (!destinations.empty()) {
        message.destination = destinations;
    }
    message.ticket = utils::random_uuid();
    message.reply_to.exchange = std::string(kReplyExchange);
    message.reply_to.routing_key = reply_routing_key;
    return message;
}

EnvelopeOptions make_envelope_options(std::chrono::milliseconds timeout) {
    auto window = std::chrono::ceil<std::chrono::seconds>(timeout) + kExpiryMargin;
    auto lifetime = std::max<std::chrono::seconds>(kMinimumExpiry, window);
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());

    EnvelopeOptions options;
    options.expires = (now + lifetime).count();
    options.clock = 1;
    options.delivery_tag = utils::random_uuid();
    return options;
}

std::string reply_base_address(const std::string& token) {
    return token + "." + std::string(kReplyExchange);
}

std::vector<std::string> reply_addresses(const std::string& base_address) {
    std::vector<std::string> addresses;
    addresses.reserve(1 + std::size(kPrioritySuffixes));
    addresses.push_back(base_address);
    for (char priority : kPrioritySuffixes) {
        addresses.push_back(base_address + std::string(kControlSequence) + priority);
    }
    return addresses;
}

std::string reply_binding_member(const std::string& token, const std::string& base_address) {
    // routing key, pattern (empty), queue
    std::string member = token;
    member += kControlSequence;
    member += kControlSequence;
    member += base_address;
    return member;
}

std::string broadcast_channel(int database) {
    return std::string(kFanoutPrefix) + std::to_string(database) + "." +
           std::string(kBroadcastExchange);
}

} // namespace protocol
} // namespace pidbox
