#include "pidbox/protocol/codec.hpp"
#include "../utils/base64.hpp"
#include <array>

namespace pidbox {
namespace protocol {

namespace {

constexpr std::array<std::string_view, 5> kIdentityFields = {"hostname", "worker", "nodename",
                                                             "node", "name"};
constexpr std::array<std::string_view, 2> kNestedContainers = {"data", "worker"};

bool is_worker_name(std::string_view key) {
    return key.find('@') != std::string_view::npos;
}

std::optional<std::string> string_field(const json& object, std::string_view field) {
    auto it = object.find(std::string(field));
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<IdentityResult> match_worker_keyed(const json& document) {
    std::optional<IdentityResult> fallback;
    for (const auto& [key, value] : document.items()) {
        if (!is_worker_name(key) || !value.is_object()) continue;
        auto ok = value.find("ok");
        if (ok == value.end()) continue;

        std::string status = ok->is_string() ? ok->get<std::string>() : ok->dump();
        if (status == kPongStatus) {
            return IdentityResult{key, IdentityMatch::WorkerKeyedPong, status};
        }
        if (!fallback) {
            fallback = IdentityResult{key, IdentityMatch::WorkerKeyedPong, status};
        }
    }
    return fallback;
}

std::optional<IdentityResult> match_identity_field(const json& document) {
    for (auto field : kIdentityFields) {
        if (auto value = string_field(document, field)) {
            return IdentityResult{*value, IdentityMatch::IdentityField, std::string(kPongStatus)};
        }
    }
    return std::nullopt;
}

std::optional<IdentityResult> match_nested_identity_field(const json& document) {
    for (auto container : kNestedContainers) {
        auto nested = document.find(std::string(container));
        if (nested == document.end() || !nested->is_object()) continue;
        for (auto field : kIdentityFields) {
            if (auto value = string_field(*nested, field)) {
                return IdentityResult{*value, IdentityMatch::NestedIdentityField,
                                      std::string(kPongStatus)};
            }
        }
    }
    return std::nullopt;
}

std::optional<IdentityResult> match_generic_scan(const json& document) {
    for (const auto& [key, value] : document.items()) {
        if (!value.is_string()) continue;
        auto text = value.get<std::string>();
        if (text.empty()) continue;
        if (is_worker_name(text) || key.find("host") != std::string::npos) {
            return IdentityResult{text, IdentityMatch::GenericScan, std::string(kPongStatus)};
        }
    }
    return std::nullopt;
}

using Matcher = std::optional<IdentityResult> (*)(const json&);

// Order matters: earlier matchers are the more specific reply shapes.
constexpr std::array<Matcher, 4> kMatchers = {
    match_worker_keyed,
    match_identity_field,
    match_nested_identity_field,
    match_generic_scan,
};

json parse_object(std::string_view bytes, const char* what) {
    json document = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (document.is_discarded()) {
        throw DecodeError(std::string("failed to parse ") + what + ": malformed JSON");
    }
    if (!document.is_object()) {
        throw DecodeError(std::string("failed to parse ") + what + ": not a JSON object");
    }
    return document;
}

} // namespace

json Codec::to_document(const ControlMessage& message) {
    json document = {
        {"method", message.method},
        {"arguments", json::object()},
        {"destination", nullptr},
        {"pattern", nullptr},
        {"matcher", nullptr},
        {"ticket", message.ticket},
        {"reply_to",
         {{"exchange", message.reply_to.exchange},
          {"routing_key", message.reply_to.routing_key}}},
    };
    if (message.destination) {
        document["destination"] = *message.destination;
    }
    return document;
}

std::string Codec::encode(const ControlMessage& message, WireFormat format,
                          const EnvelopeOptions& envelope) {
    std::string body = to_document(message).dump();
    if (format == WireFormat::Raw) {
        return body;
    }

    json wrapped = {
        {"body", utils::base64_encode(body)},
        {"content-encoding", "utf-8"},
        {"content-type", "application/json"},
        {"headers", {{"clock", envelope.clock}, {"expires", envelope.expires}}},
        {"properties",
         {{"delivery_mode", 2},
          {"delivery_info", {{"exchange", std::string(kBroadcastExchange)}, {"routing_key", ""}}},
          {"priority", 0},
          {"body_encoding", "base64"},
          {"delivery_tag", envelope.delivery_tag}}},
    };
    return wrapped.dump();
}

std::string Codec::encode_ping(const std::string& reply_routing_key,
                               const std::vector<std::string>& destinations, WireFormat format,
                               std::chrono::milliseconds timeout) {
    auto message = make_ping(reply_routing_key, destinations);
    if (format == WireFormat::Raw) {
        return encode(message, format);
    }
    return encode(message, format, make_envelope_options(timeout));
}

json Codec::decode_response(std::string_view bytes) {
    json envelope = parse_object(bytes, "response envelope");

    auto body = envelope.find("body");
    if (body == envelope.end() || !body->is_string()) {
        return envelope;
    }

    auto decoded = utils::base64_decode(body->get<std::string>());
    if (!decoded) {
        throw DecodeError("failed to decode base64 body");
    }
    return parse_object(*decoded, "decoded body");
}

std::optional<IdentityResult> Codec::identify_response(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }
    auto keyed = match_worker_keyed(document);
    if (keyed && keyed->status == kPongStatus) {
        return keyed;
    }
    if (auto field = match_identity_field(document)) {
        return field;
    }
    return match_nested_identity_field(document);
}

bool Codec::validate_response(const json& document) {
    return identify_response(document).has_value();
}

std::optional<IdentityResult> Codec::match_identity(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }
    for (Matcher matcher : kMatchers) {
        if (auto result = matcher(document)) {
            return result;
        }
    }
    return std::nullopt;
}

std::string Codec::extract_identity(const json& document) {
    auto result = match_identity(document);
    return result ? result->identity : std::string();
}

} // namespace protocol
} // namespace pidbox
