#pragma once

/**
 * @file codec.hpp
 * @brief Stateless translation between pidbox messages and wire bytes
 *
 * Encoding produces either the raw control document (AMQP) or the kombu
 * envelope around a base64 body (Redis). Decoding accepts both shapes and
 * unwraps at most one level of envelope.
 *
 * Worker replies come in several shapes depending on the worker
 * implementation, so identity lookup runs an ordered list of matchers:
 *   1. worker-keyed pong:    {"celery@host": {"ok": "pong"}}
 *   2. identity field:       {"hostname": "celery@host"} (also worker,
 *                            nodename, node, name)
 *   3. nested identity field {"data": {"hostname": ...}} or
 *                            {"worker": {"hostname": ...}}
 *   4. generic scan          any string value containing '@', or any string
 *                            value whose key contains "host"
 * Matchers 1-3 make a reply valid; matcher 4 only helps identity extraction.
 */

#include "control_message.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pidbox {
namespace protocol {

using json = nlohmann::json;

/**
 * @brief A payload could not be parsed. Callers skip the payload.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class IdentityMatch {
    WorkerKeyedPong,
    IdentityField,
    NestedIdentityField,
    GenericScan,
};

struct IdentityResult {
    std::string identity;
    IdentityMatch match;
    std::string status;  ///< The "ok" value for worker-keyed replies, otherwise "pong"
};

class Codec {
public:
    /**
     * @brief Serialize a control message in the requested wire format
     *
     * Deterministic for a given message and envelope options.
     */
    static std::string encode(const ControlMessage& message, WireFormat format,
                              const EnvelopeOptions& envelope = {});

    /**
     * @brief Build and serialize a ping with a fresh ticket
     */
    static std::string encode_ping(const std::string& reply_routing_key,
                                   const std::vector<std::string>& destinations,
                                   WireFormat format,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /// The control message as the JSON document both wire formats share.
    static json to_document(const ControlMessage& message);

    /**
     * @brief Parse a reply payload, unwrapping a base64 "body" if present
     * @throws DecodeError when the payload, or the unwrapped body, is not a
     *         JSON object, or the body is not valid base64
     */
    static json decode_response(std::string_view bytes);

    /// True for a worker-keyed pong or an identity field, top level or nested.
    static bool validate_response(const json& document);

    /**
     * @brief Identity taken from the evidence that makes a reply valid
     *
     * A worker-keyed pong wins, then a top-level identity field, then a
     * nested one. Unlike match_identity() this never falls back to a
     * worker-keyed entry whose status is not "pong", nor to the generic scan.
     */
    static std::optional<IdentityResult> identify_response(const json& document);

    /// Identity found by the first matcher that succeeds, or "" when none does.
    static std::string extract_identity(const json& document);

    /// Full match information, or nullopt when no matcher succeeds.
    static std::optional<IdentityResult> match_identity(const json& document);
};

} // namespace protocol
} // namespace pidbox
