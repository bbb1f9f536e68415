#pragma once

/**
 * @file response_collector.hpp
 * @brief Transport-agnostic reply bookkeeping and stop policy
 *
 * Both transports feed raw payloads in and ask the collector whether to
 * keep waiting. The collector owns deduplication (last write wins per
 * worker identity) and the termination rules; the transports own only
 * their wire mechanics.
 */

#include "pidbox/protocol/control_message.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace pidbox {

using Clock = std::chrono::steady_clock;

enum class StopReason {
    Deadline,       ///< Overall timeout reached
    QuietPeriod,    ///< No traffic for the quiet period after at least one reply
    Cancelled,      ///< Caller cancelled the ping
    StreamClosed,   ///< Broker closed the reply stream
    BrokerFailure,  ///< Broker failed mid-loop after replies were collected
};

const char* to_string(StopReason reason);

struct CollectorPolicy {
    std::chrono::milliseconds timeout{1500};

    /// Stop once nothing arrived for quiet_period and at least one reply is in.
    bool stop_on_quiet_period = false;
    std::chrono::milliseconds quiet_period{100};

    /// Smallest wait the transport can block for; stop when less than this remains.
    std::chrono::milliseconds min_wait{0};
};

using ResponseMap = std::map<std::string, protocol::WorkerResponse>;

struct PingResult {
    ResponseMap responses;
    StopReason stop_reason = StopReason::Deadline;
};

class ResponseCollector {
public:
    enum class AddOutcome {
        Accepted,
        Malformed,   ///< Not decodable
        Invalid,     ///< Decoded but carries no worker evidence
    };

    explicit ResponseCollector(CollectorPolicy policy, Clock::time_point start = Clock::now());

    /**
     * @brief Decode, validate and upsert one raw payload
     *
     * Every call counts as inbound activity for the quiet-period timer,
     * whether or not the payload is usable. Malformed payloads are logged
     * and dropped; they never reach the response map.
     */
    AddOutcome add(std::string_view payload, Clock::time_point now = Clock::now());

    /// Insert or overwrite the entry for response.worker_identity.
    void upsert(protocol::WorkerResponse response);

    /**
     * @brief The keep-waiting decision
     * @param elapsed time since the collection started
     * @param idle time since the last inbound payload (or since the start)
     * @param response_count distinct workers collected so far
     */
    static bool keep_waiting(const CollectorPolicy& policy, Clock::duration elapsed,
                             Clock::duration idle, std::size_t response_count);

    bool keep_waiting(Clock::time_point now = Clock::now()) const;

    /// Why keep_waiting() said stop, or nullopt while it says continue.
    std::optional<StopReason> stop_reason(Clock::time_point now = Clock::now()) const;

    Clock::duration remaining(Clock::time_point now = Clock::now()) const;

    /**
     * @brief How long the next receive may block
     *
     * Never past the deadline; with the quiet-period policy, never past the
     * point where the quiet period would expire.
     */
    std::chrono::milliseconds next_wait(Clock::time_point now = Clock::now()) const;

    const CollectorPolicy& policy() const { return policy_; }
    const ResponseMap& responses() const { return responses_; }
    std::size_t size() const { return responses_.size(); }
    bool empty() const { return responses_.empty(); }

    PingResult finish(StopReason reason);

private:
    CollectorPolicy policy_;
    Clock::time_point start_;
    Clock::time_point last_activity_;
    ResponseMap responses_;
};

} // namespace pidbox
