#include "pidbox/collector/response_collector.hpp"
#include "pidbox/global/logger.hpp"
#include "pidbox/protocol/codec.hpp"
#include <algorithm>

namespace pidbox {

const char* to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Deadline:      return "deadline";
        case StopReason::QuietPeriod:   return "quiet period";
        case StopReason::Cancelled:     return "cancelled";
        case StopReason::StreamClosed:  return "stream closed";
        case StopReason::BrokerFailure: return "broker failure";
    }
    return "unknown";
}

ResponseCollector::ResponseCollector(CollectorPolicy policy, Clock::time_point start)
    : policy_(policy)
    , start_(start)
    , last_activity_(start) {}

ResponseCollector::AddOutcome ResponseCollector::add(std::string_view payload,
                                                     Clock::time_point now) {
    last_activity_ = now;

    protocol::json document;
    try {
        document = protocol::Codec::decode_response(payload);
    } catch (const protocol::DecodeError& e) {
        log_debug("Skipping malformed reply (", payload.size(), " bytes): ", e.what());
        return AddOutcome::Malformed;
    }

    auto match = protocol::Codec::identify_response(document);
    if (!match) {
        log_debug("Skipping reply without worker evidence: ", document.dump());
        return AddOutcome::Invalid;
    }

    protocol::WorkerResponse response;
    response.worker_identity = std::move(match->identity);
    response.status = std::string(protocol::kPongStatus);
    response.received_at = std::chrono::system_clock::now();
    log_debug("Reply from ", response.worker_identity, ": ", response.status);
    upsert(std::move(response));
    return AddOutcome::Accepted;
}

void ResponseCollector::upsert(protocol::WorkerResponse response) {
    auto identity = response.worker_identity;
    responses_.insert_or_assign(std::move(identity), std::move(response));
}

bool ResponseCollector::keep_waiting(const CollectorPolicy& policy, Clock::duration elapsed,
                                     Clock::duration idle, std::size_t response_count) {
    if (elapsed >= policy.timeout) {
        return false;
    }
    if (policy.min_wait.count() > 0 && policy.timeout - elapsed < policy.min_wait) {
        return false;
    }
    if (policy.stop_on_quiet_period && response_count > 0 && idle >= policy.quiet_period) {
        return false;
    }
    return true;
}

bool ResponseCollector::keep_waiting(Clock::time_point now) const {
    return keep_waiting(policy_, now - start_, now - last_activity_, responses_.size());
}

std::optional<StopReason> ResponseCollector::stop_reason(Clock::time_point now) const {
    if (keep_waiting(now)) {
        return std::nullopt;
    }
    auto elapsed = now - start_;
    bool quiet = policy_.stop_on_quiet_period && !responses_.empty() &&
                 now - last_activity_ >= policy_.quiet_period;
    if (quiet && elapsed < policy_.timeout) {
        return StopReason::QuietPeriod;
    }
    return StopReason::Deadline;
}

Clock::duration ResponseCollector::remaining(Clock::time_point now) const {
    Clock::duration left = (start_ + policy_.timeout) - now;
    return std::max<Clock::duration>(left, Clock::duration::zero());
}

std::chrono::milliseconds ResponseCollector::next_wait(Clock::time_point now) const {
    Clock::duration wait = remaining(now);
    if (policy_.stop_on_quiet_period) {
        Clock::duration quiet_left = policy_.quiet_period;
        if (!responses_.empty()) {
            quiet_left = std::max<Clock::duration>(policy_.quiet_period - (now - last_activity_),
                                  Clock::duration::zero());
        }
        wait = std::min<Clock::duration>(wait, quiet_left);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(wait);
}

PingResult ResponseCollector::finish(StopReason reason) {
    PingResult result;
    result.responses = std::move(responses_);
    result.stop_reason = reason;
    responses_.clear();
    return result;
}

} // namespace pidbox
