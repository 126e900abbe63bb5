#include "trace/trace_recorder.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <format>

namespace reviewgate {

const char* turn_outcome_to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::ANSWERED:  return "answered";
        case TurnOutcome::FALLBACK:  return "fallback";
        case TurnOutcome::FAILED:    return "failed";
        case TurnOutcome::CANCELLED: return "cancelled";
        default:                     return "unknown";
    }
}

namespace {

void append_identity(std::string& out, const TraceRecord& r) {
    out += std::format("\"trace_id\":\"{}\",\"sequence_num\":{},\"timestamp\":\"{}\",",
                       r.trace_id, r.sequence_num, utils::format_timestamp(r.timestamp));
    out += std::format("\"user_id\":{},\"conversation_id\":{},\"turn_index\":{},\"access_version\":{},",
                       r.user_id, r.conversation_id, r.turn_index, r.access_version);
    out += std::format("\"utterance\":{},", utils::json_string(r.utterance));
}

void append_router(std::string& out, const TraceRecord& r) {
    out += std::format("\"router\":{{\"status\":\"{}\",\"tool\":{},\"params\":{},"
                       "\"confidence\":{:.3f},\"ambiguous\":{},\"attempts\":{}",
                       decision_status_to_string(r.decision_status),
                       utils::json_string(r.proposed_tool),
                       r.proposed_params.empty() ? "{}" : r.proposed_params,
                       r.confidence, utils::booltostr(r.ambiguous), r.router_attempts);
    if (!r.router_error.empty()) {
        out += std::format(",\"error\":{}", utils::json_string(r.router_error));
    }
    out += "},";
}

void append_validation(std::string& out, const TraceRecord& r) {
    out += std::format("\"validation\":{{\"verdict\":\"{}\"", r.verdict);
    if (r.rejection_reason) {
        out += std::format(",\"rejection_reason\":\"{}\"", rejection_reason_to_string(*r.rejection_reason));
    }
    if (r.offending_category) {
        out += std::format(",\"offending_category\":{}", utils::json_string(*r.offending_category));
    }
    if (!r.coercions.empty()) {
        out += ",\"coercions\":[";
        for (size_t i = 0; i < r.coercions.size(); ++i) {
            if (i > 0) out += ',';
            out += std::format("{{\"param\":{},\"requested\":{},\"applied\":{}}}",
                               utils::json_string(r.coercions[i].param),
                               utils::json_string(r.coercions[i].requested),
                               utils::json_string(r.coercions[i].applied));
        }
        out += ']';
    }
    if (!r.validation_detail.empty()) {
        out += std::format(",\"detail\":{}", utils::json_string(r.validation_detail));
    }
    out += "},";
}

void append_execution(std::string& out, const TraceRecord& r) {
    out += std::format("\"final_call\":{},\"is_fallback\":{},",
                       r.final_call.empty() ? "null" : r.final_call,
                       utils::booltostr(r.is_fallback));
    if (!r.fallback_rationale.empty()) {
        out += std::format("\"fallback_rationale\":{},", utils::json_string(r.fallback_rationale));
    }
    out += std::format("\"result_kind\":{},\"result\":{},\"outcome\":\"{}\",",
                       utils::json_string(r.result_kind),
                       r.result.empty() ? "null" : r.result,
                       turn_outcome_to_string(r.outcome));
    if (!r.error_detail.empty()) {
        out += std::format("\"error\":{},", utils::json_string(r.error_detail));
    }
}

void append_performance(std::string& out, const TraceRecord& r) {
    out += std::format(
        "\"route_time_us\":{},\"validate_time_us\":{},\"execute_time_us\":{},\"total_duration_us\":{},",
        r.route_time.count(), r.validate_time.count(), r.execute_time.count(),
        r.total_duration.count());
}

void append_integrity(std::string& out, const TraceRecord& r) {
    out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                       r.record_hash, r.previous_hash);
}

} // anonymous namespace

TraceRecorder::TraceRecorder(std::shared_ptr<AccessModel> access, const Config& config)
    : access_(std::move(access)), config_(config) {
    if (config_.memory_window == 0) config_.memory_window = 1;
}

TraceRecorder::~TraceRecorder() {
    shutdown();
}

void TraceRecorder::add_sink(std::unique_ptr<ITraceSink> sink) {
    std::lock_guard lock(mutex_);
    utils::log::info(std::format("trace: sink {} attached", sink->name()));
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// Append
// ============================================================================

TraceRecord TraceRecorder::record(TraceRecord rec) {
    std::lock_guard lock(mutex_);

    rec.sequence_num = next_sequence_++;
    rec.timestamp = std::chrono::system_clock::now();
    rec.previous_hash = previous_hash_;
    rec.record_hash = compute_record_hash(rec, previous_hash_);
    previous_hash_ = rec.record_hash;

    const auto line = to_json(rec);
    for (const auto& sink : sinks_) {
        if (!sink->write(line)) {
            ++sink_write_failures_;
            utils::log::error(std::format("trace: write to {} failed (seq {})",
                                          sink->name(), rec.sequence_num));
        }
    }

    window_.push_back(rec);
    while (window_.size() > config_.memory_window) {
        window_.pop_front();
    }
    return rec;
}

// ============================================================================
// Query
// ============================================================================

Result<std::vector<TraceRecord>> TraceRecorder::recent(UserId requester, size_t limit) const {
    if (!access_->is_admin(requester)) {
        return Result<std::vector<TraceRecord>>::error(
            ErrorCategory::ACCESS_DENIED, "trace access requires an active admin");
    }

    std::vector<TraceRecord> out;
    std::lock_guard lock(mutex_);
    out.reserve(std::min(limit, window_.size()));
    for (auto it = window_.rbegin(); it != window_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return Result<std::vector<TraceRecord>>::ok(std::move(out));
}

void TraceRecorder::flush() {
    std::lock_guard lock(mutex_);
    for (const auto& sink : sinks_) sink->flush();
}

void TraceRecorder::shutdown() {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    for (const auto& sink : sinks_) sink->shutdown();
}

// ============================================================================
// Serialization & Integrity
// ============================================================================

std::string TraceRecorder::to_json(const TraceRecord& rec) {
    std::string result;
    result.reserve(1024);
    result += '{';
    append_identity(result, rec);
    append_router(result, rec);
    append_validation(result, rec);
    append_execution(result, rec);
    append_performance(result, rec);
    append_integrity(result, rec);
    result += '}';
    return result;
}

std::string TraceRecorder::compute_record_hash(const TraceRecord& rec,
                                               const std::string& previous_hash) {
    // sequence|timestamp|user|conversation|turn|utterance|final_call|outcome|result|previous
    std::string input;
    input.reserve(256 + rec.utterance.size() + rec.final_call.size() + rec.result.size());
    input += std::format("{}|{}|{}|{}|{}|", rec.sequence_num,
                         utils::format_timestamp(rec.timestamp),
                         rec.user_id, rec.conversation_id, rec.turn_index);
    input += rec.utterance;
    input += '|';
    input += rec.final_call;
    input += '|';
    input += turn_outcome_to_string(rec.outcome);
    input += '|';
    input += rec.result;
    input += '|';
    input += previous_hash;

    return utils::sha256_hex(input);
}

bool TraceRecorder::verify_chain(const std::vector<TraceRecord>& oldest_first) {
    for (size_t i = 0; i < oldest_first.size(); ++i) {
        const auto& rec = oldest_first[i];
        if (i > 0 && rec.previous_hash != oldest_first[i - 1].record_hash) return false;
        if (compute_record_hash(rec, rec.previous_hash) != rec.record_hash) return false;
    }
    return true;
}

TraceRecorder::Stats TraceRecorder::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .total_recorded = next_sequence_ - 1,
        .sink_write_failures = sink_write_failures_,
        .window_size = window_.size(),
    };
}

} // namespace reviewgate
