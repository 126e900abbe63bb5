#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reviewgate {

enum class TurnOutcome {
    ANSWERED,   // Validated call executed
    FALLBACK,   // Rejected proposal replaced by a fallback call
    FAILED,     // Data source or internal failure; nothing shown but "internal failure"
    CANCELLED   // Abandoned before Execute
};

[[nodiscard]] const char* turn_outcome_to_string(TurnOutcome outcome);

// ============================================================================
// Trace Record
// ============================================================================

/**
 * @brief Append-only audit row for one Turn
 *
 * Self-contained: calls and results are stored in their serialized form so
 * a record never references pipeline-owned state. sequence_num, timestamp
 * and the hash pair are assigned by TraceRecorder::record.
 */
struct TraceRecord {
    std::string trace_id;
    uint64_t sequence_num = 0;
    std::chrono::system_clock::time_point timestamp;

    // Who / where
    UserId user_id = 0;
    ConversationId conversation_id = 0;
    uint64_t turn_index = 0;
    uint64_t access_version = 0;
    std::string utterance;

    // Router
    DecisionStatus decision_status = DecisionStatus::MALFORMED;
    std::string proposed_tool;
    std::string proposed_params;        // JSON object
    double confidence = 0.0;
    bool ambiguous = false;
    uint32_t router_attempts = 0;
    std::string router_error;

    // Validator
    std::string verdict;
    std::optional<RejectionReason> rejection_reason;
    std::optional<std::string> offending_category;
    std::vector<Coercion> coercions;
    std::string validation_detail;

    // Final call
    std::string final_call;             // JSON, empty when nothing was chosen
    bool is_fallback = false;
    std::string fallback_rationale;

    // Result
    std::string result_kind;
    std::string result;                 // JSON, empty when nothing executed
    TurnOutcome outcome = TurnOutcome::FAILED;
    std::string error_detail;

    // Timings
    std::chrono::microseconds route_time{0};
    std::chrono::microseconds validate_time{0};
    std::chrono::microseconds execute_time{0};
    std::chrono::microseconds total_duration{0};

    // Integrity (hash chain)
    std::string record_hash;
    std::string previous_hash;

    TraceRecord() : trace_id(utils::generate_uuid()) {}
};

} // namespace reviewgate
