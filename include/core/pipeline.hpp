#pragma once

#include "access/access_model.hpp"
#include "conversation/conversation_store.hpp"
#include "core/cancellation.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "executor/tool_executor.hpp"
#include "fallback/fallback_policy.hpp"
#include "router/intent_router.hpp"
#include "trace/trace_recorder.hpp"
#include "validator/validator.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace reviewgate {

struct PipelineComponents {
    std::shared_ptr<AccessModel> access;
    std::shared_ptr<IntentRouter> router;
    std::shared_ptr<Validator> validator;
    std::shared_ptr<FallbackPolicy> fallback;
    std::shared_ptr<ToolExecutor> executor;
    std::shared_ptr<TraceRecorder> trace;
    std::shared_ptr<ConversationStore> conversations;

    size_t history_window = 6;    // Turns handed to the router as context
};

struct TurnRequest {
    UserId user_id = 0;
    ConversationId conversation_id = 0;
    std::string utterance;
    CancellationToken cancel;
};

struct TurnResponse {
    uint64_t turn_index = 0;
    std::string trace_id;
    TurnOutcome outcome = TurnOutcome::FAILED;
    std::optional<ToolCall> call;
    std::optional<ToolResult> result;
    bool is_fallback = false;
    std::optional<RejectionReason> rejection_reason;
    std::string disclosure;
    std::string error;            // Opaque; never carries internal detail
};

/**
 * @brief Turn coordinator - orchestrates the 5-layer flow for one utterance
 *
 * Layers:
 * 1. Route    (interpreter proposal, bounded retries)
 * 2. Validate (registry schema + authorization)
 * 3. Fallback (only on rejection)
 * 4. Execute  (scoped read, access cache)
 * 5. Record   (trace append, then the Turn joins the conversation)
 *
 * Layers run strictly in order and a Turn is never re-entered. Every Turn
 * that gets past the ownership check is traced, including cancelled and
 * failed ones.
 */
class TurnPipeline {
public:
    explicit TurnPipeline(PipelineComponents components);

    /**
     * @brief Process one utterance
     * @return NOT_FOUND / ACCESS_DENIED when the conversation or user is not
     *         usable; otherwise a response whose outcome says what happened
     */
    [[nodiscard]] Result<TurnResponse> process(const TurnRequest& request);

    [[nodiscard]] std::shared_ptr<ConversationStore> conversations() const { return c_.conversations; }
    [[nodiscard]] std::shared_ptr<TraceRecorder> trace() const { return c_.trace; }
    [[nodiscard]] std::shared_ptr<AccessModel> access() const { return c_.access; }

    struct Stats {
        uint64_t total_turns;
        uint64_t answered;
        uint64_t fallbacks;
        uint64_t failed;
        uint64_t cancelled;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_turns = total_turns_.load(std::memory_order_relaxed),
            .answered = answered_.load(std::memory_order_relaxed),
            .fallbacks = fallbacks_.load(std::memory_order_relaxed),
            .failed = failed_.load(std::memory_order_relaxed),
            .cancelled = cancelled_.load(std::memory_order_relaxed),
        };
    }

private:
    struct TurnContext;

    [[nodiscard]] ConversationContext build_context(ConversationId id,
                                                    const std::set<std::string>& visible) const;
    void run_layers(const TurnRequest& request, TurnContext& ctx);
    [[nodiscard]] TurnResponse finish(const TurnRequest& request, TurnContext& ctx);

    PipelineComponents c_;

    std::atomic<uint64_t> total_turns_{0};
    std::atomic<uint64_t> answered_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
};

} // namespace reviewgate
