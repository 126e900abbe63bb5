#include "core/pipeline.hpp"
#include "core/serialization.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace reviewgate {

struct TurnPipeline::TurnContext {
    TraceRecord rec;
    std::set<std::string> visible;
    RouterDecision decision;
    std::optional<ToolCall> call;
    std::optional<ToolResult> result;
    utils::Timer total;
};

TurnPipeline::TurnPipeline(PipelineComponents components)
    : c_(std::move(components)) {}

Result<TurnResponse> TurnPipeline::process(const TurnRequest& request) {
    total_turns_.fetch_add(1, std::memory_order_relaxed);

    const auto owner = c_.conversations->owner(request.conversation_id);
    const auto turn_mutex = c_.conversations->turn_lock(request.conversation_id);
    if (!owner || !turn_mutex) {
        return Result<TurnResponse>::error(ErrorCategory::NOT_FOUND,
            std::format("conversation {} does not exist", request.conversation_id));
    }
    if (*owner != request.user_id) {
        return Result<TurnResponse>::error(ErrorCategory::ACCESS_DENIED,
            std::format("conversation {} belongs to another user", request.conversation_id));
    }

    // One turn at a time per conversation, held until the turn is appended
    std::unique_lock turn_guard(*turn_mutex);

    const auto snapshot = c_.access->snapshot(request.user_id);
    if (!snapshot) {
        return Result<TurnResponse>::error(ErrorCategory::ACCESS_DENIED, "unknown or inactive user");
    }

    TurnContext ctx;
    ctx.visible = snapshot->visible;
    ctx.rec.user_id = request.user_id;
    ctx.rec.conversation_id = request.conversation_id;
    ctx.rec.turn_index = c_.conversations->next_turn_index(request.conversation_id);
    ctx.rec.access_version = snapshot->version;
    ctx.rec.utterance = request.utterance;

    try {
        run_layers(request, ctx);
    } catch (const std::exception& e) {
        utils::log::error(std::format("pipeline: turn {} of conversation {} aborted: {}",
                                      ctx.rec.turn_index, request.conversation_id, e.what()));
        ctx.result.reset();
        ctx.rec.result.clear();
        ctx.rec.result_kind.clear();
        ctx.rec.outcome = TurnOutcome::FAILED;
        ctx.rec.error_detail = std::format("internal error: {}", e.what());
    }

    return Result<TurnResponse>::ok(finish(request, ctx));
}

ConversationContext TurnPipeline::build_context(ConversationId id,
                                                const std::set<std::string>& visible) const {
    ConversationContext context;
    context.visible_categories = visible;
    for (const auto& turn : c_.conversations->recent(id, c_.history_window)) {
        context.history.push_back({"user", turn.utterance});
        context.history.push_back({"assistant",
            turn.final_call ? tool_args_to_json(turn.final_call->args) : std::string("(no answer)")});
    }
    return context;
}

void TurnPipeline::run_layers(const TurnRequest& request, TurnContext& ctx) {
    auto& rec = ctx.rec;
    utils::Timer timer;

    // Layer 1: Route
    ctx.decision = c_.router->route(request.utterance,
                                    build_context(request.conversation_id, ctx.visible),
                                    request.cancel);
    rec.route_time = timer.elapsed_us();
    rec.decision_status = ctx.decision.status;
    rec.proposed_tool = ctx.decision.raw_tool_name;
    rec.proposed_params = param_map_to_json(ctx.decision.params);
    rec.confidence = ctx.decision.confidence;
    rec.ambiguous = ctx.decision.ambiguous;
    rec.router_attempts = ctx.decision.attempts;
    rec.router_error = ctx.decision.last_error;

    // Layer 2: Validate
    timer.reset();
    const auto verdict = c_.validator->validate(ctx.decision, request.user_id);
    rec.validate_time = timer.elapsed_us();
    rec.verdict = verdict_to_string(verdict.verdict);
    rec.rejection_reason = verdict.reason;
    rec.offending_category = verdict.offending_category;
    rec.coercions = verdict.coercions;
    rec.validation_detail = verdict.detail;

    // Layer 3: Fallback (rejections only)
    if (verdict.is_valid()) {
        ctx.call = *verdict.call;
    } else {
        ctx.call = c_.fallback->resolve(verdict, request.user_id,
                                        c_.conversations->last_good_call(request.conversation_id));
        utils::log::warn(std::format("pipeline: user {} proposal rejected ({}), falling back to {}",
            request.user_id,
            verdict.reason ? rejection_reason_to_string(*verdict.reason) : "unknown",
            tool_name_to_string(ctx.call->tool())));
    }
    rec.final_call = tool_call_to_json(*ctx.call);
    rec.is_fallback = ctx.call->is_fallback;
    rec.fallback_rationale = ctx.call->fallback_rationale;

    if (request.cancel.is_cancelled()) {
        rec.outcome = TurnOutcome::CANCELLED;
        return;
    }

    // Layer 4: Execute
    timer.reset();
    auto executed = c_.executor->execute(*ctx.call, request.user_id);
    rec.execute_time = timer.elapsed_us();
    if (executed.is_error()) {
        rec.outcome = TurnOutcome::FAILED;
        rec.error_detail = std::format("{}: {}",
            error_category_to_string(executed.error_category()), executed.error_message());
        utils::log::error(std::format("pipeline: execute failed for user {}: {}",
                                      request.user_id, rec.error_detail));
        return;
    }

    ctx.result = std::move(executed.value());
    rec.result_kind = result_kind(*ctx.result);
    rec.result = tool_result_to_json(*ctx.result);
    rec.outcome = ctx.call->is_fallback ? TurnOutcome::FALLBACK : TurnOutcome::ANSWERED;
}

TurnResponse TurnPipeline::finish(const TurnRequest& request, TurnContext& ctx) {
    // Layer 5: Record
    ctx.rec.total_duration = ctx.total.elapsed_us();
    const auto committed = c_.trace->record(std::move(ctx.rec));

    TurnResponse response;
    response.trace_id = committed.trace_id;
    response.turn_index = committed.turn_index;
    response.outcome = committed.outcome;

    Turn turn;
    turn.utterance = request.utterance;
    turn.decision = std::move(ctx.decision);
    turn.final_call = ctx.call;
    turn.result = ctx.result;
    turn.trace_id = committed.trace_id;

    const auto appended = c_.conversations->append(request.conversation_id, request.user_id, std::move(turn));
    if (appended.is_ok()) {
        response.turn_index = appended.value();
    } else {
        utils::log::warn(std::format("pipeline: turn not stored for conversation {}: {}",
                                     request.conversation_id, appended.error_message()));
    }

    switch (committed.outcome) {
        case TurnOutcome::ANSWERED:
            answered_.fetch_add(1, std::memory_order_relaxed);
            break;
        case TurnOutcome::FALLBACK:
            fallbacks_.fetch_add(1, std::memory_order_relaxed);
            break;
        case TurnOutcome::CANCELLED:
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            response.error = "cancelled";
            return response;
        case TurnOutcome::FAILED:
            failed_.fetch_add(1, std::memory_order_relaxed);
            response.error = "internal failure";
            return response;
    }

    response.call = ctx.call;
    response.result = std::move(ctx.result);
    response.is_fallback = ctx.call->is_fallback;
    response.rejection_reason = ctx.call->rejection_reason;
    response.disclosure = FallbackPolicy::disclosure(*ctx.call);
    return response;
}

} // namespace reviewgate
