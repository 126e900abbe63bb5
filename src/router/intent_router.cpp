#include "router/intent_router.hpp"
#include "core/json.hpp"
#include "core/serialization.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace reviewgate {

namespace {

std::string strip_code_fence(std::string_view text) {
    auto s = utils::trim(text);
    if (s.rfind("```", 0) != 0) return s;

    const auto first_nl = s.find('\n');
    if (first_nl == std::string::npos) return {};
    s.erase(0, first_nl + 1);

    const auto close = s.rfind("```");
    if (close != std::string::npos) s.erase(close);
    return utils::trim(s);
}

std::optional<JsonValue> parse_lenient(const std::string& text) {
    if (auto doc = JsonValue::try_parse(text)) return doc;

    // Prose around the object: take the outermost {...}
    const auto open = text.find('{');
    const auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return std::nullopt;
    }
    return JsonValue::try_parse(std::string_view(text).substr(open, close - open + 1));
}

ParamValue to_param(const JsonValue& v) {
    if (v.is_boolean()) return *v.as_bool();
    if (v.is_integer()) {
        const double d = *v.as_double();
        if (d >= -9.0e18 && d <= 9.0e18) return static_cast<int64_t>(d);
        return d;
    }
    if (v.is_number()) return *v.as_double();
    if (v.is_string()) return *v.as_string();
    if (v.is_array()) {
        std::vector<std::string> out;
        for (const auto& e : v.elements()) {
            if (auto s = e.as_string()) {
                out.push_back(std::move(*s));
            } else if (e.is_number()) {
                out.push_back(std::format("{}", *e.as_double()));
            }
        }
        return out;
    }
    return std::monostate{};
}

} // anonymous namespace

IntentRouter::IntentRouter(std::shared_ptr<IInterpreterClient> client,
                           std::shared_ptr<const ToolRegistry> registry,
                           const Config& config)
    : client_(std::move(client)),
      registry_(std::move(registry)),
      config_(config),
      retry_(config.retry) {}

// ============================================================================
// Prompt Construction
// ============================================================================

std::string IntentRouter::system_prompt() const {
    return
        "You are a routing function for a product-review analytics service.\n"
        "Read the user's message and the recent conversation, then choose exactly ONE tool.\n"
        "Output ONLY a JSON object, no markdown:\n"
        "{\"tool\": \"<tool name>\", \"args\": {...}, \"confidence\": <0..1>, "
        "\"ambiguous\": <true|false>, \"rationale\": \"short\"}\n"
        "\n"
        "Tools:\n" + registry_->catalog_description() +
        "\n"
        "Rules:\n"
        "- \"why / reasons / complaints / issues\" -> sentiment_summary.\n"
        "- \"top / best / worst / NPS / ranking\" -> metrics_top_categories.\n"
        "- \"distribution / histogram of ratings\" -> rating_distribution.\n"
        "- \"compare X and Y\" -> compare_categories.\n"
        "- Dataset questions (how many categories, list categories, overall stats) -> general_query.\n"
        "- Categories must be taken from allowed_categories.\n"
        "- If the request is unclear, set ambiguous to true and confidence below 0.2.\n"
        "- If no tool fits, use the tool name \"unsupported\".\n";
}

std::string IntentRouter::user_prompt(const std::string& utterance,
                                      const ConversationContext& context) const {
    std::vector<std::string> categories;
    for (const auto& c : context.visible_categories) {
        if (categories.size() >= config_.max_categories) break;
        categories.push_back(c);
    }

    const size_t window = std::min(context.history.size(), config_.history_window);
    std::string history = "[";
    for (size_t i = context.history.size() - window; i < context.history.size(); ++i) {
        const auto& m = context.history[i];
        if (history.size() > 1) history += ',';
        history += std::format(R"({{"role":{},"content":{}}})",
            utils::json_string(m.role), utils::json_string(m.content));
    }
    history += ']';

    return std::format(R"({{"allowed_categories":{},"recent_messages":{},"user_message":{}}})",
        json_string_array(categories), history, utils::json_string(utterance));
}

// ============================================================================
// Reply Parsing
// ============================================================================

RouterDecision IntentRouter::parse_reply(const std::string& content, const ToolRegistry& registry) {
    const auto text = strip_code_fence(content);
    auto doc = parse_lenient(text);
    if (!doc) {
        return RouterDecision::malformed(0, "reply is not JSON");
    }

    // Accept [ {...} ]
    if (doc->is_array() && doc->size() > 0 && (*doc)[size_t{0}].is_object()) {
        doc = (*doc)[size_t{0}];
    }
    if (!doc->is_object()) {
        return RouterDecision::malformed(0, "reply is not a JSON object");
    }

    const auto tool_name = (*doc)["tool"].as_string();
    if (!tool_name) {
        return RouterDecision::malformed(0, "reply has no 'tool' string");
    }

    auto args = (*doc)["args"];
    if (args.is_null()) args = (*doc)["parameters"];
    if (!args.is_null() && !args.is_object()) {
        return RouterDecision::malformed(0, "'args' is not an object");
    }

    RouterDecision d;
    d.raw_tool_name = utils::trim(*tool_name);
    d.tool = parse_tool_name(d.raw_tool_name);
    d.status = (d.tool != ToolName::UNKNOWN && registry.lookup(d.tool))
        ? DecisionStatus::PROPOSED : DecisionStatus::UNKNOWN_TOOL;
    if (d.status == DecisionStatus::UNKNOWN_TOOL) d.tool = ToolName::UNKNOWN;

    for (const auto& [key, value] : args.items()) {
        d.params[key] = to_param(value);
    }

    // Confidence: absent means the interpreter expressed no doubt
    const auto conf = (*doc)["confidence"];
    if (conf.is_null()) {
        d.confidence = 1.0;
    } else if (const auto c = conf.as_double()) {
        d.confidence = std::clamp(*c, 0.0, 1.0);
    } else if (const auto s = conf.as_string()) {
        d.confidence = std::clamp(utils::try_parse_double(utils::trim(*s)).value_or(0.0), 0.0, 1.0);
    } else {
        d.confidence = 0.0;
    }

    d.ambiguous = doc->value("ambiguous", false);
    d.rationale = doc->value("rationale", std::string());
    return d;
}

// ============================================================================
// Routing
// ============================================================================

RouterDecision IntentRouter::route(const std::string& utterance,
                                   const ConversationContext& context,
                                   const CancellationToken& cancel) {
    routes_.fetch_add(1, std::memory_order_relaxed);

    const auto& rc = retry_.config();
    const auto deadline = std::chrono::steady_clock::now() + rc.overall_deadline;

    InterpreterRequest request;
    request.system_prompt = system_prompt();
    request.user_prompt = user_prompt(utterance, context);

    uint32_t attempts = 0;
    std::string last_error = "no attempt made";

    for (uint32_t attempt = 1; attempt <= rc.max_attempts; ++attempt) {
        if (cancel.is_cancelled()) {
            last_error = "cancelled";
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            last_error = "overall deadline exceeded";
            break;
        }

        request.timeout = std::min(rc.attempt_timeout, remaining);
        attempts = attempt;
        attempts_.fetch_add(1, std::memory_order_relaxed);

        const auto reply = client_->complete(request);
        if (reply.ok()) {
            auto decision = parse_reply(reply.content, *registry_);
            decision.attempts = attempts;
            if (decision.status == DecisionStatus::MALFORMED) {
                malformed_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("router: malformed interpreter reply: {}",
                                             decision.last_error));
            }
            return decision;
        }

        last_error = reply.error;
        if (reply.status == InterpreterReply::Status::PERMANENT) {
            utils::log::warn(std::format("router: non-retryable interpreter failure: {}", reply.error));
            break;
        }
        if (attempt == rc.max_attempts) break;

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto delay = std::min(retry_.backoff(attempt), std::max(left, std::chrono::milliseconds(0)));
        utils::log::warn(std::format("router: attempt {}/{} failed ({}), retrying in {}ms",
                                     attempt, rc.max_attempts, reply.error, delay.count()));
        retries_.fetch_add(1, std::memory_order_relaxed);
        if (!RetryPolicy::sleep_for(delay, cancel)) {
            last_error = "cancelled";
            break;
        }
    }

    unavailable_.fetch_add(1, std::memory_order_relaxed);
    return RouterDecision::unavailable(attempts, std::move(last_error));
}

IntentRouter::Stats IntentRouter::get_stats() const {
    return {
        .routes = routes_.load(std::memory_order_relaxed),
        .attempts = attempts_.load(std::memory_order_relaxed),
        .retries = retries_.load(std::memory_order_relaxed),
        .unavailable = unavailable_.load(std::memory_order_relaxed),
        .malformed = malformed_.load(std::memory_order_relaxed),
    };
}

} // namespace reviewgate
