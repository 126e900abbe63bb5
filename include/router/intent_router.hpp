#pragma once

#include "core/cancellation.hpp"
#include "core/types.hpp"
#include "router/interpreter_client.hpp"
#include "router/retry_policy.hpp"
#include "tools/tool_registry.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace reviewgate {

struct HistoryMessage {
    std::string role;      // "user" | "assistant"
    std::string content;
};

/**
 * @brief What the interpreter may see besides the utterance
 */
struct ConversationContext {
    std::vector<HistoryMessage> history;        // Oldest first
    std::set<std::string> visible_categories;
};

/**
 * @brief Turns an utterance into an untrusted RouterDecision
 *
 * Never throws and never touches data: transport failures end in the
 * INTERPRETER_UNAVAILABLE sentinel, unparseable replies in MALFORMED.
 * Transient failures are retried under RetryPolicy; permanent ones are not.
 */
class IntentRouter {
public:
    struct Config {
        size_t history_window = 6;
        size_t max_categories = 200;
        RetryPolicy::Config retry;
    };

    IntentRouter(std::shared_ptr<IInterpreterClient> client,
                 std::shared_ptr<const ToolRegistry> registry,
                 const Config& config);

    [[nodiscard]] RouterDecision route(const std::string& utterance,
                                       const ConversationContext& context,
                                       const CancellationToken& cancel = {});

    [[nodiscard]] std::string system_prompt() const;
    [[nodiscard]] std::string user_prompt(const std::string& utterance,
                                          const ConversationContext& context) const;

    /**
     * @brief Parse interpreter text into a decision
     *
     * Accepts a JSON object or a one-element array of objects, optionally
     * wrapped in a markdown code fence or surrounded by prose.
     */
    [[nodiscard]] static RouterDecision parse_reply(const std::string& content,
                                                    const ToolRegistry& registry);

    struct Stats {
        uint64_t routes;
        uint64_t attempts;
        uint64_t retries;
        uint64_t unavailable;
        uint64_t malformed;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<IInterpreterClient> client_;
    std::shared_ptr<const ToolRegistry> registry_;
    Config config_;
    RetryPolicy retry_;

    std::atomic<uint64_t> routes_{0};
    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> unavailable_{0};
    std::atomic<uint64_t> malformed_{0};
};

} // namespace reviewgate
