#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reviewgate {

/**
 * @brief One completed exchange. Immutable once appended.
 */
struct Turn {
    uint64_t index = 0;                     // Assigned by ConversationStore::append
    std::string utterance;
    RouterDecision decision;
    std::optional<ToolCall> final_call;     // Absent when the turn failed before selection
    std::optional<ToolResult> result;       // Absent when nothing executed
    std::string trace_id;
};

/**
 * @brief In-process conversations keyed by explicit id
 *
 * Every call names the conversation; nothing here infers it from the
 * user. Appends are refused for anyone but the owner.
 */
class ConversationStore {
public:
    struct Config {
        size_t max_turns_per_conversation = 200;   // Oldest turns dropped beyond this
        size_t max_conversations_per_user = 50;    // Oldest conversation evicted beyond this
    };

    ConversationStore() : ConversationStore(Config{}) {}
    explicit ConversationStore(const Config& config);

    /**
     * @brief Start a conversation owned by `user_id`
     *
     * When the user already holds max_conversations_per_user
     * conversations the oldest one is evicted with all its turns.
     */
    [[nodiscard]] ConversationId open(UserId user_id);

    /// Most recently opened live conversation of `user_id`.
    [[nodiscard]] std::optional<ConversationId> latest_for(UserId user_id) const;

    /**
     * @brief Append a turn and assign its index
     * @return the index, NOT_FOUND for an unknown conversation or
     *         ACCESS_DENIED when `user_id` is not the owner
     */
    [[nodiscard]] Result<uint64_t> append(ConversationId id, UserId user_id, Turn turn);

    /// Up to `n` most recent turns, oldest first.
    [[nodiscard]] std::vector<Turn> recent(ConversationId id, size_t n) const;

    /// Most recent non-fallback call that produced a result, if any.
    [[nodiscard]] std::optional<ToolCall> last_good_call(ConversationId id) const;

    [[nodiscard]] std::optional<UserId> owner(ConversationId id) const;

    /// Index the next appended turn will receive (0 for unknown conversations).
    [[nodiscard]] uint64_t next_turn_index(ConversationId id) const;

    /**
     * @brief Mutex serializing whole turns on one conversation
     *
     * Held from reading the history until the turn is appended, so the
     * index a turn is traced under is the index it is stored under.
     * nullptr for an unknown conversation.
     */
    [[nodiscard]] std::shared_ptr<std::mutex> turn_lock(ConversationId id) const;

    [[nodiscard]] size_t conversation_count(UserId user_id) const;

private:
    struct Conversation {
        UserId owner = 0;
        uint64_t next_index = 0;
        std::vector<Turn> turns;
        std::shared_ptr<std::mutex> turn_mutex = std::make_shared<std::mutex>();
    };

    Config config_;
    mutable std::mutex mutex_;
    ConversationId next_id_ = 1;
    std::unordered_map<ConversationId, Conversation> conversations_;
    std::unordered_map<UserId, std::deque<ConversationId>> by_user_;   // Oldest first
};

} // namespace reviewgate
