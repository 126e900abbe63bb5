#include "conversation/conversation_store.hpp"

#include <algorithm>
#include <format>

namespace reviewgate {

ConversationStore::ConversationStore(const Config& config)
    : config_(config) {
    if (config_.max_turns_per_conversation == 0) config_.max_turns_per_conversation = 1;
    if (config_.max_conversations_per_user == 0) config_.max_conversations_per_user = 1;
}

ConversationId ConversationStore::open(UserId user_id) {
    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    conversations_[id].owner = user_id;

    auto& owned = by_user_[user_id];
    owned.push_back(id);
    while (owned.size() > config_.max_conversations_per_user) {
        conversations_.erase(owned.front());
        owned.pop_front();
    }
    return id;
}

std::optional<ConversationId> ConversationStore::latest_for(UserId user_id) const {
    std::lock_guard lock(mutex_);
    const auto it = by_user_.find(user_id);
    if (it == by_user_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

size_t ConversationStore::conversation_count(UserId user_id) const {
    std::lock_guard lock(mutex_);
    const auto it = by_user_.find(user_id);
    return it == by_user_.end() ? 0 : it->second.size();
}

std::shared_ptr<std::mutex> ConversationStore::turn_lock(ConversationId id) const {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) return nullptr;
    return it->second.turn_mutex;
}

Result<uint64_t> ConversationStore::append(ConversationId id, UserId user_id, Turn turn) {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) {
        return Result<uint64_t>::error(ErrorCategory::NOT_FOUND,
                                       std::format("conversation {} does not exist", id));
    }
    auto& conv = it->second;
    if (conv.owner != user_id) {
        return Result<uint64_t>::error(ErrorCategory::ACCESS_DENIED,
                                       std::format("conversation {} belongs to another user", id));
    }

    turn.index = conv.next_index++;
    conv.turns.push_back(std::move(turn));
    if (conv.turns.size() > config_.max_turns_per_conversation) {
        conv.turns.erase(conv.turns.begin());
    }
    return Result<uint64_t>::ok(conv.turns.back().index);
}

std::vector<Turn> ConversationStore::recent(ConversationId id, size_t n) const {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) return {};

    const auto& turns = it->second.turns;
    const size_t count = std::min(n, turns.size());
    return {turns.end() - static_cast<std::ptrdiff_t>(count), turns.end()};
}

std::optional<ToolCall> ConversationStore::last_good_call(ConversationId id) const {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) return std::nullopt;

    const auto& turns = it->second.turns;
    for (auto t = turns.rbegin(); t != turns.rend(); ++t) {
        if (t->final_call && t->result && !t->final_call->is_fallback) return t->final_call;
    }
    return std::nullopt;
}

std::optional<UserId> ConversationStore::owner(ConversationId id) const {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) return std::nullopt;
    return it->second.owner;
}

uint64_t ConversationStore::next_turn_index(ConversationId id) const {
    std::lock_guard lock(mutex_);
    const auto it = conversations_.find(id);
    return it == conversations_.end() ? 0 : it->second.next_index;
}

} // namespace reviewgate
