#include "access/user_directory.hpp"

#include <algorithm>
#include <format>

namespace reviewgate {

InMemoryUserDirectory::InMemoryUserDirectory(std::vector<UserRecord> users) {
    for (auto& u : users) {
        users_[u.id] = std::move(u);
    }
}

void InMemoryUserDirectory::upsert(UserRecord user) {
    std::lock_guard lock(mutex_);
    users_[user.id] = std::move(user);
}

void InMemoryUserDirectory::set_catalog(std::shared_ptr<const ICategoryCatalog> catalog) {
    std::lock_guard lock(mutex_);
    catalog_ = std::move(catalog);
}

std::optional<UserRecord> InMemoryUserDirectory::find_user(UserId id) {
    std::lock_guard lock(mutex_);
    const auto it = users_.find(id);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

std::optional<UserRecord> InMemoryUserDirectory::find_by_api_key(const std::string& api_key) {
    if (api_key.empty()) return std::nullopt;
    std::lock_guard lock(mutex_);
    for (const auto& [id, user] : users_) {
        if (user.api_key == api_key) return user;
    }
    return std::nullopt;
}

Result<uint64_t> InMemoryUserDirectory::set_user_categories(
    UserId id, const std::set<std::string>& categories) {
    std::lock_guard lock(mutex_);
    const auto it = users_.find(id);
    if (it == users_.end()) {
        return Result<uint64_t>::error(ErrorCategory::NOT_FOUND,
            std::format("user {} not found", id));
    }
    if (catalog_) {
        const auto known = catalog_->list_categories();
        for (const auto& category : categories) {
            if (!known.contains(category)) {
                return Result<uint64_t>::error(ErrorCategory::INVALID_REQUEST,
                    std::format("unknown category '{}'", category));
            }
        }
    }
    it->second.categories = categories;
    ++it->second.access_version;
    return Result<uint64_t>::ok(it->second.access_version);
}

std::vector<UserRecord> InMemoryUserDirectory::list_users() {
    std::lock_guard lock(mutex_);
    std::vector<UserRecord> out;
    out.reserve(users_.size());
    for (const auto& [id, user] : users_) {
        out.push_back(user);
    }
    std::sort(out.begin(), out.end(),
              [](const UserRecord& a, const UserRecord& b) { return a.id < b.id; });
    return out;
}

} // namespace reviewgate
