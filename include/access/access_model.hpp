#pragma once

#include "access/user_directory.hpp"
#include "core/types.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>

namespace reviewgate {

enum class AccessDecision {
    ALLOWED,
    DENIED
};

/**
 * @brief One consistent read of a user's scope
 *
 * role, visible set and version come from the same directory read, so a
 * cache key built from `version` always describes `visible`.
 */
struct AccessSnapshot {
    UserId user_id = 0;
    Role role = Role::ANALYST;
    uint64_t version = 0;
    std::set<std::string> visible;
};

/**
 * @brief Resolves category visibility for a user
 *
 * Admins see the full catalog; analysts see exactly their persisted grant.
 * Unknown or inactive users see nothing. Every call reads the directory
 * afresh; nothing here is cached.
 */
class AccessModel {
public:
    AccessModel(std::shared_ptr<IUserDirectory> directory,
                std::shared_ptr<ICategoryCatalog> catalog);

    [[nodiscard]] AccessDecision authorize(UserId user_id, const std::string& category) const;

    [[nodiscard]] std::set<std::string> resolve_visible_categories(UserId user_id) const;

    /// 0 for unknown users.
    [[nodiscard]] uint64_t current_access_version(UserId user_id) const;

    [[nodiscard]] std::optional<AccessSnapshot> snapshot(UserId user_id) const;

    /// True only for active admins.
    [[nodiscard]] bool is_admin(UserId user_id) const;

    [[nodiscard]] IUserDirectory& directory() const { return *directory_; }

private:
    [[nodiscard]] std::optional<UserRecord> active_user(UserId user_id) const;
    [[nodiscard]] std::set<std::string> visible_for(const UserRecord& user) const;

    std::shared_ptr<IUserDirectory> directory_;
    std::shared_ptr<ICategoryCatalog> catalog_;
};

} // namespace reviewgate
