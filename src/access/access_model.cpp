#include "access/access_model.hpp"

namespace reviewgate {

AccessModel::AccessModel(std::shared_ptr<IUserDirectory> directory,
                         std::shared_ptr<ICategoryCatalog> catalog)
    : directory_(std::move(directory)),
      catalog_(std::move(catalog)) {}

std::optional<UserRecord> AccessModel::active_user(UserId user_id) const {
    auto user = directory_->find_user(user_id);
    if (!user || !user->active) return std::nullopt;
    return user;
}

std::set<std::string> AccessModel::visible_for(const UserRecord& user) const {
    if (user.role == Role::ADMIN) {
        return catalog_ ? catalog_->list_categories() : std::set<std::string>{};
    }
    return user.categories;
}

AccessDecision AccessModel::authorize(UserId user_id, const std::string& category) const {
    const auto user = active_user(user_id);
    if (!user) return AccessDecision::DENIED;

    if (user->role == Role::ADMIN) {
        if (!catalog_) return AccessDecision::DENIED;
        return catalog_->list_categories().contains(category)
            ? AccessDecision::ALLOWED : AccessDecision::DENIED;
    }
    return user->categories.contains(category)
        ? AccessDecision::ALLOWED : AccessDecision::DENIED;
}

std::set<std::string> AccessModel::resolve_visible_categories(UserId user_id) const {
    const auto user = active_user(user_id);
    if (!user) return {};
    return visible_for(*user);
}

uint64_t AccessModel::current_access_version(UserId user_id) const {
    const auto user = directory_->find_user(user_id);
    return user ? user->access_version : 0;
}

std::optional<AccessSnapshot> AccessModel::snapshot(UserId user_id) const {
    const auto user = active_user(user_id);
    if (!user) return std::nullopt;
    return AccessSnapshot{
        .user_id = user->id,
        .role = user->role,
        .version = user->access_version,
        .visible = visible_for(*user),
    };
}

bool AccessModel::is_admin(UserId user_id) const {
    const auto user = active_user(user_id);
    return user && user->role == Role::ADMIN;
}

} // namespace reviewgate
