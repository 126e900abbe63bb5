#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace reviewgate {

/**
 * @brief Source of persisted users and their category grants
 *
 * Every read returns a copy taken under the implementation's own
 * consistency guarantee (mutex, SQL transaction). Grant mutation is the
 * only write path and always advances access_version.
 */
class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    [[nodiscard]] virtual std::optional<UserRecord> find_user(UserId id) = 0;

    [[nodiscard]] virtual std::optional<UserRecord> find_by_api_key(const std::string& api_key) = 0;

    /**
     * @brief Replace a user's grant set and bump access_version
     * @return the new access_version, or an error
     */
    [[nodiscard]] virtual Result<uint64_t> set_user_categories(
        UserId id, const std::set<std::string>& categories) = 0;

    [[nodiscard]] virtual std::vector<UserRecord> list_users() = 0;
};

/**
 * @brief The universal category set (what an admin sees)
 */
class ICategoryCatalog {
public:
    virtual ~ICategoryCatalog() = default;

    [[nodiscard]] virtual std::set<std::string> list_categories() const = 0;
};

/**
 * @brief Mutex-guarded directory seeded from [[users]] configuration
 */
class InMemoryUserDirectory : public IUserDirectory {
public:
    InMemoryUserDirectory() = default;
    explicit InMemoryUserDirectory(std::vector<UserRecord> users);

    /// Insert or replace a user record.
    void upsert(UserRecord user);

    /// Grants naming a category outside `catalog` are refused with INVALID_REQUEST.
    void set_catalog(std::shared_ptr<const ICategoryCatalog> catalog);

    [[nodiscard]] std::optional<UserRecord> find_user(UserId id) override;
    [[nodiscard]] std::optional<UserRecord> find_by_api_key(const std::string& api_key) override;
    [[nodiscard]] Result<uint64_t> set_user_categories(
        UserId id, const std::set<std::string>& categories) override;
    [[nodiscard]] std::vector<UserRecord> list_users() override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, UserRecord> users_;
    std::shared_ptr<const ICategoryCatalog> catalog_;
};

} // namespace reviewgate
