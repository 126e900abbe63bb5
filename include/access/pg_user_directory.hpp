#pragma once

#include "access/user_directory.hpp"
#include "db/pg_connection.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace reviewgate {

/**
 * @brief User directory backed by PostgreSQL
 *
 * Schema:
 *   users(id, email, role, is_active, access_version, api_key)
 *   categories(id, name UNIQUE)
 *   user_category_access(user_id, category_id) UNIQUE(user_id, category_id)
 *
 * A single connection guarded by a mutex. Reads of a user and their grant
 * run in one REPEATABLE READ transaction; grant mutation runs the delete,
 * insert and version bump in one transaction.
 */
class PgUserDirectory : public IUserDirectory {
public:
    struct Config {
        std::string connection_string;
        uint32_t query_timeout_ms = 5000;
    };

    /// Throws std::runtime_error if the connection cannot be established.
    explicit PgUserDirectory(const Config& config);

    /// Takes an already-open connection (tests, tooling).
    explicit PgUserDirectory(std::unique_ptr<PgConnection> conn);

    [[nodiscard]] std::optional<UserRecord> find_user(UserId id) override;
    [[nodiscard]] std::optional<UserRecord> find_by_api_key(const std::string& api_key) override;
    [[nodiscard]] Result<uint64_t> set_user_categories(
        UserId id, const std::set<std::string>& categories) override;
    [[nodiscard]] std::vector<UserRecord> list_users() override;

private:
    /// Caller holds mutex_ and has opened a transaction.
    std::optional<UserRecord> load_user_locked(const std::string& where_sql,
                                               const std::string& param);
    bool exec_locked(const std::string& sql);

    std::mutex mutex_;
    std::unique_ptr<PgConnection> conn_;
};

} // namespace reviewgate
