#include "access/pg_user_directory.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace reviewgate {

namespace {

constexpr const char* kUserColumns =
    "SELECT id, email, role, is_active, access_version, COALESCE(api_key, '') FROM users ";

constexpr const char* kGrantQuery =
    "SELECT c.name FROM categories c "
    "JOIN user_category_access uca ON uca.category_id = c.id "
    "WHERE uca.user_id = $1 ORDER BY c.name";

std::optional<UserRecord> row_to_user(const std::vector<std::string>& row) {
    if (row.size() < 6) return std::nullopt;
    const auto id = utils::try_parse_int<int64_t>(row[0]);
    const auto role = parse_role(row[2]);
    const auto version = utils::try_parse_int<uint64_t>(row[4]);
    if (!id || !role || !version) return std::nullopt;

    UserRecord user;
    user.id = *id;
    user.name = row[1];
    user.role = *role;
    user.active = (row[3] == "t" || row[3] == "true");
    user.access_version = *version;
    user.api_key = row[5];
    return user;
}

} // anonymous namespace

PgUserDirectory::PgUserDirectory(const Config& config)
    : conn_(PgConnection::connect(config.connection_string)) {
    if (!conn_) {
        throw std::runtime_error("PgUserDirectory: cannot connect to user database");
    }
    if (config.query_timeout_ms > 0 && !conn_->set_query_timeout(config.query_timeout_ms)) {
        utils::log::warn("PgUserDirectory: failed to set statement_timeout");
    }
}

PgUserDirectory::PgUserDirectory(std::unique_ptr<PgConnection> conn)
    : conn_(std::move(conn)) {
    if (!conn_) {
        throw std::runtime_error("PgUserDirectory: null connection");
    }
}

bool PgUserDirectory::exec_locked(const std::string& sql) {
    const auto res = conn_->execute(sql);
    if (!res.success) {
        utils::log::error(std::format("PgUserDirectory: '{}' failed: {}", sql, res.error_message));
    }
    return res.success;
}

std::optional<UserRecord> PgUserDirectory::load_user_locked(const std::string& where_sql,
                                                            const std::string& param) {
    const auto res = conn_->execute_params(std::string(kUserColumns) + where_sql, {param});
    if (!res.success) {
        utils::log::error(std::format("PgUserDirectory: user lookup failed: {}", res.error_message));
        return std::nullopt;
    }
    if (res.rows.empty()) return std::nullopt;

    auto user = row_to_user(res.rows.front());
    if (!user) return std::nullopt;

    const auto grants = conn_->execute_params(kGrantQuery, {std::to_string(user->id)});
    if (!grants.success) {
        utils::log::error(std::format("PgUserDirectory: grant lookup failed: {}", grants.error_message));
        return std::nullopt;
    }
    for (const auto& row : grants.rows) {
        if (!row.empty()) user->categories.insert(row[0]);
    }
    return user;
}

std::optional<UserRecord> PgUserDirectory::find_user(UserId id) {
    std::lock_guard lock(mutex_);
    if (!exec_locked("BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY")) return std::nullopt;
    auto user = load_user_locked("WHERE id = $1", std::to_string(id));
    (void)exec_locked("COMMIT");
    return user;
}

std::optional<UserRecord> PgUserDirectory::find_by_api_key(const std::string& api_key) {
    if (api_key.empty()) return std::nullopt;
    std::lock_guard lock(mutex_);
    if (!exec_locked("BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY")) return std::nullopt;
    auto user = load_user_locked("WHERE api_key = $1", api_key);
    (void)exec_locked("COMMIT");
    return user;
}

Result<uint64_t> PgUserDirectory::set_user_categories(
    UserId id, const std::set<std::string>& categories) {
    std::lock_guard lock(mutex_);
    const auto fail = [this](const std::string& what, const std::string& detail) {
        (void)exec_locked("ROLLBACK");
        return Result<uint64_t>::error(ErrorCategory::DATA_SOURCE_ERROR,
            std::format("{}: {}", what, detail));
    };

    if (!exec_locked("BEGIN")) {
        return Result<uint64_t>::error(ErrorCategory::DATA_SOURCE_ERROR, "cannot open transaction");
    }

    const auto uid = std::to_string(id);

    auto del = conn_->execute_params(
        "DELETE FROM user_category_access WHERE user_id = $1", {uid});
    if (!del.success) return fail("clear grants", del.error_message);

    for (const auto& category : categories) {
        auto ins = conn_->execute_params(
            "INSERT INTO user_category_access (user_id, category_id) "
            "SELECT $1, id FROM categories WHERE name = $2", {uid, category});
        if (!ins.success) return fail("insert grant", ins.error_message);
        if (ins.affected_rows == 0) {
            (void)exec_locked("ROLLBACK");
            return Result<uint64_t>::error(ErrorCategory::INVALID_REQUEST,
                std::format("unknown category '{}'", category));
        }
    }

    auto bump = conn_->execute_params(
        "UPDATE users SET access_version = access_version + 1 WHERE id = $1 "
        "RETURNING access_version", {uid});
    if (!bump.success) return fail("bump access_version", bump.error_message);
    if (bump.rows.empty()) {
        (void)exec_locked("ROLLBACK");
        return Result<uint64_t>::error(ErrorCategory::NOT_FOUND,
            std::format("user {} not found", id));
    }

    if (!exec_locked("COMMIT")) {
        return Result<uint64_t>::error(ErrorCategory::DATA_SOURCE_ERROR, "commit failed");
    }

    const auto version = utils::try_parse_int<uint64_t>(bump.rows.front().front());
    return Result<uint64_t>::ok(version.value_or(0));
}

std::vector<UserRecord> PgUserDirectory::list_users() {
    std::lock_guard lock(mutex_);
    std::vector<UserRecord> out;
    const auto res = conn_->execute(std::string(kUserColumns) + "ORDER BY id");
    if (!res.success) {
        utils::log::error(std::format("PgUserDirectory: list_users failed: {}", res.error_message));
        return out;
    }
    for (const auto& row : res.rows) {
        if (auto user = row_to_user(row)) out.push_back(std::move(*user));
    }
    return out;
}

} // namespace reviewgate
