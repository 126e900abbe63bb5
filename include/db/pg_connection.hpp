#pragma once

#include <libpq-fe.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace reviewgate {

/**
 * @brief Result set from a statement execution
 *
 * Owns the result data (copied out of the PGresult).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    uint64_t affected_rows = 0;
    bool has_rows = false;
};

/**
 * @brief PostgreSQL connection
 *
 * Wraps PGconn* and owns it. Statements with parameters always go through
 * PQexecParams; values are never spliced into SQL text.
 * Not thread-safe: callers serialize access.
 */
class PgConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /// Connect with PQconnectdb. Returns nullptr (and logs) on failure.
    [[nodiscard]] static std::unique_ptr<PgConnection> connect(const std::string& conninfo);

    [[nodiscard]] DbResultSet execute(const std::string& sql);

    [[nodiscard]] DbResultSet execute_params(const std::string& sql,
                                             const std::vector<std::string>& params);

    [[nodiscard]] bool is_connected() const;

    bool set_query_timeout(uint32_t timeout_ms);

    void close();

private:
    DbResultSet consume(PGresult* res);
    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

} // namespace reviewgate
