#pragma once

#include "config/config_types.hpp"
#include "core/pipeline.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Forward-declare httplib types (avoids pulling in the header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace reviewgate {

/**
 * @brief HTTP front end for the turn pipeline
 *
 * Every endpoint except /health authenticates with a Bearer API key that
 * must belong to an active user in the directory. Admin endpoints further
 * require the admin role; the check is repeated on every request.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<TurnPipeline> pipeline, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks until stop(). Throws std::runtime_error if the port cannot be bound.
    void start();
    void stop();

    /// Port accepted connections arrive on while start() runs, else 0.
    [[nodiscard]] int bound_port() const;

    /// "Bearer <key>" -> key; nullopt for any other shape.
    [[nodiscard]] static std::optional<std::string> parse_bearer(std::string_view header);

    /// Chat response body for one processed turn.
    [[nodiscard]] static std::string turn_response_to_json(const TurnResponse& response,
                                                           ConversationId conversation_id);

    struct HttpStats {
        uint64_t requests;
        uint64_t auth_rejects;
        uint64_t bad_requests;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    // ── Authentication ──────────────────────────────────────────────────
    std::optional<UserRecord> authenticate(const httplib::Request& req, httplib::Response& res);

    // ── Route registration (called from start()) ────────────────────────
    void register_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_chat(const httplib::Request& req, httplib::Response& res);
    void handle_open_conversation(const httplib::Request& req, httplib::Response& res);
    void handle_traces(const httplib::Request& req, httplib::Response& res);
    void handle_grants(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    void reject(httplib::Response& res, int status, std::string_view message);

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<TurnPipeline> pipeline_;
    const ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<int> bound_port_{0};

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> auth_rejects_{0};
    std::atomic<uint64_t> bad_requests_{0};
};

} // namespace reviewgate
