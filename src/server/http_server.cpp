#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/json.hpp"
#include "core/serialization.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <set>

namespace reviewgate {

namespace {

int status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ACCESS_DENIED:   return httplib::StatusCode::Forbidden_403;
        case ErrorCategory::NOT_FOUND:       return httplib::StatusCode::NotFound_404;
        case ErrorCategory::INVALID_REQUEST: return httplib::StatusCode::BadRequest_400;
        default:                             return httplib::StatusCode::InternalServerError_500;
    }
}

std::optional<JsonValue> parse_body(const httplib::Request& req) {
    if (req.body.empty()) return JsonValue::try_parse("{}");
    auto doc = JsonValue::try_parse(req.body);
    if (!doc || !doc->is_object()) return std::nullopt;
    return doc;
}

} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<TurnPipeline> pipeline, ServerConfig config)
    : pipeline_(std::move(pipeline)), config_(std::move(config)) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::string> HttpServer::parse_bearer(std::string_view header) {
    if (header.size() <= http::kBearerPrefix.size() ||
        header.substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix) {
        return std::nullopt;
    }
    auto key = utils::trim(header.substr(http::kBearerPrefix.size()));
    if (key.empty()) return std::nullopt;
    return key;
}

std::string HttpServer::turn_response_to_json(const TurnResponse& r, ConversationId conversation_id) {
    std::string out;
    out.reserve(512);
    const bool answered = r.outcome == TurnOutcome::ANSWERED || r.outcome == TurnOutcome::FALLBACK;
    out += std::format(R"({{"success":{},"conversation_id":{},"turn_index":{},"trace_id":"{}","outcome":"{}")",
                       utils::booltostr(answered), conversation_id, r.turn_index,
                       r.trace_id, turn_outcome_to_string(r.outcome));
    if (!answered) {
        out += std::format(R"(,"error":{}}})", utils::json_string(r.error));
        return out;
    }

    out += std::format(R"(,"tool":"{}","is_fallback":{},"rejection_reason":{})",
                       r.call ? tool_name_to_string(r.call->tool()) : "unknown",
                       utils::booltostr(r.is_fallback),
                       r.rejection_reason
                           ? utils::json_string(rejection_reason_to_string(*r.rejection_reason))
                           : std::string("null"));
    if (!r.disclosure.empty()) {
        out += std::format(R"(,"disclosure":{})", utils::json_string(r.disclosure));
    }
    if (r.call && !r.call->coercions.empty()) {
        out += R"(,"coercions":[)";
        for (size_t i = 0; i < r.call->coercions.size(); ++i) {
            const auto& c = r.call->coercions[i];
            if (i > 0) out += ',';
            out += std::format(R"({{"param":{},"requested":{},"applied":{}}})",
                               utils::json_string(c.param), utils::json_string(c.requested),
                               utils::json_string(c.applied));
        }
        out += ']';
    }
    out += std::format(R"(,"result":{}}})", r.result ? tool_result_to_json(*r.result) : "null");
    return out;
}

void HttpServer::reject(httplib::Response& res, int status, std::string_view message) {
    if (status == httplib::StatusCode::BadRequest_400) {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    res.status = status;
    res.set_content(std::format(R"({{"success":false,"error":{}}})", utils::json_string(message)),
                    http::kJsonContentType);
}

std::optional<UserRecord> HttpServer::authenticate(const httplib::Request& req, httplib::Response& res) {
    const auto key = parse_bearer(req.get_header_value(http::kAuthorizationHeader));
    std::optional<UserRecord> user;
    if (key) {
        user = pipeline_->access()->directory().find_by_api_key(*key);
    }
    if (!user || !user->active) {
        auth_rejects_.fetch_add(1, std::memory_order_relaxed);
        reject(res, httplib::StatusCode::Unauthorized_401, "Unauthorized");
        return std::nullopt;
    }
    return user;
}

// ============================================================================
// start(): create the server, register routes, listen
// ============================================================================

void HttpServer::start() {
    server_ = std::make_unique<httplib::Server>();
    auto& svr = *server_;

    const size_t pool_size = config_.threads;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting reviewgate on {}:{} ({} threads)",
                                 config_.host, config_.port, config_.threads));

    // Port 0 binds an ephemeral port; bound_port() reports it
    int port = config_.port;
    if (port == 0) {
        port = svr.bind_to_any_port(config_.host);
    } else if (!svr.bind_to_port(config_.host, port)) {
        port = -1;
    }
    if (port <= 0) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
                                             config_.host, config_.port));
    }
    bound_port_.store(port, std::memory_order_release);

    const bool clean = svr.listen_after_bind();
    bound_port_.store(0, std::memory_order_release);
    if (!clean) {
        throw std::runtime_error(std::format("HTTP server on {}:{} stopped with an error",
                                             config_.host, port));
    }
}

int HttpServer::bound_port() const {
    return bound_port_.load(std::memory_order_acquire);
}

void HttpServer::stop() {
    if (server_) server_->stop();
    utils::log::info("Server stopped");
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .auth_rejects = auth_rejects_.load(std::memory_order_relaxed),
        .bad_requests = bad_requests_.load(std::memory_order_relaxed),
    };
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kChatPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat(req, res);
    });
    svr.Post(http::kConversationsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_open_conversation(req, res);
    });
    svr.Get(http::kAdminTracesPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_traces(req, res);
    });
    svr.Post(http::kAdminGrantsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_grants(req, res);
    });
    svr.Get(http::kHealthPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_chat(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto user = authenticate(req, res);
    if (!user) return;

    const auto body = parse_body(req);
    if (!body) {
        reject(res, httplib::StatusCode::BadRequest_400, "Invalid JSON: expected an object");
        return;
    }

    const auto message = utils::trim((*body)["message"].as_string().value_or(""));
    if (message.empty()) {
        reject(res, httplib::StatusCode::BadRequest_400, "Missing required field: message");
        return;
    }
    if (message.size() > config_.max_message_length) {
        reject(res, httplib::StatusCode::BadRequest_400,
               std::format("Message too long: max {} bytes", config_.max_message_length));
        return;
    }

    // One conversation per session is a caller-side policy: reuse the latest
    // unless an id is given or a new one is requested.
    auto& conversations = *pipeline_->conversations();
    ConversationId conversation_id = 0;
    if (const auto field = (*body)["conversation_id"]; !field.is_null()) {
        const auto requested = field.as_int();
        if (!requested || *requested <= 0) {
            reject(res, httplib::StatusCode::BadRequest_400,
                   "conversation_id must be a positive integer");
            return;
        }
        conversation_id = static_cast<ConversationId>(*requested);
    } else if (body->value("new_conversation", false)) {
        conversation_id = conversations.open(user->id);
    } else {
        conversation_id = conversations.latest_for(user->id).value_or(0);
        if (conversation_id == 0) conversation_id = conversations.open(user->id);
    }

    TurnRequest turn;
    turn.user_id = user->id;
    turn.conversation_id = conversation_id;
    turn.utterance = message;
    turn.cancel = CancellationToken::create();

    const auto processed = pipeline_->process(turn);
    if (processed.is_error()) {
        reject(res, status_for(processed.error_category()), processed.error_message());
        return;
    }

    const auto& response = processed.value();
    res.status = response.outcome == TurnOutcome::FAILED
        ? httplib::StatusCode::InternalServerError_500
        : httplib::StatusCode::OK_200;
    res.set_content(turn_response_to_json(response, conversation_id), http::kJsonContentType);
}

void HttpServer::handle_open_conversation(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto user = authenticate(req, res);
    if (!user) return;

    const auto id = pipeline_->conversations()->open(user->id);
    res.status = httplib::StatusCode::Created_201;
    res.set_content(std::format(R"({{"success":true,"conversation_id":{}}})", id),
                    http::kJsonContentType);
}

void HttpServer::handle_traces(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto user = authenticate(req, res);
    if (!user) return;

    size_t limit = config_.default_trace_limit;
    if (req.has_param("limit")) {
        const auto parsed = utils::try_parse_int<size_t>(req.get_param_value("limit"));
        if (!parsed || *parsed == 0) {
            reject(res, httplib::StatusCode::BadRequest_400, "limit must be a positive integer");
            return;
        }
        limit = std::min(*parsed, config_.max_trace_limit);
    }

    const auto traces = pipeline_->trace()->recent(user->id, limit);
    if (traces.is_error()) {
        reject(res, status_for(traces.error_category()), "Forbidden");
        return;
    }

    std::string out = R"({"success":true,"traces":[)";
    for (size_t i = 0; i < traces.value().size(); ++i) {
        if (i > 0) out += ',';
        out += TraceRecorder::to_json(traces.value()[i]);
    }
    out += "]}";
    res.set_content(out, http::kJsonContentType);
}

void HttpServer::handle_grants(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const auto user = authenticate(req, res);
    if (!user) return;

    auto& access = *pipeline_->access();
    if (!access.is_admin(user->id)) {
        reject(res, httplib::StatusCode::Forbidden_403, "Forbidden");
        return;
    }

    const auto body = parse_body(req);
    if (!body) {
        reject(res, httplib::StatusCode::BadRequest_400, "Invalid JSON: expected an object");
        return;
    }
    const auto target = (*body)["user_id"].as_int();
    if (!target || !(*body)["categories"].is_array()) {
        reject(res, httplib::StatusCode::BadRequest_400,
               "Required fields: user_id (integer), categories (array of strings)");
        return;
    }

    std::set<std::string> categories;
    for (const auto& c : (*body)["categories"].string_elements()) {
        auto trimmed = utils::trim(c);
        if (!trimmed.empty()) categories.insert(std::move(trimmed));
    }

    const auto updated = access.directory().set_user_categories(*target, categories);
    if (updated.is_error()) {
        reject(res, status_for(updated.error_category()), updated.error_message());
        return;
    }

    utils::log::info(std::format("grants: admin {} set {} categories for user {} (version {})",
                                 user->id, categories.size(), *target, updated.value()));
    res.set_content(std::format(R"({{"success":true,"user_id":{},"access_version":{}}})",
                                *target, updated.value()),
                    http::kJsonContentType);
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto stats = pipeline_->get_stats();
    res.set_content(std::format(
        R"({{"status":"healthy","turns":{},"answered":{},"fallbacks":{},"failed":{},"cancelled":{}}})",
        stats.total_turns, stats.answered, stats.fallbacks, stats.failed, stats.cancelled),
        http::kJsonContentType);
}

} // namespace reviewgate
