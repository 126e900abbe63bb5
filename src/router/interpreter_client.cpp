#include "router/interpreter_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace reviewgate {

const char* reply_status_to_string(InterpreterReply::Status s) {
    switch (s) {
        case InterpreterReply::Status::OK:        return "ok";
        case InterpreterReply::Status::TRANSIENT: return "transient";
        case InterpreterReply::Status::PERMANENT: return "permanent";
        default:                                  return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

HttpInterpreterClient::HttpInterpreterClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Rate Limiting
// ============================================================================

bool HttpInterpreterClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        // New minute window
        minute_start_ = now;
        requests_this_minute_.store(0, std::memory_order_relaxed);
    }

    const uint32_t current = requests_this_minute_.load(std::memory_order_relaxed);
    if (current >= config_.max_requests_per_minute) {
        return false;
    }

    requests_this_minute_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Response Parsing
// ============================================================================

std::optional<std::string> HttpInterpreterClient::extract_content(const std::string& body,
                                                                  const std::string& provider) {
    const auto doc = JsonValue::try_parse(body);
    if (!doc || !doc->is_object()) return std::nullopt;

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        std::string text;
        for (const auto& block : (*doc)["content"].elements()) {
            if (block.value("type", std::string()) != "text") continue;
            if (auto t = block["text"].as_string()) text += *t;
        }
        if (text.empty()) return std::nullopt;
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    return (*doc)["choices"][size_t{0}]["message"]["content"].as_string();
}

InterpreterReply::Status HttpInterpreterClient::classify_status(int http_status) {
    if (http_status == 200) return InterpreterReply::Status::OK;
    if (http_status == 429 || http_status == 408 || http_status >= 500) {
        return InterpreterReply::Status::TRANSIENT;
    }
    return InterpreterReply::Status::PERMANENT;
}

// ============================================================================
// API Call
// ============================================================================

std::string HttpInterpreterClient::build_body(const InterpreterRequest& request) const {
    if (config_.provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"temperature":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(config_.model), config_.max_tokens, config_.temperature,
            utils::escape_json(request.system_prompt),
            utils::escape_json(request.user_prompt));
    }
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"response_format":{{"type":"json_object"}},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(config_.model), config_.temperature, config_.max_tokens,
        utils::escape_json(request.system_prompt),
        utils::escape_json(request.user_prompt));
}

InterpreterReply HttpInterpreterClient::complete(const InterpreterRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    const auto finish = [&](InterpreterReply reply) {
        reply.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (!reply.ok()) api_errors_.fetch_add(1, std::memory_order_relaxed);
        return reply;
    };

    if (config_.api_key.empty()) {
        return finish(InterpreterReply::permanent("No API key configured"));
    }
    if (config_.endpoint.empty()) {
        return finish(InterpreterReply::permanent("No endpoint configured"));
    }
    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return finish(InterpreterReply::transient("Rate limited: too many interpreter requests"));
    }

    api_calls_.fetch_add(1, std::memory_order_relaxed);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(request.timeout);
    cli.set_read_timeout(request.timeout);
    cli.set_write_timeout(request.timeout);

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"},
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key},
        };
        path = "/v1/chat/completions";
    }

    const auto res = cli.Post(path, headers, build_body(request), "application/json");
    if (!res) {
        return finish(InterpreterReply::transient(
            std::format("HTTP request failed: {}", httplib::to_string(res.error()))));
    }

    const auto status = classify_status(res->status);
    if (status != InterpreterReply::Status::OK) {
        auto error = std::format("API error: HTTP {} - {}", res->status, res->body.substr(0, 200));
        return finish(status == InterpreterReply::Status::TRANSIENT
            ? InterpreterReply::transient(std::move(error), res->status)
            : InterpreterReply::permanent(std::move(error), res->status));
    }

    auto content = extract_content(res->body, config_.provider);
    if (!content) {
        return finish(InterpreterReply::permanent("Unexpected response envelope", res->status));
    }
    return finish(InterpreterReply::success(std::move(*content), res->status));
}

// ============================================================================
// Stats
// ============================================================================

HttpInterpreterClient::Stats HttpInterpreterClient::get_stats() const {
    return {
        .api_calls = api_calls_.load(std::memory_order_relaxed),
        .api_errors = api_errors_.load(std::memory_order_relaxed),
        .rate_limited = rate_limited_.load(std::memory_order_relaxed),
    };
}

} // namespace reviewgate
