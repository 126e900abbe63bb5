#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace reviewgate {

struct InterpreterRequest {
    std::string system_prompt;
    std::string user_prompt;
    std::chrono::milliseconds timeout{15000};
};

struct InterpreterReply {
    enum class Status {
        OK,
        TRANSIENT,   // Worth retrying: timeout, connection error, 429, 5xx, local rate limit
        PERMANENT    // Retrying cannot help: auth, bad request, missing credentials
    };

    Status status = Status::PERMANENT;
    std::string content;
    std::string error;
    int http_status = 0;
    std::chrono::milliseconds latency{0};

    [[nodiscard]] bool ok() const { return status == Status::OK; }

    static InterpreterReply success(std::string content, int http_status = 200) {
        InterpreterReply r;
        r.status = Status::OK;
        r.content = std::move(content);
        r.http_status = http_status;
        return r;
    }

    static InterpreterReply transient(std::string error, int http_status = 0) {
        InterpreterReply r;
        r.status = Status::TRANSIENT;
        r.error = std::move(error);
        r.http_status = http_status;
        return r;
    }

    static InterpreterReply permanent(std::string error, int http_status = 0) {
        InterpreterReply r;
        r.status = Status::PERMANENT;
        r.error = std::move(error);
        r.http_status = http_status;
        return r;
    }
};

[[nodiscard]] const char* reply_status_to_string(InterpreterReply::Status s);

/**
 * @brief One call to the external natural-language interpreter
 *
 * Implementations never throw; every failure is a classified reply.
 */
class IInterpreterClient {
public:
    virtual ~IInterpreterClient() = default;

    [[nodiscard]] virtual InterpreterReply complete(const InterpreterRequest& request) = 0;
};

/**
 * @brief Chat-completion client over cpp-httplib
 *
 * Providers:
 * - "openai":    POST /v1/chat/completions, Bearer auth
 * - "anthropic": POST /v1/messages, x-api-key + anthropic-version
 *
 * A per-minute request budget is enforced client-side; exceeding it
 * is reported as TRANSIENT so the caller's backoff applies.
 */
class HttpInterpreterClient : public IInterpreterClient {
public:
    struct Config {
        std::string provider = "openai";
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string model = "gpt-4o-mini";
        double temperature = 0.0;
        int max_tokens = 300;
        uint32_t max_requests_per_minute = 60;
    };

    explicit HttpInterpreterClient(Config config);

    [[nodiscard]] InterpreterReply complete(const InterpreterRequest& request) override;

    /// Pull the assistant text out of a provider response envelope.
    [[nodiscard]] static std::optional<std::string> extract_content(const std::string& body,
                                                                    const std::string& provider);

    /// Request body for the configured provider.
    [[nodiscard]] std::string build_body(const InterpreterRequest& request) const;

    /// HTTP status -> reply class.
    [[nodiscard]] static InterpreterReply::Status classify_status(int http_status);

    struct Stats {
        uint64_t api_calls;
        uint64_t api_errors;
        uint64_t rate_limited;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] bool check_rate_limit();

    Config config_;

    std::atomic<uint32_t> requests_this_minute_{0};
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace reviewgate
