#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/json.hpp"
#include "mocks/pipeline_fixture.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <exception>
#include <format>
#include <thread>

using namespace reviewgate;
using namespace reviewgate::testing;

namespace {

ServerConfig loopback_config() {
    ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.threads = 2;
    cfg.max_message_length = 200;
    return cfg;
}

/**
 * @brief HttpServer over the sample pipeline, listening on an ephemeral port
 */
struct ServerFixture {
    PipelineFixture f;
    HttpServer server{f.pipeline, loopback_config()};
    std::thread thread;
    std::exception_ptr start_error;
    int port = 0;

    ServerFixture() {
        thread = std::thread([this] {
            try {
                server.start();
            } catch (const std::exception&) {
                start_error = std::current_exception();
            }
        });
        const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while ((port = server.bound_port()) == 0 && !start_error &&
               std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        // A served request means the accept loop is running and stop() will reach it
        while (port > 0 && std::chrono::steady_clock::now() < give_up) {
            auto cli = client();
            if (cli.Get(http::kHealthPath)) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~ServerFixture() {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", port);
        cli.set_connection_timeout(std::chrono::seconds(2));
        cli.set_read_timeout(std::chrono::seconds(5));
        return cli;
    }

    static httplib::Headers auth(UserId user) {
        return {{"Authorization", std::format("Bearer key-{}", user)}};
    }

    httplib::Result post(std::string_view path, UserId user, const std::string& body) const {
        auto cli = client();
        return cli.Post(std::string(path), auth(user), body, http::kJsonContentType);
    }

    httplib::Result get(const std::string& path, UserId user) const {
        auto cli = client();
        return cli.Get(path, auth(user));
    }
};

JsonValue body_of(const httplib::Result& res) {
    auto doc = JsonValue::try_parse(res->body);
    REQUIRE(doc.has_value());
    return *doc;
}

constexpr const char* kElectronicsReply =
    R"({"tool":"rating_distribution","args":{"category":"Electronics"},"confidence":0.9})";

} // anonymous namespace

// ============================================================================
// Health and authentication
// ============================================================================

TEST_CASE("HttpServer routes: health needs no credentials", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);

    auto cli = s.client();
    auto res = cli.Get(http::kHealthPath);
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(body_of(res)["status"].as_string() == "healthy");
}

TEST_CASE("HttpServer routes: chat requires an active user's key", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);

    auto cli = s.client();
    auto anonymous = cli.Post(http::kChatPath, R"({"message":"hi"})", http::kJsonContentType);
    REQUIRE(anonymous);
    CHECK(anonymous->status == 401);

    const httplib::Headers wrong_key{{"Authorization", "Bearer nope"}};
    auto wrong = cli.Post(http::kChatPath, wrong_key, R"({"message":"hi"})", http::kJsonContentType);
    REQUIRE(wrong);
    CHECK(wrong->status == 401);

    auto inactive = s.post(http::kChatPath, kInactive, R"({"message":"hi"})");
    REQUIRE(inactive);
    CHECK(inactive->status == 401);

    CHECK(s.f.client->call_count() == 0);
    CHECK(s.server.get_http_stats().auth_rejects == 3);
}

// ============================================================================
// Chat
// ============================================================================

TEST_CASE("HttpServer routes: chat reuses the latest conversation", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);
    s.f.client->push_json(kElectronicsReply);
    s.f.client->push_json(kElectronicsReply);
    s.f.client->push_json(kElectronicsReply);

    auto first = s.post(http::kChatPath, kAnalyst, R"({"message":"rating breakdown for electronics"})");
    REQUIRE(first);
    REQUIRE(first->status == 200);
    const auto first_body = body_of(first);
    CHECK(first_body["success"].as_bool() == true);
    CHECK(first_body["outcome"].as_string() == "answered");
    CHECK(first_body["turn_index"].as_int() == 0);
    const auto conv = first_body["conversation_id"].as_int();
    REQUIRE(conv.has_value());

    auto second = s.post(http::kChatPath, kAnalyst, R"({"message":"and again"})");
    REQUIRE(second);
    REQUIRE(second->status == 200);
    CHECK(body_of(second)["conversation_id"].as_int() == conv);
    CHECK(body_of(second)["turn_index"].as_int() == 1);

    auto fresh = s.post(http::kChatPath, kAnalyst, R"({"message":"start over","new_conversation":true})");
    REQUIRE(fresh);
    REQUIRE(fresh->status == 200);
    CHECK(body_of(fresh)["conversation_id"].as_int() != conv);
    CHECK(body_of(fresh)["turn_index"].as_int() == 0);
}

TEST_CASE("HttpServer routes: explicit conversation ids are checked", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);

    auto opened = s.post(http::kConversationsPath, kAdmin, "");
    REQUIRE(opened);
    REQUIRE(opened->status == 201);
    const auto admin_conv = body_of(opened)["conversation_id"].as_int();
    REQUIRE(admin_conv.has_value());

    SECTION("another user's conversation is forbidden") {
        auto res = s.post(http::kChatPath, kAnalyst,
                          std::format(R"({{"message":"hi","conversation_id":{}}})", *admin_conv));
        REQUIRE(res);
        CHECK(res->status == 403);
        CHECK(body_of(res)["success"].as_bool() == false);
    }
    SECTION("unknown conversation is not found") {
        auto res = s.post(http::kChatPath, kAnalyst, R"({"message":"hi","conversation_id":999})");
        REQUIRE(res);
        CHECK(res->status == 404);
    }
    SECTION("ids that are not positive 64-bit integers are bad requests") {
        for (const char* id : {"1e300", "-1e300", "0", "-4", "2.5", "\"7\"", "true"}) {
            auto res = s.post(http::kChatPath, kAnalyst,
                              std::format(R"({{"message":"hi","conversation_id":{}}})", id));
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(body_of(res)["error"].as_string() == "conversation_id must be a positive integer");
        }
    }
    CHECK(s.f.client->call_count() == 0);
}

TEST_CASE("HttpServer routes: malformed chat bodies", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);

    for (const char* body : {"not json", "[1,2]", R"({"message":"   "})", R"({"text":"hi"})"}) {
        auto res = s.post(http::kChatPath, kAnalyst, body);
        REQUIRE(res);
        CHECK(res->status == 400);
    }

    auto too_long = s.post(http::kChatPath, kAnalyst,
                           std::format(R"({{"message":"{}"}})", std::string(201, 'x')));
    REQUIRE(too_long);
    CHECK(too_long->status == 400);
    CHECK(s.server.get_http_stats().bad_requests == 5);
}

// ============================================================================
// Admin endpoints
// ============================================================================

TEST_CASE("HttpServer routes: traces are admin only and limit is validated", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);
    s.f.client->push_json(kElectronicsReply);
    REQUIRE(s.post(http::kChatPath, kAnalyst, R"({"message":"rating breakdown"})")->status == 200);

    auto denied = s.get(http::kAdminTracesPath, kAnalyst);
    REQUIRE(denied);
    CHECK(denied->status == 403);

    auto listed = s.get(std::string(http::kAdminTracesPath) + "?limit=10", kAdmin);
    REQUIRE(listed);
    REQUIRE(listed->status == 200);
    const auto doc = body_of(listed);
    CHECK(doc["success"].as_bool() == true);
    REQUIRE(doc["traces"].size() == 1);
    CHECK(doc["traces"][0]["utterance"].as_string() == "rating breakdown");

    for (const char* limit : {"0", "abc", "-2"}) {
        auto bad = s.get(std::format("{}?limit={}", http::kAdminTracesPath, limit), kAdmin);
        REQUIRE(bad);
        CHECK(bad->status == 400);
    }
}

TEST_CASE("HttpServer routes: grants update the directory", "[server][http]") {
    ServerFixture s;
    REQUIRE(s.port > 0);

    SECTION("analysts cannot change grants") {
        auto res = s.post(http::kAdminGrantsPath, kAnalyst,
                          R"({"user_id":3,"categories":["Tablets"]})");
        REQUIRE(res);
        CHECK(res->status == 403);
        CHECK(s.f.access->snapshot(kAudioAnalyst)->visible == std::set<std::string>{"Home Audio"});
    }
    SECTION("admin replaces a user's categories") {
        const auto before = s.f.access->snapshot(kAudioAnalyst)->version;
        auto res = s.post(http::kAdminGrantsPath, kAdmin,
                          R"({"user_id":3,"categories":["Tablets"," Electronics "]})");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        const auto doc = body_of(res);
        CHECK(doc["success"].as_bool() == true);
        CHECK(doc["user_id"].as_int() == kAudioAnalyst);
        CHECK(doc["access_version"].as_int() > static_cast<int64_t>(before));
        CHECK(s.f.access->snapshot(kAudioAnalyst)->visible ==
              std::set<std::string>{"Electronics", "Tablets"});
    }
    SECTION("bad body") {
        auto res = s.post(http::kAdminGrantsPath, kAdmin, R"({"user_id":"three"})");
        REQUIRE(res);
        CHECK(res->status == 400);
    }
    SECTION("unknown user") {
        auto res = s.post(http::kAdminGrantsPath, kAdmin, R"({"user_id":999,"categories":[]})");
        REQUIRE(res);
        CHECK(res->status == 404);
    }
    SECTION("category outside the catalog") {
        auto res = s.post(http::kAdminGrantsPath, kAdmin,
                          R"({"user_id":3,"categories":["Garden Gnomes"]})");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(body_of(res)["error"].as_string()->find("Garden Gnomes") != std::string::npos);
    }
}
