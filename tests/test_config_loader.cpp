#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace reviewgate;

namespace {

const std::string kUsers = R"(
[[users]]
id = 1
name = "root"
role = "admin"
api_key = "admin-key"

[[users]]
id = 2
name = "ana"
role = "analyst"
api_key = "ana-key"
categories = ["Electronics", " Tablets "]
)";

bool has_error(const ConfigLoader::LoadResult& r, std::string_view needle) {
    return !r.success && r.error_message.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Defaults and sections
// ============================================================================

TEST_CASE("ConfigLoader: minimal config uses defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(kUsers);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.max_message_length == 4000);
    CHECK(cfg.interpreter.provider == "openai");
    CHECK(cfg.router.retry.max_attempts == 3);
    CHECK(cfg.router.retry.base_delay == std::chrono::milliseconds(800));
    CHECK(cfg.fallback.default_top_n == 5);
    CHECK(cfg.fallback.default_metric == Metric::REVIEW_COUNT);
    CHECK(cfg.metrics.nps.promoter_min == 4);
    CHECK(cfg.metrics.nps.detractor_max == 2);
    CHECK(cfg.cache.enabled);
    CHECK_FALSE(cfg.database.enabled);
    CHECK(cfg.tools.overrides.empty());
    CHECK(cfg.conversations.max_conversations_per_user == 50);
}

TEST_CASE("ConfigLoader: users are parsed with roles and trimmed grants", "[config]") {
    auto result = ConfigLoader::load_from_string(kUsers);
    REQUIRE(result.success);
    REQUIRE(result.config.users.size() == 2);

    const auto& admin = result.config.users[0];
    CHECK(admin.role == Role::ADMIN);
    CHECK(admin.active);

    const auto& analyst = result.config.users[1];
    CHECK(analyst.role == Role::ANALYST);
    CHECK(analyst.api_key == "ana-key");
    CHECK(analyst.categories == std::set<std::string>{"Electronics", "Tablets"});
}

TEST_CASE("ConfigLoader: section overrides", "[config]") {
    auto result = ConfigLoader::load_from_string(kUsers + R"(
[server]
port = 9090
threads = 2

[interpreter]
provider = "Anthropic"
model = "small-model"

[router]
max_attempts = 5
base_delay_ms = 100
max_delay_ms = 1000

[validator]
min_confidence = 0.5

[fallback]
default_top_n = 3
default_metric = "avg_rating"

[metrics]
promoter_min = 5
detractor_max = 3

[cache]
enabled = false
ttl_seconds = 10

[trace]
memory_window = 50
max_file_size_mb = 2

[conversations]
max_turns = 20
max_per_user = 4

[tools.metrics_top_categories]
top_n = { min = 1, max = 20, default = 3 }
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.threads == 2);
    CHECK(cfg.interpreter.provider == "anthropic");
    CHECK(cfg.interpreter.model == "small-model");
    CHECK(cfg.router.retry.max_attempts == 5);
    CHECK(cfg.router.retry.base_delay == std::chrono::milliseconds(100));
    CHECK(cfg.validator.min_confidence == Catch::Approx(0.5));
    CHECK(cfg.fallback.default_top_n == 3);
    CHECK(cfg.fallback.default_metric == Metric::AVG_RATING);
    CHECK(cfg.metrics.nps.promoter_min == 5);
    CHECK(cfg.metrics.nps.detractor_max == 3);
    CHECK_FALSE(cfg.cache.enabled);
    CHECK(cfg.cache.ttl == std::chrono::seconds(10));
    CHECK(cfg.trace.recorder.memory_window == 50);
    CHECK(cfg.trace.file.max_file_size_bytes == 2u * 1024 * 1024);
    CHECK(cfg.conversations.max_turns_per_conversation == 20);
    CHECK(cfg.conversations.max_conversations_per_user == 4);

    REQUIRE(cfg.tools.overrides.size() == 1);
    const auto& ov = cfg.tools.overrides[0];
    CHECK(ov.tool == "metrics_top_categories");
    CHECK(ov.param == "top_n");
    CHECK(ov.max_value == 20);
    CHECK(ov.default_value == 3);
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("ConfigLoader: expands env vars in strings", "[config][env]") {
    ::setenv("REVIEWGATE_TEST_LLM_KEY", "sk-test", 1);

    auto result = ConfigLoader::load_from_string(kUsers + R"(
[interpreter]
api_key = "${REVIEWGATE_TEST_LLM_KEY}"
)");
    REQUIRE(result.success);
    CHECK(result.config.interpreter.api_key == "sk-test");

    ::unsetenv("REVIEWGATE_TEST_LLM_KEY");
}

TEST_CASE("ConfigLoader: unset env var expands to empty", "[config][env]") {
    ::unsetenv("REVIEWGATE_TEST_MISSING_XYZ");

    auto result = ConfigLoader::load_from_string(kUsers + R"(
[data]
csv_path = "/data${REVIEWGATE_TEST_MISSING_XYZ}/reviews.csv"
)");
    REQUIRE(result.success);
    CHECK(result.config.data.csv_path == "/data/reviews.csv");
}

TEST_CASE("ConfigLoader: unclosed substitution is a parse error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(kUsers + R"(
[data]
csv_path = "${BROKEN"
)");
    CHECK(has_error(result, "Unclosed env var"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: malformed TOML", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK(has_error(result, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: unknown provider", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(kUsers + "[interpreter]\nprovider = \"acme\"\n");
    CHECK(has_error(result, "interpreter.provider"));
}

TEST_CASE("ConfigLoader: NPS thresholds must be ordered", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(kUsers + "[metrics]\npromoter_min = 3\ndetractor_max = 3\n");
    CHECK(has_error(result, "detractor_max < promoter_min"));
}

TEST_CASE("ConfigLoader: duplicate user ids and keys", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(kUsers + R"(
[[users]]
id = 2
name = "copy"
api_key = "ana-key"
)");
    CHECK(has_error(result, "duplicate id 2"));
    CHECK(has_error(result, "shared with another user"));
}

TEST_CASE("ConfigLoader: users need a positive id and an api key", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[[users]]
id = 0
name = "nobody"
)");
    CHECK(has_error(result, "id must be positive"));
    CHECK(has_error(result, "api_key must not be empty"));
}

TEST_CASE("ConfigLoader: unknown role and metric are rejected", "[config][validation]") {
    auto role = ConfigLoader::load_from_string(R"(
[[users]]
id = 7
role = "superuser"
api_key = "k"
)");
    CHECK(has_error(role, "unknown role 'superuser'"));

    auto metric = ConfigLoader::load_from_string(kUsers + "[fallback]\ndefault_metric = \"revenue\"\n");
    CHECK(has_error(metric, "unknown metric 'revenue'"));
}

TEST_CASE("ConfigLoader: tool overrides are checked against the registry", "[config][validation]") {
    SECTION("unknown tool") {
        auto r = ConfigLoader::load_from_string(kUsers + "[tools.web_search]\nlimit = { max = 5 }\n");
        CHECK(has_error(r, "tools.web_search: unknown tool"));
    }
    SECTION("non-integer parameter") {
        auto r = ConfigLoader::load_from_string(kUsers + "[tools.rating_distribution]\ncategory = { max = 5 }\n");
        CHECK(has_error(r, "not an integer parameter"));
    }
    SECTION("inverted bounds") {
        auto r = ConfigLoader::load_from_string(kUsers +
            "[tools.sentiment_summary]\nmax_reviews = { min = 40, max = 10 }\n");
        CHECK(has_error(r, "min exceeds max"));
    }
    SECTION("bounds beyond a 32-bit integer") {
        auto r = ConfigLoader::load_from_string(kUsers +
            "[tools.metrics_top_categories]\ntop_n = { max = 3000000000 }\n");
        CHECK(has_error(r, "tools.metrics_top_categories.top_n: bounds must fit a 32-bit integer"));

        auto low = ConfigLoader::load_from_string(kUsers +
            "[tools.sentiment_summary]\nmax_reviews = { default = -3000000000 }\n");
        CHECK(has_error(low, "bounds must fit a 32-bit integer"));
    }
    SECTION("fallback default outside narrowed bounds") {
        auto r = ConfigLoader::load_from_string(kUsers +
            "[tools.metrics_top_categories]\ntop_n = { max = 3 }\n");
        CHECK(has_error(r, "fallback.default_top_n"));
    }
}

TEST_CASE("ConfigLoader: conversation limits must be positive", "[config][validation]") {
    auto zero = ConfigLoader::load_from_string(kUsers + "[conversations]\nmax_per_user = 0\n");
    CHECK(has_error(zero, "conversations.max_per_user must be at least 1"));

    auto negative = ConfigLoader::load_from_string(kUsers + "[conversations]\nmax_turns = -5\n");
    CHECK(has_error(negative, "conversations.max_turns must be at least 1"));
}

TEST_CASE("ConfigLoader: database needs a connection string", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(kUsers + "[database]\nenabled = true\n");
    CHECK(has_error(result, "database.connection_string"));
}

TEST_CASE("ConfigLoader: all errors are reported together", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(kUsers + R"(
[server]
threads = 0

[router]
max_attempts = 0
)");
    CHECK(has_error(result, "Config validation failed"));
    CHECK(has_error(result, "server.threads"));
    CHECK(has_error(result, "router.max_attempts"));
}

// ============================================================================
// Files and includes
// ============================================================================

TEST_CASE("ConfigLoader: include merges files with the includer winning", "[config][include]") {
    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path() / ("reviewgate_cfg_" + utils::generate_uuid());
    fs::create_directories(dir);

    {
        std::ofstream base(dir / "users.toml");
        base << kUsers << "\n[server]\nport = 7000\nthreads = 8\n";
    }
    {
        std::ofstream main(dir / "reviewgate.toml");
        main << "include = \"users.toml\"\n\n[server]\nport = 7100\n";
    }

    auto result = ConfigLoader::load_from_file((dir / "reviewgate.toml").string());
    REQUIRE(result.success);
    CHECK(result.config.server.port == 7100);
    CHECK(result.config.server.threads == 8);
    CHECK(result.config.users.size() == 2);

    fs::remove_all(dir);
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/reviewgate.toml");
    CHECK(has_error(result, "Failed to load config"));
}
