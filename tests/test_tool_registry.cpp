#include <catch2/catch_test_macros.hpp>
#include "tools/tool_registry.hpp"

using namespace reviewgate;

TEST_CASE("ToolRegistry: exactly the five analytics tools", "[registry]") {
    ToolRegistry registry;
    REQUIRE(registry.tools().size() == 5);

    CHECK(registry.lookup(ToolName::METRICS_TOP_CATEGORIES) != nullptr);
    CHECK(registry.lookup(ToolName::RATING_DISTRIBUTION) != nullptr);
    CHECK(registry.lookup(ToolName::SENTIMENT_SUMMARY) != nullptr);
    CHECK(registry.lookup(ToolName::COMPARE_CATEGORIES) != nullptr);
    CHECK(registry.lookup(ToolName::GENERAL_QUERY) != nullptr);
    CHECK(registry.lookup(ToolName::UNKNOWN) == nullptr);
}

TEST_CASE("ToolRegistry: name lookup is exact", "[registry]") {
    ToolRegistry registry;
    CHECK(registry.lookup(std::string_view("rating_distribution")) != nullptr);
    CHECK(registry.lookup(std::string_view("Rating_Distribution")) == nullptr);
    CHECK(registry.lookup(std::string_view("drop_table")) == nullptr);
    CHECK(registry.lookup(std::string_view("")) == nullptr);
}

TEST_CASE("ToolRegistry: built-in integer bounds", "[registry]") {
    ToolRegistry registry;

    const auto* top_n = registry.int_param(ToolName::METRICS_TOP_CATEGORIES, "top_n");
    REQUIRE(top_n != nullptr);
    CHECK(top_n->min_value == 1);
    CHECK(top_n->max_value == 50);
    CHECK(top_n->default_int == 5);

    const auto* max_reviews = registry.int_param(ToolName::SENTIMENT_SUMMARY, "max_reviews");
    REQUIRE(max_reviews != nullptr);
    CHECK(max_reviews->min_value == 5);
    CHECK(max_reviews->max_value == 50);
    CHECK(max_reviews->default_int == 30);

    // Not an integer parameter
    CHECK(registry.int_param(ToolName::RATING_DISTRIBUTION, "category") == nullptr);
}

TEST_CASE("ToolSchema: aliases resolve to the canonical parameter", "[registry]") {
    ToolRegistry registry;
    const auto* schema = registry.lookup(ToolName::METRICS_TOP_CATEGORIES);
    REQUIRE(schema != nullptr);

    const auto* by_alias = schema->find("n");
    REQUIRE(by_alias != nullptr);
    CHECK(by_alias->name == "top_n");
    CHECK(schema->find("limit") == by_alias);
    CHECK(schema->find("bogus") == nullptr);
}

TEST_CASE("ToolRegistry: override narrows bounds and default", "[registry]") {
    ToolRegistry::Config cfg;
    cfg.overrides.push_back({"metrics_top_categories", "top_n", 1, 10, 3});
    ToolRegistry registry(cfg);

    const auto* top_n = registry.int_param(ToolName::METRICS_TOP_CATEGORIES, "top_n");
    REQUIRE(top_n != nullptr);
    CHECK(top_n->max_value == 10);
    CHECK(top_n->default_int == 3);
}

TEST_CASE("ToolRegistry: override default is clamped into the new range", "[registry]") {
    ToolRegistry::Config cfg;
    cfg.overrides.push_back({"sentiment_summary", "max_reviews", std::nullopt, 20, 99});
    ToolRegistry registry(cfg);

    const auto* spec = registry.int_param(ToolName::SENTIMENT_SUMMARY, "max_reviews");
    REQUIRE(spec != nullptr);
    CHECK(spec->min_value == 5);
    CHECK(spec->max_value == 20);
    CHECK(spec->default_int == 20);
}

TEST_CASE("ToolRegistry: inconsistent override is ignored", "[registry]") {
    ToolRegistry::Config cfg;
    cfg.overrides.push_back({"metrics_top_categories", "top_n", 40, 10, std::nullopt});
    cfg.overrides.push_back({"no_such_tool", "top_n", 1, 2, 1});
    cfg.overrides.push_back({"rating_distribution", "category", 1, 2, 1});
    ToolRegistry registry(cfg);

    const auto* top_n = registry.int_param(ToolName::METRICS_TOP_CATEGORIES, "top_n");
    REQUIRE(top_n != nullptr);
    CHECK(top_n->min_value == 1);
    CHECK(top_n->max_value == 50);
    CHECK(registry.tools().size() == 5);
}

TEST_CASE("ToolRegistry: catalog lists every tool with its domains", "[registry]") {
    ToolRegistry registry;
    const auto catalog = registry.catalog_description();

    CHECK(catalog.find("metrics_top_categories") != std::string::npos);
    CHECK(catalog.find("rating_distribution") != std::string::npos);
    CHECK(catalog.find("sentiment_summary") != std::string::npos);
    CHECK(catalog.find("compare_categories") != std::string::npos);
    CHECK(catalog.find("general_query") != std::string::npos);
    CHECK(catalog.find("integer 1..50, default 5") != std::string::npos);
}
