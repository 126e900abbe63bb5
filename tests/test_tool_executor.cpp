#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "executor/tool_executor.hpp"
#include "mocks/mock_review_source.hpp"
#include "mocks/review_fixtures.hpp"

using namespace reviewgate;
using namespace reviewgate::testing;

namespace {

ToolCall call_of(ToolArgs args) {
    ToolCall call;
    call.args = std::move(args);
    return call;
}

TopCategoriesArgs top(Metric metric, int n, SortOrder order = SortOrder::TOP,
                      std::vector<std::string> categories = {}) {
    TopCategoriesArgs a;
    a.metric = metric;
    a.top_n = n;
    a.order = order;
    a.categories = std::move(categories);
    return a;
}

AccessCache::Config cache_config() {
    AccessCache::Config cfg;
    cfg.enabled = true;
    cfg.max_entries = 100;
    cfg.num_shards = 4;
    cfg.ttl = std::chrono::seconds(60);
    return cfg;
}

struct ExecutorFixture {
    std::shared_ptr<InMemoryUserDirectory> directory =
        std::make_shared<InMemoryUserDirectory>(sample_users());
    std::shared_ptr<MockReviewSource> source =
        std::make_shared<MockReviewSource>(sample_rows());
    std::shared_ptr<AccessModel> access = std::make_shared<AccessModel>(directory, source);
    std::shared_ptr<AccessCache> cache = std::make_shared<AccessCache>(cache_config());
    ToolExecutor executor{access, source, cache, ToolExecutor::Config{}};

    ToolResult run(ToolArgs args, UserId user) {
        auto r = executor.execute(call_of(std::move(args)), user);
        REQUIRE(r.is_ok());
        return r.value();
    }
};

std::vector<std::string> names(const TopCategoriesResult& r) {
    std::vector<std::string> out;
    for (const auto& row : r.rows) out.push_back(row.category);
    return out;
}

} // anonymous namespace

// ============================================================================
// Ranking
// ============================================================================

TEST_CASE("ToolExecutor: admin ranks every category by review count", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(top(Metric::REVIEW_COUNT, 10), kAdmin);

    const auto& r = std::get<TopCategoriesResult>(result);
    CHECK(names(r) == std::vector<std::string>{
        "Electronics", "Home Audio", "Tablets", "Computers & Accessories"});
    CHECK(r.rows[0].review_count == 5);
}

TEST_CASE("ToolExecutor: top_n truncates the ranking", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(top(Metric::NPS, 2), kAdmin);
    const auto& r = std::get<TopCategoriesResult>(result);
    CHECK(names(r) == std::vector<std::string>{"Tablets", "Home Audio"});
    CHECK(r.rows[0].nps == Catch::Approx(100.0));
    CHECK(r.rows[1].nps == Catch::Approx(50.0));
}

TEST_CASE("ToolExecutor: bottom order ranks ascending", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(top(Metric::AVG_RATING, 1, SortOrder::BOTTOM), kAdmin);
    const auto& r = std::get<TopCategoriesResult>(result);
    REQUIRE(r.rows.size() == 1);
    CHECK(r.rows[0].category == "Computers & Accessories");
    CHECK(r.rows[0].avg_rating == Catch::Approx(1.5));
}

TEST_CASE("ToolExecutor: metric ties break by category name", "[executor]") {
    auto directory = std::make_shared<InMemoryUserDirectory>(sample_users());
    auto source = std::make_shared<InMemoryReviewSource>(std::vector<ReviewRow>{
        make_row(0, "Zeta", 5, "a"),
        make_row(1, "Alpha", 5, "b"),
        make_row(2, "Mid", 4, "c"),
    });
    auto access = std::make_shared<AccessModel>(directory, source);
    ToolExecutor executor(access, source, nullptr, ToolExecutor::Config{});

    auto r = executor.execute(call_of(top(Metric::AVG_RATING, 5)), kAdmin);
    REQUIRE(r.is_ok());
    CHECK(names(std::get<TopCategoriesResult>(r.value())) ==
          std::vector<std::string>{"Alpha", "Zeta", "Mid"});

    auto bottom = executor.execute(call_of(top(Metric::AVG_RATING, 5, SortOrder::BOTTOM)), kAdmin);
    REQUIRE(bottom.is_ok());
    CHECK(names(std::get<TopCategoriesResult>(bottom.value())) ==
          std::vector<std::string>{"Mid", "Alpha", "Zeta"});
}

TEST_CASE("ToolExecutor: category metrics are exact", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(top(Metric::REVIEW_COUNT, 1, SortOrder::TOP, {"Electronics"}), kAnalyst);
    const auto& r = std::get<TopCategoriesResult>(result);
    REQUIRE(r.rows.size() == 1);
    CHECK(r.rows[0].review_count == 5);
    CHECK(r.rows[0].avg_rating == Catch::Approx(3.6));
    CHECK(r.rows[0].nps == Catch::Approx(40.0));
}

// ============================================================================
// Isolation
// ============================================================================

TEST_CASE("ToolExecutor: analyst ranking never includes unseen categories", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(top(Metric::REVIEW_COUNT, 50), kAnalyst);
    const auto& r = std::get<TopCategoriesResult>(result);
    // Cameras is granted but has no reviews
    CHECK(names(r) == std::vector<std::string>{"Electronics", "Tablets"});
}

TEST_CASE("ToolExecutor: out-of-scope category yields AccessDenied", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(RatingDistributionArgs{"Home Audio"}, kAnalyst);
    CHECK(std::holds_alternative<AccessDenied>(result));

    auto listed = f.run(top(Metric::NPS, 5, SortOrder::TOP, {"Electronics", "Home Audio"}), kAnalyst);
    CHECK(std::holds_alternative<AccessDenied>(listed));

    CHECK(f.executor.get_stats().access_denied == 2);
    CHECK(f.source->query_count() == 0);
}

TEST_CASE("ToolExecutor: inactive user yields AccessDenied", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(GeneralQueryArgs{}, kInactive);
    CHECK(std::holds_alternative<AccessDenied>(result));
}

// ============================================================================
// Per-tool results
// ============================================================================

TEST_CASE("ToolExecutor: rating distribution counts every star", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(RatingDistributionArgs{"Electronics"}, kAnalyst);
    const auto& r = std::get<RatingDistributionResult>(result);
    CHECK(r.category == "Electronics");
    CHECK(r.total == 5);
    CHECK(r.counts == std::array<uint64_t, 5>{1, 0, 1, 1, 2});
}

TEST_CASE("ToolExecutor: sentiment split and terms", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(SentimentSummaryArgs{"Electronics", 30}, kAnalyst);
    const auto& r = std::get<SentimentSummaryResult>(result);

    CHECK(r.reviews_analyzed == 5);
    CHECK(r.positive == 3);
    CHECK(r.neutral == 1);
    CHECK(r.negative == 1);
    REQUIRE(r.top_terms.size() >= 3);
    CHECK(r.top_terms[0] == std::pair<std::string, uint64_t>{"battery", 4});
    CHECK(r.top_terms[1] == std::pair<std::string, uint64_t>{"great", 2});
    CHECK(r.top_terms[2] == std::pair<std::string, uint64_t>{"screen", 2});
}

TEST_CASE("ToolExecutor: sentiment respects max_reviews and skips duplicate texts", "[executor]") {
    auto directory = std::make_shared<InMemoryUserDirectory>(sample_users());
    auto source = std::make_shared<InMemoryReviewSource>(std::vector<ReviewRow>{
        make_row(0, "Toys", 5, "Fun toy"),
        make_row(1, "Toys", 5, "fun toy "),
        make_row(2, "Toys", 1, ""),
        make_row(3, "Toys", 1, "Broke quickly"),
        make_row(4, "Toys", 3, "Okay"),
    });
    auto access = std::make_shared<AccessModel>(directory, source);
    ToolExecutor executor(access, source, nullptr, ToolExecutor::Config{});

    auto all = executor.execute(call_of(SentimentSummaryArgs{"Toys", 30}), kAdmin);
    REQUIRE(all.is_ok());
    const auto& r = std::get<SentimentSummaryResult>(all.value());
    CHECK(r.reviews_analyzed == 3);
    CHECK(r.positive == 1);
    CHECK(r.negative == 1);
    CHECK(r.neutral == 1);

    auto capped = executor.execute(call_of(SentimentSummaryArgs{"Toys", 2}), kAdmin);
    REQUIRE(capped.is_ok());
    CHECK(std::get<SentimentSummaryResult>(capped.value()).reviews_analyzed == 2);
}

TEST_CASE("ToolExecutor: compare two visible categories", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(CompareCategoriesArgs{"Electronics", "Tablets"}, kAnalyst);
    const auto& r = std::get<ComparisonResult>(result);
    CHECK(r.a.category == "Electronics");
    CHECK(r.a.review_count == 5);
    CHECK(r.b.category == "Tablets");
    CHECK(r.b.avg_rating == Catch::Approx(5.0));
}

TEST_CASE("ToolExecutor: granted category without reviews is NoData", "[executor]") {
    ExecutorFixture f;

    auto dist = f.run(RatingDistributionArgs{"Cameras"}, kAnalyst);
    REQUIRE(std::holds_alternative<NoData>(dist));
    CHECK(std::get<NoData>(dist).categories == std::vector<std::string>{"Cameras"});

    auto cmp = f.run(CompareCategoriesArgs{"Electronics", "Cameras"}, kAnalyst);
    REQUIRE(std::holds_alternative<NoData>(cmp));
    CHECK(std::get<NoData>(cmp).categories == std::vector<std::string>{"Cameras"});
}

TEST_CASE("ToolExecutor: general query over the visible scope", "[executor]") {
    ExecutorFixture f;

    auto count = f.run(GeneralQueryArgs{GeneralQueryType::COUNT_CATEGORIES, std::nullopt}, kAnalyst);
    CHECK(std::get<GeneralQueryResult>(count).category_count == 3);

    auto list = f.run(GeneralQueryArgs{GeneralQueryType::LIST_CATEGORIES, std::nullopt}, kAnalyst);
    CHECK(std::get<GeneralQueryResult>(list).categories ==
          std::vector<std::string>{"Cameras", "Electronics", "Tablets"});

    auto info = f.run(GeneralQueryArgs{GeneralQueryType::CATEGORY_INFO, "Tablets"}, kAnalyst);
    const auto& gi = std::get<GeneralQueryResult>(info);
    REQUIRE(gi.category_info.has_value());
    CHECK(gi.category_info->review_count == 3);
}

TEST_CASE("ToolExecutor: summary stats aggregate every visible review", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(GeneralQueryArgs{}, kAdmin);
    const auto& r = std::get<GeneralQueryResult>(result);
    CHECK(r.category_count == 4);
    CHECK(r.review_count == 14);
    CHECK(r.avg_rating == Catch::Approx(51.0 / 14.0));
    CHECK(r.nps == Catch::Approx(5.0 / 14.0 * 100.0));
}

TEST_CASE("ToolExecutor: summary stats over an empty scope is NoData", "[executor]") {
    ExecutorFixture f;
    auto result = f.run(GeneralQueryArgs{}, kNoGrants);
    CHECK(std::holds_alternative<NoData>(result));
}

// ============================================================================
// Caching
// ============================================================================

TEST_CASE("ToolExecutor: identical calls return identical results from cache", "[executor]") {
    ExecutorFixture f;
    auto first = f.run(top(Metric::NPS, 5), kAnalyst);
    auto second = f.run(top(Metric::NPS, 5), kAnalyst);

    CHECK(first == second);
    CHECK(f.executor.get_stats().cache_hits == 1);
    CHECK(f.source->query_count() == 1);
}

TEST_CASE("ToolExecutor: cache is per user", "[executor]") {
    ExecutorFixture f;
    auto analyst = f.run(top(Metric::REVIEW_COUNT, 5), kAnalyst);
    auto admin = f.run(top(Metric::REVIEW_COUNT, 5), kAdmin);

    CHECK(std::get<TopCategoriesResult>(analyst).rows.size() == 2);
    CHECK(std::get<TopCategoriesResult>(admin).rows.size() == 4);
    CHECK(f.executor.get_stats().cache_hits == 0);
}

TEST_CASE("ToolExecutor: grant change is visible on the very next call", "[executor]") {
    ExecutorFixture f;
    auto before = f.run(top(Metric::REVIEW_COUNT, 5), kAnalyst);
    CHECK(names(std::get<TopCategoriesResult>(before)) ==
          std::vector<std::string>{"Electronics", "Tablets"});

    REQUIRE(f.directory->set_user_categories(kAnalyst, {"Home Audio"}).is_ok());

    auto after = f.run(top(Metric::REVIEW_COUNT, 5), kAnalyst);
    CHECK(names(std::get<TopCategoriesResult>(after)) == std::vector<std::string>{"Home Audio"});
    CHECK(f.executor.get_stats().cache_hits == 0);

    auto denied = f.run(RatingDistributionArgs{"Electronics"}, kAnalyst);
    CHECK(std::holds_alternative<AccessDenied>(denied));
}

TEST_CASE("ToolExecutor: data source errors propagate and are not cached", "[executor]") {
    ExecutorFixture f;
    f.source->set_should_succeed(false);

    auto failed = f.executor.execute(call_of(RatingDistributionArgs{"Electronics"}), kAnalyst);
    REQUIRE(failed.is_error());
    CHECK(failed.error_category() == ErrorCategory::DATA_SOURCE_ERROR);
    CHECK(f.cache->get_stats().current_entries == 0);
    CHECK(f.executor.get_stats().data_source_errors == 1);

    f.source->set_should_succeed(true);
    auto recovered = f.executor.execute(call_of(RatingDistributionArgs{"Electronics"}), kAnalyst);
    REQUIRE(recovered.is_ok());
    CHECK(std::holds_alternative<RatingDistributionResult>(recovered.value()));
    CHECK(f.source->query_count() == 2);
}

TEST_CASE("ToolExecutor: fingerprint ignores list order and fallback metadata", "[executor]") {
    auto a = call_of(top(Metric::NPS, 5, SortOrder::TOP, {"Tablets", "Electronics"}));
    auto b = call_of(top(Metric::NPS, 5, SortOrder::TOP, {"Electronics", "Tablets"}));
    b.is_fallback = true;
    b.rejection_reason = RejectionReason::ACCESS_DENIED;
    b.fallback_rationale = "substituted";

    CHECK(ToolExecutor::fingerprint(a) == ToolExecutor::fingerprint(b));
    CHECK(ToolExecutor::fingerprint(a).size() == 64);

    auto c = call_of(top(Metric::NPS, 6, SortOrder::TOP, {"Electronics", "Tablets"}));
    CHECK(ToolExecutor::fingerprint(a) != ToolExecutor::fingerprint(c));
}
