#include <catch2/catch_test_macros.hpp>
#include "trace/file_sink.hpp"
#include "trace/trace_recorder.hpp"
#include "core/json.hpp"
#include "mocks/review_fixtures.hpp"

#include <filesystem>
#include <fstream>

using namespace reviewgate;
using namespace reviewgate::testing;

namespace {

TraceRecord make_record(UserId user, std::string utterance) {
    TraceRecord rec;
    rec.user_id = user;
    rec.conversation_id = 1;
    rec.utterance = std::move(utterance);
    rec.decision_status = DecisionStatus::PROPOSED;
    rec.proposed_tool = "rating_distribution";
    rec.verdict = "pass";
    rec.final_call = R"({"call":{"tool":"rating_distribution","args":{"category":"Tablets"}}})";
    rec.result_kind = "rating_distribution";
    rec.result = R"({"kind":"rating_distribution","category":"Tablets","total":3})";
    rec.outcome = TurnOutcome::ANSWERED;
    return rec;
}

class FailingSink : public ITraceSink {
public:
    bool write(std::string_view) override { return false; }
    void flush() override {}
    void shutdown() override {}
    std::string name() const override { return "failing"; }
};

class CollectingSink : public ITraceSink {
public:
    explicit CollectingSink(std::vector<std::string>& lines) : lines_(lines) {}
    bool write(std::string_view line) override {
        lines_.emplace_back(line);
        return true;
    }
    void flush() override {}
    void shutdown() override {}
    std::string name() const override { return "collecting"; }

private:
    std::vector<std::string>& lines_;
};

std::string temp_trace_path() {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("reviewgate_trace_" + utils::generate_uuid());
    return (dir / "trace.jsonl").string();
}

size_t count_lines(const std::string& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

} // anonymous namespace

// ============================================================================
// Recording
// ============================================================================

TEST_CASE("TraceRecorder: sequence numbers start at 1 and increase", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});

    auto a = recorder.record(make_record(kAnalyst, "first"));
    auto b = recorder.record(make_record(kAnalyst, "second"));

    CHECK(a.sequence_num == 1);
    CHECK(b.sequence_num == 2);
    CHECK_FALSE(a.trace_id.empty());
    CHECK(a.trace_id != b.trace_id);
    CHECK(recorder.get_stats().total_recorded == 2);
}

TEST_CASE("TraceRecorder: records form a verifiable hash chain", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});

    std::vector<TraceRecord> chain;
    chain.push_back(recorder.record(make_record(kAnalyst, "one")));
    chain.push_back(recorder.record(make_record(kAudioAnalyst, "two")));
    chain.push_back(recorder.record(make_record(kAnalyst, "three")));

    CHECK(chain[0].previous_hash.empty());
    CHECK(chain[1].previous_hash == chain[0].record_hash);
    CHECK(chain[2].previous_hash == chain[1].record_hash);
    CHECK(chain[0].record_hash.size() == 64);
    CHECK(TraceRecorder::verify_chain(chain));

    SECTION("tampering with a committed field breaks the chain") {
        chain[1].utterance = "edited";
        CHECK_FALSE(TraceRecorder::verify_chain(chain));
    }

    SECTION("dropping a record breaks the chain") {
        chain.erase(chain.begin() + 1);
        CHECK_FALSE(TraceRecorder::verify_chain(chain));
    }
}

TEST_CASE("TraceRecorder: memory window keeps only the newest records", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{.memory_window = 2});

    for (int i = 0; i < 5; ++i) {
        (void)recorder.record(make_record(kAnalyst, "turn " + std::to_string(i)));
    }

    auto stats = recorder.get_stats();
    CHECK(stats.total_recorded == 5);
    CHECK(stats.window_size == 2);

    auto recent = recorder.recent(kAdmin, 10);
    REQUIRE(recent.is_ok());
    REQUIRE(recent.value().size() == 2);
    CHECK(recent.value()[0].utterance == "turn 4");
    CHECK(recent.value()[1].utterance == "turn 3");
}

// ============================================================================
// Admin view
// ============================================================================

TEST_CASE("TraceRecorder: only admins can read traces", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});
    (void)recorder.record(make_record(kAnalyst, "hello"));

    auto denied = recorder.recent(kAnalyst, 10);
    REQUIRE(denied.is_error());
    CHECK(denied.error_category() == ErrorCategory::ACCESS_DENIED);

    CHECK(recorder.recent(kInactive, 10).is_error());
    CHECK(recorder.recent(999, 10).is_error());
}

TEST_CASE("TraceRecorder: recent is newest first and bounded by limit", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});
    for (int i = 0; i < 4; ++i) {
        (void)recorder.record(make_record(kAnalyst, "q" + std::to_string(i)));
    }

    auto r = recorder.recent(kAdmin, 3);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 3);
    CHECK(r.value()[0].sequence_num == 4);
    CHECK(r.value()[2].sequence_num == 2);
}

// ============================================================================
// Sinks
// ============================================================================

TEST_CASE("TraceRecorder: each record is one JSON line per sink", "[trace]") {
    AccessFixture f;
    std::vector<std::string> lines;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});
    recorder.add_sink(std::make_unique<CollectingSink>(lines));

    auto rec = make_record(kAnalyst, "why are \"tablets\" rated so well?");
    rec.rejection_reason = RejectionReason::ACCESS_DENIED;
    rec.offending_category = "Home Audio";
    rec.coercions.push_back({"top_n", "500", "50"});
    const auto committed = recorder.record(rec);

    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find('\n') == std::string::npos);

    auto doc = JsonValue::try_parse(lines[0]);
    REQUIRE(doc.has_value());
    CHECK((*doc)["trace_id"].as_string() == committed.trace_id);
    CHECK((*doc)["sequence_num"].as_int() == 1);
    CHECK((*doc)["utterance"].as_string() == "why are \"tablets\" rated so well?");
    CHECK((*doc)["router"]["status"].as_string() == "proposed");
    CHECK((*doc)["validation"]["rejection_reason"].as_string() == "access_denied");
    CHECK((*doc)["validation"]["offending_category"].as_string() == "Home Audio");
    CHECK((*doc)["validation"]["coercions"].size() == 1);
    CHECK((*doc)["result"]["total"].as_int() == 3);
    CHECK((*doc)["outcome"].as_string() == "answered");
    CHECK((*doc)["record_hash"].as_string() == committed.record_hash);
}

TEST_CASE("TraceRecorder: sink failures are counted, never thrown", "[trace]") {
    AccessFixture f;
    TraceRecorder recorder(f.access, TraceRecorder::Config{});
    recorder.add_sink(std::make_unique<FailingSink>());

    auto rec = recorder.record(make_record(kAnalyst, "still recorded"));
    CHECK(rec.sequence_num == 1);
    CHECK(recorder.get_stats().sink_write_failures == 1);
    CHECK(recorder.recent(kAdmin, 1).value().size() == 1);
}

TEST_CASE("FileSink: appends one line per record", "[trace]") {
    const auto path = temp_trace_path();
    {
        AccessFixture f;
        FileSink::Config cfg;
        cfg.output_file = path;
        TraceRecorder recorder(f.access, TraceRecorder::Config{});
        recorder.add_sink(std::make_unique<FileSink>(cfg));

        (void)recorder.record(make_record(kAnalyst, "a"));
        (void)recorder.record(make_record(kAnalyst, "b"));
        (void)recorder.record(make_record(kAnalyst, "c"));
        recorder.shutdown();
    }

    CHECK(count_lines(path) == 3);
    std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

TEST_CASE("FileSink: size-based rotation", "[trace]") {
    const auto path = temp_trace_path();
    {
        FileSink::Config cfg;
        cfg.output_file = path;
        cfg.max_file_size_bytes = 10;
        cfg.max_files = 3;
        FileSink sink(cfg);

        CHECK(sink.write("0123456789ABCDEF"));   // Over the limit after this write
        CHECK(sink.write("second"));             // Rotates first
        CHECK(sink.rotation_count() == 1);
        sink.shutdown();
    }

    CHECK(std::filesystem::exists(path + ".1"));
    CHECK(count_lines(path + ".1") == 1);
    CHECK(count_lines(path) == 1);
    std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

TEST_CASE("FileSink: unwritable path throws on construction", "[trace]") {
    FileSink::Config cfg;
    cfg.output_file = "/proc/reviewgate-no-such-dir/trace.jsonl";
    CHECK_THROWS_AS(FileSink{cfg}, std::runtime_error);
}
