#pragma once

#include "access/access_model.hpp"
#include "core/error.hpp"
#include "trace/trace_record.hpp"
#include "trace/trace_sink.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace reviewgate {

/**
 * @brief Single-append-per-Turn audit log with a SHA-256 hash chain
 *
 * record() assigns the sequence number, UTC timestamp and hash link under
 * one mutex, then writes the JSONL line to every sink in that same order.
 * Records are never updated or deleted; the in-memory window only drops
 * the oldest entries once it is full. Sink failures are counted and
 * logged, never propagated into the Turn.
 */
class TraceRecorder {
public:
    struct Config {
        size_t memory_window = 1000;
    };

    TraceRecorder(std::shared_ptr<AccessModel> access, const Config& config);
    ~TraceRecorder();

    TraceRecorder(const TraceRecorder&) = delete;
    TraceRecorder& operator=(const TraceRecorder&) = delete;

    void add_sink(std::unique_ptr<ITraceSink> sink);

    /// Commit a record. Returns the committed copy (sequence and hashes filled in).
    TraceRecord record(TraceRecord rec);

    /**
     * @brief Newest-first view of the in-memory window
     * @return ACCESS_DENIED unless `requester` is an active admin
     */
    [[nodiscard]] Result<std::vector<TraceRecord>> recent(UserId requester, size_t limit) const;

    void flush();
    void shutdown();

    [[nodiscard]] static std::string to_json(const TraceRecord& rec);

    /// SHA-256 over the identifying fields of `rec` plus the previous link.
    [[nodiscard]] static std::string compute_record_hash(const TraceRecord& rec,
                                                         const std::string& previous_hash);

    /// Recompute every link of an oldest-first sequence.
    [[nodiscard]] static bool verify_chain(const std::vector<TraceRecord>& oldest_first);

    struct Stats {
        uint64_t total_recorded;
        uint64_t sink_write_failures;
        size_t window_size;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<AccessModel> access_;
    Config config_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ITraceSink>> sinks_;
    std::deque<TraceRecord> window_;
    uint64_t next_sequence_ = 1;
    std::string previous_hash_;
    uint64_t sink_write_failures_ = 0;
    bool shut_down_ = false;
};

} // namespace reviewgate
