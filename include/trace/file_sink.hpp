#pragma once

#include "trace/trace_sink.hpp"
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace reviewgate {

/**
 * @brief JSONL trace file with size and time-based rotation
 *
 * Rotated files are named trace.jsonl.1, trace.jsonl.2, ... with .1 the
 * most recent. Files beyond max_files are deleted.
 */
class FileSink : public ITraceSink {
public:
    struct Config {
        std::string output_file = "trace.jsonl";
        size_t max_file_size_bytes = 50ULL * 1024 * 1024;  // 50MB
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = false;
        bool size_based_rotation = true;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void check_rotation();
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point last_rotation_time_;
};

} // namespace reviewgate
