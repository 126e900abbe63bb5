#include "trace/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace reviewgate {

FileSink::FileSink(const Config& config)
    : config_(config),
      last_rotation_time_(std::chrono::system_clock::now()) {
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open trace file: " + config_.output_file);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_line) {
    check_rotation();
    if (!file_stream_.is_open()) return false;

    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.put('\n');
    current_file_size_ += json_line.size() + 1;
    return file_stream_.good();
}

void FileSink::flush() {
    if (file_stream_.is_open()) file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

void FileSink::check_rotation() {
    bool need_rotate = false;

    if (config_.size_based_rotation &&
        current_file_size_ >= config_.max_file_size_bytes) {
        need_rotate = true;
    }

    if (config_.time_based_rotation &&
        std::chrono::system_clock::now() - last_rotation_time_ >= config_.rotation_interval) {
        need_rotate = true;
    }

    if (need_rotate) {
        rotate_file();
    }
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);

    // .N -> .N+1; gaps in the sequence are expected
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }

    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);
    if (ec) {
        utils::log::warn(std::format("trace: rotating {} failed: {}", config_.output_file, ec.message()));
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        utils::log::error(std::format("trace: cannot reopen {}", config_.output_file));
    }
    current_file_size_ = 0;
    last_rotation_time_ = std::chrono::system_clock::now();
    ++rotation_count_;
}

} // namespace reviewgate
