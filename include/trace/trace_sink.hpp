#pragma once

#include <string>
#include <string_view>

namespace reviewgate {

/**
 * @brief Abstract interface for trace output destinations
 *
 * Sinks receive serialized JSONL records from the TraceRecorder, always
 * under the recorder's append lock and in sequence order, so
 * implementations need no internal locking.
 */
class ITraceSink {
public:
    virtual ~ITraceSink() = default;

    /// Write a single JSON-serialized trace record. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/reviewgate/trace.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace reviewgate
