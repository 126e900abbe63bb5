#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace reviewgate {

/**
 * @brief Bounded-attempt jittered exponential backoff
 *
 * delay(n) = min(max_delay, base_delay * 2^(n-1)) * U[0.7, 1.3]
 * for the wait after failed attempt n. The overall deadline caps both
 * the per-attempt timeout and any wait.
 */
class RetryPolicy {
public:
    struct Config {
        uint32_t max_attempts = 3;
        std::chrono::milliseconds base_delay{800};
        std::chrono::milliseconds max_delay{10000};
        std::chrono::milliseconds attempt_timeout{15000};
        std::chrono::milliseconds overall_deadline{45000};
    };

    explicit RetryPolicy(const Config& config);

    [[nodiscard]] const Config& config() const { return config_; }

    /// Jittered wait after failed attempt `attempt` (1-based).
    [[nodiscard]] std::chrono::milliseconds backoff(uint32_t attempt);

    /// Unjittered upper envelope, min(max_delay, base * 2^(attempt-1)).
    [[nodiscard]] std::chrono::milliseconds nominal_backoff(uint32_t attempt) const;

    /**
     * @brief Sleep for `delay`, waking early on cancellation
     * @return false if cancelled while waiting
     */
    static bool sleep_for(std::chrono::milliseconds delay, const CancellationToken& cancel);

private:
    Config config_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace reviewgate
