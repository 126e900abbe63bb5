#include "router/retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace reviewgate {

RetryPolicy::RetryPolicy(const Config& config)
    : config_(config), rng_(std::random_device{}()) {
    config_.max_attempts = std::max<uint32_t>(config_.max_attempts, 1);
}

std::chrono::milliseconds RetryPolicy::nominal_backoff(uint32_t attempt) const {
    const uint32_t exponent = std::min<uint32_t>(attempt > 0 ? attempt - 1 : 0, 30);
    const auto raw = config_.base_delay.count() * (int64_t{1} << exponent);
    return std::chrono::milliseconds(std::min<int64_t>(raw, config_.max_delay.count()));
}

std::chrono::milliseconds RetryPolicy::backoff(uint32_t attempt) {
    double factor = 1.0;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> jitter(0.7, 1.3);
        factor = jitter(rng_);
    }
    const auto nominal = nominal_backoff(attempt);
    return std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(nominal.count()) * factor));
}

bool RetryPolicy::sleep_for(std::chrono::milliseconds delay, const CancellationToken& cancel) {
    constexpr auto kSlice = std::chrono::milliseconds(10);
    const auto until = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < until) {
        if (cancel.is_cancelled()) return false;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            until - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, kSlice));
    }
    return !cancel.is_cancelled();
}

} // namespace reviewgate
