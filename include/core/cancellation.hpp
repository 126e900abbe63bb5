#pragma once

#include <atomic>
#include <memory>

namespace reviewgate {

/**
 * @brief Shared cancel flag for one Turn
 *
 * Copies share state. A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] static CancellationToken create() {
        CancellationToken t;
        t.flag_ = std::make_shared<std::atomic<bool>>(false);
        return t;
    }

    void cancel() const {
        if (flag_) flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace reviewgate
