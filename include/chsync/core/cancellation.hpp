#pragma once

#include <atomic>
#include <memory>

namespace chsync {

/**
 * @brief Shared cooperative cancellation flag
 *
 * Copies share the same flag. The owner of a long-running operation polls
 * is_cancelled() between units of work; any holder may call cancel().
 * cancel() only performs a lock-free atomic store, so it may be called from
 * a signal handler.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace chsync
