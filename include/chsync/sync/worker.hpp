#pragma once

/**
 * @file worker.hpp
 * @brief Runs an UploadOrchestrator on a background thread
 *
 * EXAMPLE:
 * UploadWorker worker(orchestrator);
 * worker.start(request);
 * ...
 * worker.cancel();                // from any thread, e.g. a signal watcher
 * auto result = worker.wait();    // joins
 *
 * Only one run at a time. The destructor cancels and joins.
 */

#include "chsync/core/result.hpp"
#include "chsync/sync/orchestrator.hpp"
#include "chsync/sync/types.hpp"

#include <atomic>
#include <future>
#include <thread>

namespace chsync::sync {

class UploadWorker {
public:
    explicit UploadWorker(UploadOrchestrator& orchestrator);
    ~UploadWorker();

    UploadWorker(const UploadWorker&) = delete;
    UploadWorker& operator=(const UploadWorker&) = delete;

    chsync::Result<void> start(UploadRequest request);

    /// Requests cooperative cancellation of the current run
    void cancel() const noexcept;

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Block until the current run finishes
     *
     * RETURNS: The run's result, or an error if no run was started
     */
    chsync::Result<UploadResult> wait();

private:
    UploadOrchestrator& orchestrator_;
    std::thread thread_;
    std::future<UploadResult> result_;
    std::atomic<bool> running_{false};
};

} // namespace chsync::sync
