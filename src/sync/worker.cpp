#include "chsync/sync/worker.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace chsync::sync {

UploadWorker::UploadWorker(UploadOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {}

UploadWorker::~UploadWorker() {
    if (thread_.joinable()) {
        cancel();
        thread_.join();
    }
}

chsync::Result<void> UploadWorker::start(UploadRequest request) {
    if (running_.load(std::memory_order_acquire) || thread_.joinable()) {
        return chsync::Err<void>(std::string("An upload is already in progress"));
    }

    std::packaged_task<UploadResult(UploadRequest)> task([this](UploadRequest req) {
        auto result = orchestrator_.run(req);
        running_.store(false, std::memory_order_release);
        return result;
    });
    result_ = task.get_future();

    running_.store(true, std::memory_order_release);
    thread_ = std::thread(std::move(task), std::move(request));
    spdlog::debug("[UploadWorker] started");
    return chsync::Ok();
}

void UploadWorker::cancel() const noexcept {
    orchestrator_.token().cancel();
}

chsync::Result<UploadResult> UploadWorker::wait() {
    if (!result_.valid()) {
        return chsync::Err<UploadResult>(std::string("No upload has been started"));
    }

    try {
        auto result = result_.get();
        thread_.join();
        return chsync::Ok(std::move(result));
    } catch (const std::exception& e) {
        if (thread_.joinable()) {
            thread_.join();
        }
        running_.store(false, std::memory_order_release);
        spdlog::error("[UploadWorker] run aborted: {}", e.what());
        return chsync::Err<UploadResult>(std::string("Upload aborted: ") + e.what());
    }
}

} // namespace chsync::sync
