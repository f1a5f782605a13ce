#include "chsync/events/observer.hpp"

#include "chsync/events/events.hpp"

namespace chsync::events {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

void BusObserver::on_progress(std::size_t current, std::size_t total, const std::string& label) {
    bus_.emit(ProgressReportedEvent{current, total, label});
}

void BusObserver::on_log(LogLevel level, const std::string& message) {
    bus_.emit(LogRecordedEvent{level, message});
}

void BusObserver::on_state_changed(sync::RunState previous, sync::RunState next) {
    bus_.emit(RunStateChangedEvent{previous, next});
}

void BusObserver::on_object_transferred(const std::string& relative_path, std::uint64_t bytes) {
    bus_.emit(ObjectTransferredEvent{relative_path, bytes});
}

void BusObserver::on_object_failed(const std::string& relative_path, const std::string& error) {
    bus_.emit(ObjectTransferFailedEvent{relative_path, error});
}

void BusObserver::on_object_deleted(std::int64_t message_id) {
    bus_.emit(ObjectDeletedEvent{message_id});
}

void BusObserver::on_run_finished(const sync::UploadResult& result) {
    bus_.emit(RunFinishedEvent{result});
}

} // namespace chsync::events
