/**
 * @file events.hpp
 * @brief Events published while an upload run progresses
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: ObjectTransferredEvent, RunFinishedEvent.
 *
 * WHO EMITS:
 * BusObserver, on behalf of the orchestrator and scanner.
 *
 * WHO SUBSCRIBES:
 * LoggerComponent (spdlog), MetricsComponent (counters), the CLI.
 */

#pragma once

#include "chsync/events/observer.hpp"
#include "chsync/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chsync::events {

struct ProgressReportedEvent {
    std::size_t current = 0;
    std::size_t total = 0;
    std::string label;
};

struct LogRecordedEvent {
    LogLevel level = LogLevel::Info;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RunStateChangedEvent {
    sync::RunState previous = sync::RunState::Idle;
    sync::RunState next = sync::RunState::Idle;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectTransferredEvent {
    std::string relative_path;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectTransferFailedEvent {
    std::string relative_path;
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ObjectDeletedEvent {
    std::int64_t message_id = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RunFinishedEvent {
    sync::UploadResult result;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace chsync::events
