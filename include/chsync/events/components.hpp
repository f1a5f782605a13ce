/**
 * @file components.hpp
 * @brief Ready-made subscribers for run events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * BusObserver observer(bus);
 * // hand `observer` to the orchestrator; logging and counting just happen
 */

#pragma once

#include "chsync/events/event_bus.hpp"
#include "chsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace chsync::events {

/**
 * @brief Logs every run event through spdlog
 *
 * Progress is logged at debug level only; everything the user should see is
 * already carried by LogRecordedEvent.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<ProgressReportedEvent>([](const ProgressReportedEvent& e) {
            spdlog::debug("[Progress] {}/{} {}", e.current, e.total, e.label);
        }));

        ids_.push_back(bus_.subscribe<LogRecordedEvent>([](const LogRecordedEvent& e) {
            on_log(e);
        }));

        ids_.push_back(bus_.subscribe<RunStateChangedEvent>([](const RunStateChangedEvent& e) {
            spdlog::debug("[RunState] {} -> {}", sync::to_string(e.previous), sync::to_string(e.next));
        }));

        ids_.push_back(bus_.subscribe<ObjectTransferredEvent>([](const ObjectTransferredEvent& e) {
            spdlog::debug("[ObjectTransferred] path={} bytes={}", e.relative_path, e.bytes);
        }));

        ids_.push_back(bus_.subscribe<ObjectTransferFailedEvent>([](const ObjectTransferFailedEvent& e) {
            spdlog::debug("[ObjectFailed] path={} error={}", e.relative_path, e.error);
        }));

        ids_.push_back(bus_.subscribe<ObjectDeletedEvent>([](const ObjectDeletedEvent& e) {
            spdlog::debug("[ObjectDeleted] message_id={}", e.message_id);
        }));

        ids_.push_back(bus_.subscribe<RunFinishedEvent>([](const RunFinishedEvent& e) {
            on_finished(e);
        }));
    }

    ~LoggerComponent() {
        bus_.unsubscribe<ProgressReportedEvent>(ids_[0]);
        bus_.unsubscribe<LogRecordedEvent>(ids_[1]);
        bus_.unsubscribe<RunStateChangedEvent>(ids_[2]);
        bus_.unsubscribe<ObjectTransferredEvent>(ids_[3]);
        bus_.unsubscribe<ObjectTransferFailedEvent>(ids_[4]);
        bus_.unsubscribe<ObjectDeletedEvent>(ids_[5]);
        bus_.unsubscribe<RunFinishedEvent>(ids_[6]);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    static void on_log(const LogRecordedEvent& e) {
        switch (e.level) {
            case LogLevel::Error:
                spdlog::error("{}", e.message);
                break;
            case LogLevel::Warning:
                spdlog::warn("{}", e.message);
                break;
            case LogLevel::Success:
            case LogLevel::Info:
                spdlog::info("{}", e.message);
                break;
        }
    }

    static void on_finished(const RunFinishedEvent& e) {
        const auto& r = e.result;
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Run finished: {}", sync::to_string(r.outcome));
        spdlog::info("  uploaded={} skipped={} failed={} deleted={}",
                     r.files_uploaded, r.files_skipped, r.files_failed, r.objects_deleted);
        if (r.assigned_id) {
            spdlog::info("  id={} status={}", *r.assigned_id, r.status);
        }
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
    std::vector<std::size_t> ids_;
};

/**
 * @brief Counts objects and bytes moved during a run
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> objects_transferred{0};
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<std::uint64_t> objects_failed{0};
        std::atomic<std::uint64_t> objects_deleted{0};
        std::atomic<std::uint64_t> warnings{0};
        std::atomic<std::uint64_t> errors{0};
        std::atomic<std::uint64_t> runs_finished{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ObjectTransferredEvent>([this](const ObjectTransferredEvent& e) {
            stats_.objects_transferred++;
            stats_.bytes_transferred += e.bytes;
        });

        bus_.subscribe<ObjectTransferFailedEvent>([this](const ObjectTransferFailedEvent&) {
            stats_.objects_failed++;
        });

        bus_.subscribe<ObjectDeletedEvent>([this](const ObjectDeletedEvent&) {
            stats_.objects_deleted++;
        });

        bus_.subscribe<LogRecordedEvent>([this](const LogRecordedEvent& e) {
            if (e.level == LogLevel::Warning) {
                stats_.warnings++;
            } else if (e.level == LogLevel::Error) {
                stats_.errors++;
            }
        });

        bus_.subscribe<RunFinishedEvent>([this](const RunFinishedEvent&) {
            stats_.runs_finished++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer statistics:");
        spdlog::info("  Objects transferred: {}", stats_.objects_transferred.load());
        spdlog::info("  Bytes transferred:   {}", stats_.bytes_transferred.load());
        spdlog::info("  Objects failed:      {}", stats_.objects_failed.load());
        spdlog::info("  Objects deleted:     {}", stats_.objects_deleted.load());
        spdlog::info("  Warnings:            {}", stats_.warnings.load());
        spdlog::info("  Errors:              {}", stats_.errors.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chsync::events
