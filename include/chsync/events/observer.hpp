/**
 * @file observer.hpp
 * @brief Progress and log sink injected into the scanner and orchestrator
 *
 * WHY THIS FILE EXISTS:
 * The scanner and the orchestrator report what they are doing, but must not
 * know who is listening (a terminal, a GUI, a test). They depend only on the
 * RunObserver interface; concrete sinks implement it.
 *
 * THREADING:
 * Callbacks are invoked on the orchestrator's worker thread. Implementations
 * must not block.
 */

#pragma once

#include "chsync/events/event_bus.hpp"
#include "chsync/sync/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace chsync::events {

enum class LogLevel {
    Info,
    Success,
    Warning,
    Error
};

const char* to_string(LogLevel level) noexcept;

class RunObserver {
public:
    virtual ~RunObserver() = default;

    /// current is 1-based and never exceeds total
    virtual void on_progress(std::size_t current, std::size_t total, const std::string& label) = 0;

    virtual void on_log(LogLevel level, const std::string& message) = 0;

    virtual void on_state_changed(sync::RunState /*previous*/, sync::RunState /*next*/) {}

    virtual void on_object_transferred(const std::string& /*relative_path*/, std::uint64_t /*bytes*/) {}

    virtual void on_object_failed(const std::string& /*relative_path*/, const std::string& /*error*/) {}

    virtual void on_object_deleted(std::int64_t /*message_id*/) {}

    virtual void on_run_finished(const sync::UploadResult& /*result*/) {}
};

/**
 * @brief Observer that discards everything
 */
class NullObserver final : public RunObserver {
public:
    void on_progress(std::size_t, std::size_t, const std::string&) override {}
    void on_log(LogLevel, const std::string&) override {}
};

/**
 * @brief Republishes observer callbacks as events on an EventBus
 *
 * Lets the spdlog LoggerComponent and the MetricsComponent react to a run
 * without the orchestrator knowing about either.
 */
class BusObserver final : public RunObserver {
public:
    explicit BusObserver(EventBus& bus) : bus_(bus) {}

    void on_progress(std::size_t current, std::size_t total, const std::string& label) override;
    void on_log(LogLevel level, const std::string& message) override;
    void on_state_changed(sync::RunState previous, sync::RunState next) override;
    void on_object_transferred(const std::string& relative_path, std::uint64_t bytes) override;
    void on_object_failed(const std::string& relative_path, const std::string& error) override;
    void on_object_deleted(std::int64_t message_id) override;
    void on_run_finished(const sync::UploadResult& result) override;

private:
    EventBus& bus_;
};

} // namespace chsync::events
