/**
 * @file event_bus.hpp
 * @brief Type-keyed publish/subscribe hub for run events
 *
 * WHY THIS FILE EXISTS:
 * A run produces progress, log lines, per-object outcomes and a final
 * result. Several independent sinks (spdlog logger, metrics counters, a CLI
 * progress line) want some of them. The bus lets each sink subscribe to the
 * event types it cares about without the producer knowing about any of them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<RunFinishedEvent>([](const RunFinishedEvent& e) { ... });
 * bus.emit(RunFinishedEvent{result});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chsync::events {

/**
 * @brief Synchronous, thread-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS: Id to pass to unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = next_handler_id_++;
        auto erased = std::make_shared<ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });
        handlers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(erased));
        return id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler that throws std::exception is logged and skipped; the
     * remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<ErasedHandler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<ErasedHandler>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace chsync::events
