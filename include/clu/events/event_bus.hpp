/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe between session code and its observers
 *
 * UpdateSession, TransferTask owners and the orchestrator report what
 * happened (opened, renewed, uploaded, went defunct); LoggerComponent and
 * MetricsComponent turn that into log lines and counters. Neither side
 * holds a reference to the other.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<SessionDefunctEvent>([](const SessionDefunctEvent& e) { ... });
 * bus.emit(SessionDefunctEvent{"session-1", "not found on server"});
 * bus.unsubscribe<SessionDefunctEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace clu::events {

/**
 * @brief Synchronous event bus keyed by event type
 *
 * THREAD SAFETY:
 * - The orchestrating thread emits session events while an upload is in
 *   flight; any thread may subscribe, unsubscribe or emit
 * - Handlers run on the emitting thread, outside the bus lock, so a
 *   handler may emit further events
 */
class EventBus {
public:
    using SubscriptionId = size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Register a handler for EventType; the id is needed to unsubscribe.
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto callback = std::make_shared<const Callback>(
            [handler = std::move(handler)](const void* event) {
                handler(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        slots_[key<EventType>()].push_back(Slot{id, std::move(callback)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(key<EventType>());
        if (it == slots_.end()) {
            return;
        }
        auto& slots = it->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * An exception escaping one handler is logged with the event type and
     * does not stop delivery to the others.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        for (const auto& callback : snapshot(key<EventType>())) {
            try {
                (*callback)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler failed event={} error={}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(key<EventType>());
        return it == slots_.end() ? 0 : it->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    using Callback = std::function<void(const void*)>;

    struct Slot {
        SubscriptionId id;
        std::shared_ptr<const Callback> callback;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<const Callback>> snapshot(std::type_index type) const {
        std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<const Callback>> callbacks;
        auto it = slots_.find(type);
        if (it != slots_.end()) {
            callbacks.reserve(it->second.size());
            for (const auto& slot : it->second) {
                callbacks.push_back(slot.callback);
            }
        }
        return callbacks;
    }

    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace clu::events
