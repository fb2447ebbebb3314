/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe hub for transfer events
 *
 * The command-line tool forwards engine progress onto the bus; logging and
 * console rendering subscribe to it without the engine knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkWrittenEvent>([](const ChunkWrittenEvent& e) { ... });
 * bus.emit(ChunkWrittenEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xfer::events {

/**
 * @brief Synchronous event bus
 *
 * Handlers run on the emitting thread, in subscription order. Subscribing
 * and emitting are safe from several threads; the handler list is copied
 * before dispatch so a handler may subscribe without deadlocking.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * @return id to pass to unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<TypedHandler<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const auto& entry) { return entry.first == id; }),
                      entries.end());
    }

    /**
     * @brief Deliver an event to every handler of its type
     *
     * A handler that throws is logged and skipped; the others still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }

        for (const auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) const = 0;
    };

    template<typename EventType>
    struct TypedHandler : HandlerBase {
        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        // Only ever invoked with the EventType this handler was registered for
        void call(const void* event) const override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace xfer::events
