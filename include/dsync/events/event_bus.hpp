/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe channel for pipeline notifications
 *
 * WHY THIS FILE EXISTS:
 * The sync pipeline reports what it does (pages enumerated, folders created,
 * files copied or failed) without knowing who listens. The logger and the
 * progress counters subscribe; the pipeline never calls them directly.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<FileCopiedEvent>([](const FileCopiedEvent& e) { ... });
 * bus.emit(FileCopiedEvent{...});
 * // handler is removed when `sub` goes out of scope
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
#include <utility>
#include <vector>

namespace dsync::events {

class EventBus;

/**
 * @brief Move-only handle that unsubscribes its handler on destruction
 *
 * Components capture `this` in their handlers, so the handler must not
 * outlive the component. Holding the Subscription as a member ties the two
 * lifetimes together.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) { other.cancel_ = nullptr; }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            cancel_();
            cancel_ = nullptr;
        }
    }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() takes a shared lock only while copying the handler list, then calls
 *   the handlers synchronously in the emitting thread without holding it
 * - subscribe()/unsubscribe() take the exclusive lock
 * - a handler may subscribe or unsubscribe from inside a callback
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * The bus must outlive the returned Subscription.
     */
    template<typename EventType>
    [[nodiscard]] Subscription subscribe(std::function<void(const EventType&)> handler) {
        std::size_t handler_id = 0;
        {
            std::unique_lock lock(mutex_);
            handler_id = next_handler_id_++;
            handlers_[std::type_index(typeid(EventType))].emplace_back(
                handler_id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        }
        return Subscription([this, handler_id] { unsubscribe(std::type_index(typeid(EventType)), handler_id); });
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler throwing std::exception is logged; the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler exception for {}: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    void unsubscribe(std::type_index type_id, std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(type_id);
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                       [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    // event type -> (handler id, handler)
    std::unordered_map<std::type_index, std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace dsync::events
