/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the pipeline to its observers
 *
 * WHY THIS FILE EXISTS:
 * Scanner, hash engine and deleter publish progress and per-file outcomes
 * without depending on the progress bar, the logger or the metrics that
 * consume them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ScanProgressEvent>([](const ScanProgressEvent& e) { ... });
 * DirectoryScanner scanner(filter, &bus);
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
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dedup::events {

/**
 * @brief Type-safe synchronous event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from hash worker threads concurrently
 * - subscribe/unsubscribe take an exclusive lock
 * - Handlers run in the emitting thread, without the bus lock held
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Handler id for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});

        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        unsubscribe(std::type_index(typeid(EventType)), handler_id);
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

    /**
     * @brief Unsubscribes on destruction
     *
     * Lets a short-lived observer (a progress bar for one command) attach to
     * a bus that outlives it.
     */
    class Subscription {
    public:
        Subscription() = default;
        Subscription(EventBus& bus, std::type_index type, size_t id)
            : bus_(&bus), type_(type), id_(id) {}

        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : bus_(std::exchange(other.bus_, nullptr)), type_(other.type_), id_(other.id_) {}

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                bus_ = std::exchange(other.bus_, nullptr);
                type_ = other.type_;
                id_ = other.id_;
            }
            return *this;
        }

        void reset() {
            if (bus_ != nullptr) {
                bus_->unsubscribe(type_, id_);
                bus_ = nullptr;
            }
        }

        bool active() const noexcept { return bus_ != nullptr; }

    private:
        EventBus* bus_ = nullptr;
        std::type_index type_{typeid(void)};
        size_t id_ = 0;
    };

    template<typename EventType>
    [[nodiscard]] Subscription scoped_subscribe(std::function<void(const EventType&)> handler) {
        const size_t id = subscribe<EventType>(std::move(handler));
        return Subscription(*this, std::type_index(typeid(EventType)), id);
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    void unsubscribe(std::type_index type_id, size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(type_id);
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end());
    }

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;

    size_t next_handler_id_ = 0;
};

} // namespace dedup::events
