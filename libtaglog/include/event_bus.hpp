//
// Created by Giuseppe Francione on 02/10/26.
//

/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef TAGLOG_EVENT_BUS_HPP
#define TAGLOG_EVENT_BUS_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace taglog {

    /// Handle returned by EventBus::subscribe, used to unsubscribe later.
    using SubscriptionId = std::uint64_t;

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details EventBus allows decoupled communication between components.
     * The Logger broadcasts LoggedEvent / ErrorLoggedEvent without knowing
     * who is listening; consumers subscribe to the event types they need.
     *
     * Handlers run synchronously on the publishing thread, in registration
     * order. The bus lock is only held to copy the handler list, so a handler
     * may subscribe, unsubscribe or publish again. A handler that throws a
     * std::exception is reported to the error handler and the remaining
     * handlers still run.
     */
    class EventBus {
    public:
        /// Receives the exception of a failing handler.
        using ErrorHandler = std::function<void(const std::exception&)>;

        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., LoggedEvent).
         * @param handler Function to invoke when an event of this type is published.
         * The handler will receive a const reference to the event.
         * @return Identifier to pass to unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = next_id_++;
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back({id, std::make_shared<const Callback>(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                })});
            return id;
        }

        /**
         * @brief Remove a previously registered handler.
         * @param id Identifier returned by subscribe().
         * @return true if a handler was removed.
         */
        bool unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, vec] : subscribers_) {
                for (auto it = vec.begin(); it != vec.end(); ++it) {
                    if (it->id == id) {
                        vec.erase(it);
                        return true;
                    }
                }
            }
            return false;
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Entry> handlers;
            ErrorHandler on_error;
            {
                std::lock_guard lock(mtx_);
                auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end() || it->second.empty()) {
                    return;
                }
                handlers = it->second;
                on_error = error_handler_;
            }

            for (const auto& entry : handlers) {
                try {
                    (*entry.fn)(&event);
                } catch (const std::exception& e) {
                    if (on_error) {
                        on_error(e);
                    } else {
                        std::cerr << "[taglog] event handler failed: " << e.what() << std::endl;
                    }
                }
            }
        }

        /**
         * @brief Number of handlers currently subscribed to an event type.
         */
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it != subscribers_.end() ? it->second.size() : 0;
        }

        /**
         * @brief Replace the handler that receives failures of event handlers.
         * An empty function restores the default (a line on std::cerr).
         */
        void set_error_handler(ErrorHandler handler) {
            std::lock_guard lock(mtx_);
            error_handler_ = std::move(handler);
        }

    private:
        ///< Type alias for the internal type-erased callback.
        using Callback = std::function<void(const void*)>;

        struct Entry {
            SubscriptionId id;
            std::shared_ptr<const Callback> fn;
        };

        ///< Map of event type_index to the handlers in registration order.
        std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
        ErrorHandler error_handler_;
        SubscriptionId next_id_ = 1;
        ///< Protects subscriber map during read/write.
        mutable std::mutex mtx_;
    };

} // namespace taglog

#endif // TAGLOG_EVENT_BUS_HPP
