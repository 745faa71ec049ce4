/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef MING_EVENT_BUS_HPP
#define MING_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace ming {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The ConversionOrchestrator publishes progress events without
     * knowing who listens; the CLI and the Converter facade subscribe to
     * the event types they care about. Subscriptions and publications are
     * serialized by a mutex, so handlers must not publish re-entrantly.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., PdfCreatedEvent).
         * @param handler Function invoked with a const reference to each event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

        /// Number of handlers registered for an event type.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace ming

#endif // MING_EVENT_BUS_HPP
