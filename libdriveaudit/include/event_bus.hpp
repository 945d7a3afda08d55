/**
 * @file event_bus.hpp
 * @brief Thread-safe, typed publish/subscribe bus for batch progress events.
 */

#ifndef DRIVEAUDIT_EVENT_BUS_HPP
#define DRIVEAUDIT_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace driveaudit {

    /**
     * @brief Typed publish/subscribe event bus.
     *
     * @details The orchestrator publishes progress events from its own thread
     * and from pool workers; subscribers (the facade's observer bridge, the
     * CLI progress bar) receive them on the publishing thread. Handlers are
     * invoked outside the bus lock, so a handler may subscribe or publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g. FileExtractCompleteEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [h = std::move(handler)](const void* e) { h(*static_cast<const Event*>(e)); });
        }

        /**
         * @brief Deliver @p event to every subscriber of its type.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                handlers = it->second;
            }
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace driveaudit

#endif // DRIVEAUDIT_EVENT_BUS_HPP
