//
// Created by Giuseppe Francione on 03/02/26.
//

/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between operations and observers.
 */

#ifndef FOLIO_EVENT_BUS_HPP
#define FOLIO_EVENT_BUS_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace folio {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details Operations publish events (see events.hpp) without knowing
     * who listens. Handlers run synchronously on the publishing thread, in
     * subscription order, outside the bus lock: a handler may publish or
     * unsubscribe without deadlocking.
     */
    class EventBus {
    public:
        using SubscriptionId = std::uint64_t;

        /**
         * @brief Registers @p handler for events of type @p Event.
         * @return Identifier accepted by unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            subscribers_[std::type_index(typeid(Event))].push_back(
                {id, [handler = std::move(handler)](const void* e) { handler(*static_cast<const Event*>(e)); }});
            return id;
        }

        /// @brief Removes one subscription; unknown ids are ignored.
        void unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : subscribers_) {
                std::erase_if(entries, [id](const Entry& entry) { return entry.id == id; });
            }
        }

        template <typename Event>
        void publish(const Event& event) {
            std::vector<Entry> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& entry : targets) {
                entry.callback(&event);
            }
        }

        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        struct Entry {
            SubscriptionId id;
            std::function<void(const void*)> callback;
        };

        std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
        SubscriptionId last_id_ = 0;
        std::mutex mtx_;
    };

} // namespace folio

#endif // FOLIO_EVENT_BUS_HPP
