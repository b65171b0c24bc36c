//
// Type-indexed publish/subscribe bus.
//

/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus carrying pipeline progress.
 */

#ifndef PDFSHRINK_EVENT_BUS_HPP
#define PDFSHRINK_EVENT_BUS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pdfshrink {

    /**
     * @brief Routes events to the handlers registered for their type.
     *
     * @details PdfCompressor publishes progress and results without knowing
     * who listens; the CLI subscribes to draw progress and collect the run
     * report. publish() snapshots the handler list and invokes it with the
     * bus unlocked, so handlers may publish or unsubscribe. A handler
     * removed during a publish may still receive that one event.
     */
    class EventBus {
    public:
        using SubscriptionId = std::uint64_t;

        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Registers @p handler for events of type @p Event.
         * @return Id accepted by unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            auto callback = std::make_shared<Callback>(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            subscribers_[std::type_index(typeid(Event))].push_back({id, std::move(callback)});
            return id;
        }

        /// @return false if @p id is unknown or already removed.
        bool unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : subscribers_) {
                for (auto it = entries.begin(); it != entries.end(); ++it) {
                    if (it->id == id) {
                        entries.erase(it);
                        return true;
                    }
                }
            }
            return false;
        }

        /**
         * @brief Delivers @p event to every current subscriber of its type,
         * in subscription order, on the calling thread.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<std::shared_ptr<const Callback>> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets.reserve(it->second.size());
                for (const auto& entry : it->second) {
                    targets.push_back(entry.callback);
                }
            }
            for (const auto& fn : targets) {
                (*fn)(&event);
            }
        }

        /// @return Number of handlers registered for @p Event.
        template <typename Event>
        [[nodiscard]] size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;

        struct Entry {
            SubscriptionId id;
            std::shared_ptr<const Callback> callback;
        };

        std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
        SubscriptionId last_id_ = 0;
        mutable std::mutex mtx_;
    };

} // namespace pdfshrink

#endif // PDFSHRINK_EVENT_BUS_HPP
