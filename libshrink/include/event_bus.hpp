/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus between the driver and the CLI.
 */

#ifndef SHRINK_EVENT_BUS_HPP
#define SHRINK_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace shrink {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details BatchDriver publishes progress without knowing who listens;
     * the CLI subscribes to print per-file lines and the progress bar.
     * Handlers run synchronously on the publishing thread, under the bus
     * mutex, so a handler must not publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

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

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace shrink

#endif // SHRINK_EVENT_BUS_HPP
