#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace leastrecent {

namespace detail {

// Lets a Subscription reach back into a notifier of any key/value type.
class HandlerRegistry {
public:
    virtual ~HandlerRegistry() = default;
    virtual void Remove(std::uint64_t id) = 0;
};

// Writes a failed handler's message to std::cerr.
void ReportHandlerFailure(const std::exception& error);

} // namespace detail

/**
 * @class Subscription
 * @brief Token returned by a subscribe call; Unsubscribe() detaches the handler.
 *
 * Dropping the token does not unsubscribe. Unsubscribe() may be called any
 * number of times, and after the notifier itself is gone.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<detail::HandlerRegistry> registry, std::uint64_t id);

    void Unsubscribe();

    // True until Unsubscribe() is called or the notifier is destroyed.
    bool Active() const;

private:
    std::weak_ptr<detail::HandlerRegistry> registry_;
    std::uint64_t id_ = 0;
};

/**
 * @class EvictionNotifier
 * @brief Ordered, synchronous registry of eviction handlers.
 *
 * The handler list is copy-on-write: Subscribe() and Unsubscribe() build a
 * new list, and Notify() walks the list that was current when it started.
 * A handler that unsubscribes during delivery therefore still sees the
 * running delivery through, and Notify() itself never allocates.
 */
template <typename K, typename V>
class EvictionNotifier {
public:
    using Handler = std::function<void(const K&, const V&)>;

    EvictionNotifier() : registry_(std::make_shared<Registry>()) {}

    Subscription Subscribe(Handler handler) {
        auto next = std::make_shared<std::vector<Entry>>(*registry_->entries);
        const std::uint64_t id = registry_->next_id++;
        next->push_back(Entry{id, std::move(handler)});
        registry_->entries = std::move(next);
        return Subscription(registry_, id);
    }

    void Notify(const K& key, const V& value, HandlerFailurePolicy policy) const {
        // Hold the current list; unsubscribes during delivery swap in a new one.
        std::shared_ptr<const std::vector<Entry>> entries = registry_->entries;
        for (const auto& entry : *entries) {
            if (policy == HandlerFailurePolicy::kPropagate) {
                entry.handler(key, value);
                continue;
            }
            try {
                entry.handler(key, value);
            } catch (const std::exception& e) {
                detail::ReportHandlerFailure(e);
            }
        }
    }

    std::size_t HandlerCount() const { return registry_->entries->size(); }

private:
    struct Entry {
        std::uint64_t id;
        Handler handler;
    };

    class Registry : public detail::HandlerRegistry {
    public:
        void Remove(std::uint64_t id) override {
            auto next = std::make_shared<std::vector<Entry>>();
            next->reserve(entries->size());
            for (const auto& entry : *entries) {
                if (entry.id != id) {
                    next->push_back(entry);
                }
            }
            entries = std::move(next);
        }

        std::shared_ptr<const std::vector<Entry>> entries = std::make_shared<std::vector<Entry>>();
        std::uint64_t next_id = 1;
    };

    std::shared_ptr<Registry> registry_;
};

} // namespace leastrecent
