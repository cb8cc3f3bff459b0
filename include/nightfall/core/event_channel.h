#pragma once
/**
 * @file event_channel.h
 * @brief Typed publish/subscribe channel
 *
 * Each component exposes one channel per event type instead of a shared
 * string-keyed callback map. Subscribers receive a handle they can later
 * use to unsubscribe; handlers with a lower order run first.
 *
 * Dispatch is synchronous on the publishing thread. A handler may subscribe
 * or unsubscribe during dispatch; changes take effect from the next publish.
 */

#include "nightfall/core/types.h"
#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace nightfall::core {

template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;

    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;
    EventChannel(EventChannel&&) noexcept = default;
    EventChannel& operator=(EventChannel&&) noexcept = default;

    /**
     * @brief Register a handler
     * @param handler Callback invoked for every published event
     * @param order Execution order (lower = earlier)
     * @return Subscription handle
     */
    SubscriptionId subscribe(Handler handler, int order = 0) {
        SubscriptionId id = next_id_++;
        Entry entry{id, order, std::move(handler)};
        auto pos = std::upper_bound(entries_.begin(), entries_.end(), order,
            [](int value, const Entry& e) { return value < e.order; });
        entries_.insert(pos, std::move(entry));
        return id;
    }

    /**
     * @brief Remove a handler
     * @return false if the handle is unknown
     */
    bool unsubscribe(SubscriptionId id) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [id](const Entry& e) { return e.id == id; });
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    void publish(const Event& event) {
        if (entries_.empty()) {
            return;
        }
        // Snapshot so handlers can change subscriptions while we iterate
        std::vector<Entry> snapshot = entries_;
        for (const auto& entry : snapshot) {
            if (entry.handler) {
                entry.handler(event);
            }
        }
    }

    SizeT subscriber_count() const { return entries_.size(); }

    void clear() { entries_.clear(); }

private:
    struct Entry {
        SubscriptionId id{INVALID_SUBSCRIPTION_ID};
        int order{0};
        Handler handler;
    };

    std::vector<Entry> entries_;
    SubscriptionId next_id_{1};
};

} // namespace nightfall::core
