/**
 * @file action_queue.cpp
 * @brief Optimistic action queue implementation
 */

#include "nightfall/sync/action_queue.h"
#include "nightfall/core/logging.h"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <random>
#include <unordered_map>

namespace nightfall::sync {

std::optional<ActionPriority> action_priority_from_string(const std::string& name) {
    if (name == "high") return ActionPriority::High;
    if (name == "medium") return ActionPriority::Medium;
    if (name == "low") return ActionPriority::Low;
    return std::nullopt;
}

ActionId generate_action_id(Timestamp now) {
    static std::atomic<UInt64> sequence{0};
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<UInt32> dist(0, 0xFFFFFF);

    UInt64 seq = sequence.fetch_add(1) % 1000000;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%013lld-%06llu-%06x",
                  static_cast<long long>(now),
                  static_cast<unsigned long long>(seq),
                  static_cast<unsigned int>(dist(rng)));
    return ActionId(buf);
}

// ============================================================================
// ActionQueue::Impl
// ============================================================================

struct ActionQueue::Impl {
    Impl(core::IScheduler& s, const ActionQueueConfig& c)
        : scheduler(s), config(c) {}

    ~Impl() {
        for (auto& [id, timer] : ack_timers) {
            scheduler.cancel(timer);
        }
        if (flush_timer != INVALID_TIMER_ID) {
            scheduler.cancel(flush_timer);
        }
    }

    core::IScheduler& scheduler;
    ActionQueueConfig config;
    IActionTransmitter* transmitter{nullptr};

    // Insertion order; sorted on demand
    std::vector<QueuedAction> actions;
    std::unordered_map<ActionId, TimerId> ack_timers;
    TimerId flush_timer{INVALID_TIMER_ID};

    core::EventChannel<ActionEvent> events;
    ActionQueueStats stats;

    // ------------------------------------------------------------------------

    std::vector<QueuedAction>::iterator locate(const ActionId& id) {
        return std::find_if(actions.begin(), actions.end(),
            [&](const QueuedAction& a) { return a.id == id; });
    }

    std::vector<QueuedAction> ordered() const {
        std::vector<QueuedAction> copy = actions;
        std::stable_sort(copy.begin(), copy.end(),
            [](const QueuedAction& a, const QueuedAction& b) {
                if (a.created_at != b.created_at) return a.created_at < b.created_at;
                return a.id < b.id;
            });
        return copy;
    }

    void publish(ActionEvent::Kind kind, const QueuedAction& action, const std::string& reason = "") {
        ActionEvent event;
        event.kind = kind;
        event.action = action;
        event.reason = reason;
        events.publish(event);
    }

    void cancel_ack_timer(const ActionId& id) {
        auto it = ack_timers.find(id);
        if (it != ack_timers.end()) {
            scheduler.cancel(it->second);
            ack_timers.erase(it);
        }
    }

    bool transmit(const ActionId& id) {
        if (!transmitter || !transmitter->can_transmit()) {
            return false;
        }
        auto it = locate(id);
        if (it == actions.end()) {
            return false;
        }
        QueuedAction outgoing = *it;
        bool is_retry = outgoing.is_retry();
        if (!transmitter->transmit(outgoing, is_retry)) {
            return false;
        }

        // The transport may have delivered an answer synchronously
        it = locate(id);
        if (it == actions.end() || it->status != ActionStatus::Pending) {
            return true;
        }
        it->status = ActionStatus::InFlight;
        ++it->transmit_count;
        ++stats.transmissions;
        QueuedAction snapshot = *it;
        arm_ack_timer(id);
        log::logger()->debug("queue: transmitted {} {}{}", snapshot.kind, id,
                             is_retry ? " (retry)" : "");
        publish(ActionEvent::Kind::Transmitted, snapshot);
        return true;
    }

    void arm_ack_timer(const ActionId& id) {
        cancel_ack_timer(id);
        TimerId timer = scheduler.schedule_after(config.ack_timeout, [this, id] {
            ack_timers.erase(id);
            auto it = locate(id);
            if (it == actions.end() || it->status != ActionStatus::InFlight) {
                return;
            }
            it->status = ActionStatus::TimedOut;
            ++stats.timed_out;
            log::logger()->warn("queue: no ack for {} within {} ms", id, config.ack_timeout.count());
            publish(ActionEvent::Kind::TimedOut, *it);
        });
        ack_timers[id] = timer;
    }

    void schedule_flush() {
        if (flush_timer != INVALID_TIMER_ID) {
            return;   // one pending cycle covers every retry
        }
        flush_timer = scheduler.schedule_after(config.retry_flush_delay, [this] {
            flush_timer = INVALID_TIMER_ID;
            flush();
        });
    }

    SizeT flush() {
        if (!transmitter || !transmitter->can_transmit()) {
            return 0;
        }
        SizeT sent = 0;
        for (const auto& snapshot : ordered()) {
            if (snapshot.status != ActionStatus::Pending) {
                continue;
            }
            // Handlers run during transmit may have removed the action
            auto it = locate(snapshot.id);
            if (it == actions.end() || it->status != ActionStatus::Pending) {
                continue;
            }
            if (!transmit(snapshot.id)) {
                break;   // keep creation order: stop at the first failure
            }
            ++sent;
        }
        return sent;
    }
};

// ============================================================================
// ActionQueue
// ============================================================================

ActionQueue::ActionQueue(core::IScheduler& scheduler, const ActionQueueConfig& config)
    : impl_(std::make_unique<Impl>(scheduler, config)) {}

ActionQueue::~ActionQueue() = default;

ActionQueue::ActionQueue(ActionQueue&&) noexcept = default;
ActionQueue& ActionQueue::operator=(ActionQueue&&) noexcept = default;

void ActionQueue::set_transmitter(IActionTransmitter* transmitter) {
    impl_->transmitter = transmitter;
}

QueueResult ActionQueue::enqueue(const ActionRequest& request, ActionId& out_id) {
    if (request.kind.empty()) {
        return QueueResult::InvalidAction;
    }
    if (impl_->actions.size() >= impl_->config.max_queue_size) {
        log::logger()->warn("queue: full ({} actions), rejecting {}", impl_->actions.size(), request.kind);
        return QueueResult::QueueFull;
    }

    QueuedAction action;
    action.created_at = impl_->scheduler.now();
    action.id = generate_action_id(action.created_at);
    action.kind = request.kind;
    action.payload = request.payload;
    action.priority = request.priority;
    action.max_retries = request.max_retries.value_or(impl_->config.default_max_retries);

    impl_->actions.push_back(action);
    ++impl_->stats.enqueued;
    out_id = action.id;
    log::logger()->debug("queue: enqueued {} {}", action.kind, action.id);

    impl_->publish(ActionEvent::Kind::Enqueued, action);

    // A handler may already have settled the action
    auto it = impl_->locate(out_id);
    if (it != impl_->actions.end() && it->status == ActionStatus::Pending) {
        impl_->transmit(out_id);
    }
    return QueueResult::Success;
}

QueueResult ActionQueue::restore(QueuedAction action) {
    if (action.id.empty() || action.kind.empty()) {
        return QueueResult::InvalidAction;
    }
    if (impl_->locate(action.id) != impl_->actions.end()) {
        return QueueResult::DuplicateAction;
    }
    action.status = ActionStatus::Pending;
    impl_->actions.push_back(action);
    impl_->publish(ActionEvent::Kind::Restored, action);
    return QueueResult::Success;
}

QueueResult ActionQueue::acknowledge(const ActionId& id) {
    auto it = impl_->locate(id);
    if (it == impl_->actions.end()) {
        return QueueResult::ActionNotFound;
    }
    impl_->cancel_ack_timer(id);
    QueuedAction action = std::move(*it);
    impl_->actions.erase(it);
    ++impl_->stats.acknowledged;
    log::logger()->debug("queue: acknowledged {}", id);
    impl_->publish(ActionEvent::Kind::Acknowledged, action);
    return QueueResult::Success;
}

QueueResult ActionQueue::reject(const ActionId& id, const std::string& reason) {
    auto it = impl_->locate(id);
    if (it == impl_->actions.end()) {
        return QueueResult::ActionNotFound;
    }
    impl_->cancel_ack_timer(id);
    ++impl_->stats.rejected;

    if (it->retry_count < it->max_retries) {
        ++it->retry_count;
        it->created_at = impl_->scheduler.now();
        it->status = ActionStatus::Pending;
        log::logger()->warn("queue: {} rejected ({}), retry {}/{}",
                            id, reason, it->retry_count, it->max_retries);
        QueuedAction snapshot = *it;
        impl_->schedule_flush();
        impl_->publish(ActionEvent::Kind::Retrying, snapshot, reason);
        return QueueResult::Success;
    }

    QueuedAction action = std::move(*it);
    impl_->actions.erase(it);
    ++impl_->stats.dropped;
    log::logger()->warn("queue: dropping {} after {} retries ({})", id, action.retry_count, reason);
    impl_->publish(ActionEvent::Kind::Dropped, action, reason);
    return QueueResult::Success;
}

QueueResult ActionQueue::cancel(const ActionId& id) {
    auto it = impl_->locate(id);
    if (it == impl_->actions.end()) {
        return QueueResult::ActionNotFound;
    }
    impl_->cancel_ack_timer(id);
    QueuedAction action = std::move(*it);
    impl_->actions.erase(it);
    ++impl_->stats.cancelled;
    log::logger()->info("queue: cancelled {}", id);
    impl_->publish(ActionEvent::Kind::Cancelled, action);
    return QueueResult::Success;
}

SizeT ActionQueue::flush() {
    return impl_->flush();
}

SizeT ActionQueue::release_timed_out() {
    SizeT released = 0;
    for (auto& action : impl_->actions) {
        if (action.status == ActionStatus::TimedOut) {
            action.status = ActionStatus::Pending;
            ++released;
        }
    }
    return released;
}

void ActionQueue::on_disconnected() {
    for (auto& [id, timer] : impl_->ack_timers) {
        impl_->scheduler.cancel(timer);
    }
    impl_->ack_timers.clear();
    if (impl_->flush_timer != INVALID_TIMER_ID) {
        impl_->scheduler.cancel(impl_->flush_timer);
        impl_->flush_timer = INVALID_TIMER_ID;
    }
    for (auto& action : impl_->actions) {
        action.status = ActionStatus::Pending;
    }
}

void ActionQueue::clear() {
    on_disconnected();
    impl_->actions.clear();
}

std::vector<QueuedAction> ActionQueue::pending_actions() const {
    return impl_->ordered();
}

std::vector<PendingActionSummary> ActionQueue::summaries() const {
    std::vector<PendingActionSummary> result;
    for (const auto& action : impl_->ordered()) {
        result.push_back(PendingActionSummary{action.id, action.kind, action.created_at});
    }
    return result;
}

std::vector<game::TentativeOp> ActionQueue::tentative_ops() const {
    std::vector<game::TentativeOp> result;
    for (const auto& action : impl_->ordered()) {
        result.push_back(action.to_tentative_op());
    }
    return result;
}

std::optional<QueuedAction> ActionQueue::find(const ActionId& id) const {
    auto it = std::find_if(impl_->actions.begin(), impl_->actions.end(),
        [&](const QueuedAction& a) { return a.id == id; });
    if (it == impl_->actions.end()) {
        return std::nullopt;
    }
    return *it;
}

bool ActionQueue::contains(const ActionId& id) const {
    return find(id).has_value();
}

SizeT ActionQueue::size() const {
    return impl_->actions.size();
}

bool ActionQueue::empty() const {
    return impl_->actions.empty();
}

const ActionQueueConfig& ActionQueue::config() const {
    return impl_->config;
}

ActionQueueStats ActionQueue::stats() const {
    return impl_->stats;
}

core::EventChannel<ActionEvent>& ActionQueue::events() {
    return impl_->events;
}

} // namespace nightfall::sync
