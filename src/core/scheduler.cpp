/**
 * @file scheduler.cpp
 * @brief Timer queue and scheduler implementations
 */

#include "nightfall/core/scheduler.h"
#include <algorithm>
#include <chrono>
#include <limits>

namespace nightfall::core {

// ============================================================================
// TimerQueueScheduler
// ============================================================================

TimerId TimerQueueScheduler::schedule_after(Duration delay, Task task) {
    TimerId id = next_id_++;
    Timestamp start = monotonic_now();
    Int64 wait = std::max<Int64>(0, delay.count());
    Timestamp due = wait > std::numeric_limits<Timestamp>::max() - start
                        ? std::numeric_limits<Timestamp>::max()
                        : start + wait;
    timers_.emplace(TimerKey{due, id}, std::move(task));
    due_by_id_[id] = due;
    return id;
}

bool TimerQueueScheduler::cancel(TimerId id) {
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) {
        return false;
    }
    timers_.erase(TimerKey{it->second, id});
    due_by_id_.erase(it);
    return true;
}

void TimerQueueScheduler::post(Task task) {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    posted_.push_back(std::move(task));
}

SizeT TimerQueueScheduler::posted_task_count() const {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    return posted_.size();
}

SizeT TimerQueueScheduler::drain_posted() {
    SizeT count = 0;
    // Tasks may post further tasks; keep going until the queue stays empty
    while (true) {
        std::vector<Task> batch;
        {
            std::lock_guard<std::mutex> lock(posted_mutex_);
            batch.swap(posted_);
        }
        if (batch.empty()) {
            break;
        }
        for (auto& task : batch) {
            if (task) {
                task();
            }
            ++count;
        }
    }
    return count;
}

bool TimerQueueScheduler::pop_due(Timestamp until, Timestamp& due_at, Task& task) {
    if (timers_.empty()) {
        return false;
    }
    auto it = timers_.begin();
    if (it->first.first > until) {
        return false;
    }
    due_at = it->first.first;
    task = std::move(it->second);
    due_by_id_.erase(it->first.second);
    timers_.erase(it);
    return true;
}

bool TimerQueueScheduler::next_due(Timestamp& due_at) const {
    if (timers_.empty()) {
        return false;
    }
    due_at = timers_.begin()->first.first;
    return true;
}

// ============================================================================
// ManualScheduler
// ============================================================================

ManualScheduler::ManualScheduler(Timestamp start_time)
    : now_(start_time) {}

SizeT ManualScheduler::advance(Duration delta) {
    Timestamp target = now_ + std::max<Int64>(0, delta.count());
    SizeT fired = 0;

    drain_posted();

    Timestamp due_at = 0;
    Task task;
    while (pop_due(target, due_at, task)) {
        now_ = std::max(now_, due_at);
        if (task) {
            task();
        }
        ++fired;
        drain_posted();
    }

    now_ = target;
    drain_posted();
    return fired;
}

SizeT ManualScheduler::run_pending() {
    return advance(Duration(0));
}

// ============================================================================
// PollingScheduler
// ============================================================================

Timestamp PollingScheduler::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<Duration>(since_epoch).count();
}

Timestamp PollingScheduler::monotonic_now() const {
    auto since_start = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<Duration>(since_start).count();
}

SizeT PollingScheduler::poll() {
    SizeT count = drain_posted();

    Timestamp until = monotonic_now();
    Timestamp due_at = 0;
    Task task;
    while (pop_due(until, due_at, task)) {
        if (task) {
            task();
        }
        ++count;
    }

    count += drain_posted();
    return count;
}

Duration PollingScheduler::time_until_next(Duration idle) const {
    Timestamp due_at = 0;
    if (!next_due(due_at)) {
        return idle;
    }
    Int64 remaining = due_at - monotonic_now();
    if (remaining <= 0) {
        return Duration(0);
    }
    return std::min(idle, Duration(remaining));
}

} // namespace nightfall::core
