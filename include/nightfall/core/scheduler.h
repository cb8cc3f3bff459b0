#pragma once
/**
 * @file scheduler.h
 * @brief Injectable clock and timer scheduling
 *
 * Every delay in the engine (reconnect backoff, heartbeat, ack timeout,
 * sync timeout, fetch retry) goes through an IScheduler so behavior can be
 * driven deterministically in tests.
 *
 * Threading model: timers and posted tasks run on the thread that drives
 * the scheduler (advance() or poll()). post() is the only member that may
 * be called from other threads.
 */

#include "nightfall/core/types.h"
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nightfall::core {

using Task = std::function<void()>;

// ============================================================================
// Scheduler Interface
// ============================================================================

/**
 * @brief Clock plus one-shot timers
 */
class IScheduler {
public:
    virtual ~IScheduler() = default;

    /**
     * @brief Current wall-clock time in epoch milliseconds
     */
    virtual Timestamp now() const = 0;

    /**
     * @brief Run a task once after a delay
     * @return Handle usable with cancel()
     */
    virtual TimerId schedule_after(Duration delay, Task task) = 0;

    /**
     * @brief Cancel a pending timer
     * @return false if the timer already fired or never existed
     */
    virtual bool cancel(TimerId id) = 0;

    /**
     * @brief Hand a task to the control thread (thread-safe)
     */
    virtual void post(Task task) = 0;
};

// ============================================================================
// Timer Queue Base
// ============================================================================

/**
 * @brief Shared timer bookkeeping for the concrete schedulers
 *
 * Deadlines are kept on monotonic_now(), so wall-clock adjustments do not
 * shorten or stretch pending delays. Timers due at the same instant fire in
 * scheduling order.
 */
class TimerQueueScheduler : public IScheduler {
public:
    TimerQueueScheduler() = default;
    ~TimerQueueScheduler() override = default;

    TimerQueueScheduler(const TimerQueueScheduler&) = delete;
    TimerQueueScheduler& operator=(const TimerQueueScheduler&) = delete;

    TimerId schedule_after(Duration delay, Task task) override;
    bool cancel(TimerId id) override;
    void post(Task task) override;

    /**
     * @brief Milliseconds on a clock that never jumps, used for deadlines
     */
    virtual Timestamp monotonic_now() const = 0;

    SizeT pending_timer_count() const { return timers_.size(); }
    SizeT posted_task_count() const;

protected:
    /**
     * @brief Run every posted task queued so far
     * @return Number of tasks run
     */
    SizeT drain_posted();

    /**
     * @brief Pop the earliest timer due at or before the given time
     * @return false if no timer is due
     */
    bool pop_due(Timestamp until, Timestamp& due_at, Task& task);

    /**
     * @brief Due time of the earliest timer, if any
     */
    bool next_due(Timestamp& due_at) const;

private:
    using TimerKey = std::pair<Timestamp, TimerId>;

    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, Timestamp> due_by_id_;
    TimerId next_id_{1};

    mutable std::mutex posted_mutex_;
    std::vector<Task> posted_;
};

// ============================================================================
// Manual Scheduler
// ============================================================================

/**
 * @brief Virtual-time scheduler for tests and simulations
 */
class ManualScheduler : public TimerQueueScheduler {
public:
    explicit ManualScheduler(Timestamp start_time = 1'700'000'000'000);

    Timestamp now() const override { return now_; }
    Timestamp monotonic_now() const override { return now_; }

    /**
     * @brief Move virtual time forward, firing timers in due order
     *
     * Posted tasks are drained before each timer and once more at the end.
     * @return Number of timers fired
     */
    SizeT advance(Duration delta);

    /**
     * @brief Run posted tasks and timers already due without moving time
     */
    SizeT run_pending();

private:
    Timestamp now_;
};

// ============================================================================
// Polling Scheduler
// ============================================================================

/**
 * @brief System-clock scheduler serviced from an application loop
 */
class PollingScheduler : public TimerQueueScheduler {
public:
    PollingScheduler() = default;

    Timestamp now() const override;
    Timestamp monotonic_now() const override;

    /**
     * @brief Run posted tasks and every timer whose deadline has passed
     * @return Number of tasks and timers run
     */
    SizeT poll();

    /**
     * @brief Time until the next timer is due, zero if overdue
     */
    Duration time_until_next(Duration idle = Duration(50)) const;
};

} // namespace nightfall::core
