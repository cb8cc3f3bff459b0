#pragma once
/**
 * @file action_queue.h
 * @brief Durable, ordered queue of optimistic user actions
 *
 * Every user action that must reach the server is recorded here first. An
 * action leaves the queue exactly once: when the server acknowledges it,
 * when it is dropped after exhausting its retries, or when it is cancelled.
 * Retransmission always follows creation order.
 */

#include "nightfall/core/event_channel.h"
#include "nightfall/core/scheduler.h"
#include "nightfall/game/replica_state.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nightfall::sync {

// ============================================================================
// Queue Result Enum
// ============================================================================

enum class QueueResult : UInt8 {
    Success = 0,
    InvalidAction,
    ActionNotFound,
    DuplicateAction,
    QueueFull,
    NotTransmitted
};

inline const char* queue_result_to_string(QueueResult result) {
    switch (result) {
        case QueueResult::Success: return "Success";
        case QueueResult::InvalidAction: return "InvalidAction";
        case QueueResult::ActionNotFound: return "ActionNotFound";
        case QueueResult::DuplicateAction: return "DuplicateAction";
        case QueueResult::QueueFull: return "QueueFull";
        case QueueResult::NotTransmitted: return "NotTransmitted";
        default: return "Unknown";
    }
}

// ============================================================================
// Action Types
// ============================================================================

enum class ActionPriority : UInt8 {
    High = 0,
    Medium,
    Low
};

inline const char* action_priority_to_string(ActionPriority priority) {
    switch (priority) {
        case ActionPriority::High: return "high";
        case ActionPriority::Medium: return "medium";
        case ActionPriority::Low: return "low";
        default: return "unknown";
    }
}

std::optional<ActionPriority> action_priority_from_string(const std::string& name);

enum class ActionStatus : UInt8 {
    Pending = 0,   ///< Waiting for a transmit opportunity
    InFlight,      ///< Sent, awaiting ack or reject
    TimedOut       ///< No answer within the ack timeout; held until the next resync
};

inline const char* action_status_to_string(ActionStatus status) {
    switch (status) {
        case ActionStatus::Pending: return "Pending";
        case ActionStatus::InFlight: return "InFlight";
        case ActionStatus::TimedOut: return "TimedOut";
        default: return "Unknown";
    }
}

struct QueuedAction {
    ActionId id;
    std::string kind;          ///< Outbound wire event name
    FieldMap payload;
    Timestamp created_at{0};
    UInt32 retry_count{0};
    UInt32 max_retries{3};
    ActionPriority priority{ActionPriority::Medium};
    UInt32 transmit_count{0};
    ActionStatus status{ActionStatus::Pending};

    /// True when the next transmission is a replay
    bool is_retry() const { return transmit_count > 0 || retry_count > 0; }

    game::TentativeOp to_tentative_op() const {
        return game::TentativeOp{id, kind, payload, created_at};
    }
};

/**
 * @brief Compact view of a queued action used in sync requests
 */
struct PendingActionSummary {
    ActionId id;
    std::string kind;
    Timestamp created_at{0};

    bool operator==(const PendingActionSummary& other) const = default;
};

/**
 * @brief What a collaborator asks the queue to record
 */
struct ActionRequest {
    std::string kind;
    FieldMap payload;
    ActionPriority priority{ActionPriority::Medium};
    std::optional<UInt32> max_retries;   ///< Queue default when unset
};

/**
 * @brief Build a time-ordered unique action id
 *
 * Format: 13-digit epoch ms, 6-digit process-wide sequence, random suffix.
 * Lexical order matches creation order within one process.
 */
ActionId generate_action_id(Timestamp now);

// ============================================================================
// Configuration
// ============================================================================

struct ActionQueueConfig {
    UInt32 default_max_retries{3};
    Duration ack_timeout{5000};
    Duration retry_flush_delay{1000};
    SizeT max_queue_size{500};

    static ActionQueueConfig default_config() { return ActionQueueConfig{}; }

    /**
     * @brief Longer ack window and more retries for slow links
     */
    static ActionQueueConfig tolerant() {
        ActionQueueConfig config;
        config.default_max_retries = 5;
        config.ack_timeout = Duration(10000);
        config.retry_flush_delay = Duration(2000);
        return config;
    }
};

// ============================================================================
// Events & Statistics
// ============================================================================

struct ActionEvent {
    enum class Kind : UInt8 {
        Enqueued,      ///< Published before any network activity
        Restored,      ///< Reloaded from durable storage
        Transmitted,
        Acknowledged,
        Retrying,      ///< Rejected, scheduled for another attempt
        Dropped,       ///< Rejected with no retries left
        TimedOut,
        Cancelled
    };

    Kind kind{Kind::Enqueued};
    QueuedAction action;
    std::string reason;
};

inline const char* action_event_kind_to_string(ActionEvent::Kind kind) {
    switch (kind) {
        case ActionEvent::Kind::Enqueued: return "Enqueued";
        case ActionEvent::Kind::Restored: return "Restored";
        case ActionEvent::Kind::Transmitted: return "Transmitted";
        case ActionEvent::Kind::Acknowledged: return "Acknowledged";
        case ActionEvent::Kind::Retrying: return "Retrying";
        case ActionEvent::Kind::Dropped: return "Dropped";
        case ActionEvent::Kind::TimedOut: return "TimedOut";
        case ActionEvent::Kind::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

struct ActionQueueStats {
    UInt64 enqueued{0};
    UInt64 transmissions{0};
    UInt64 acknowledged{0};
    UInt64 rejected{0};
    UInt64 dropped{0};
    UInt64 timed_out{0};
    UInt64 cancelled{0};

    void reset() { *this = ActionQueueStats{}; }
};

// ============================================================================
// Transmitter Interface
// ============================================================================

/**
 * @brief Puts queued actions on the wire
 */
class IActionTransmitter {
public:
    virtual ~IActionTransmitter() = default;

    virtual bool can_transmit() const = 0;

    /**
     * @return false if the action could not be handed to the transport
     */
    virtual bool transmit(const QueuedAction& action, bool is_retry) = 0;
};

// ============================================================================
// Action Queue
// ============================================================================

class ActionQueue {
public:
    explicit ActionQueue(core::IScheduler& scheduler,
                         const ActionQueueConfig& config = ActionQueueConfig::default_config());
    ~ActionQueue();

    // Non-copyable, movable
    ActionQueue(const ActionQueue&) = delete;
    ActionQueue& operator=(const ActionQueue&) = delete;
    ActionQueue(ActionQueue&&) noexcept;
    ActionQueue& operator=(ActionQueue&&) noexcept;

    void set_transmitter(IActionTransmitter* transmitter);

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Record an action and transmit it if possible
     *
     * Enqueued is published synchronously before transmission so the local
     * replica reflects the action immediately.
     */
    QueueResult enqueue(const ActionRequest& request, ActionId& out_id);

    /**
     * @brief Re-insert a durable action after restart
     */
    QueueResult restore(QueuedAction action);

    /**
     * @brief Server confirmed the action; removes it
     * @return ActionNotFound on a repeated acknowledgment
     */
    QueueResult acknowledge(const ActionId& id);

    /**
     * @brief Server rejected the action
     *
     * Below the retry limit the action is re-timestamped and retried on the
     * next flush cycle; otherwise it is dropped.
     */
    QueueResult reject(const ActionId& id, const std::string& reason);

    QueueResult cancel(const ActionId& id);

    /**
     * @brief Transmit every pending action in creation order
     * @return Number of actions transmitted
     */
    SizeT flush();

    /**
     * @brief Make timed-out actions eligible for the next flush
     * @return Number of actions released
     */
    SizeT release_timed_out();

    /**
     * @brief Connection lost: in-flight and timed-out actions return to pending
     */
    void on_disconnected();

    /**
     * @brief Remove everything without publishing (logout)
     */
    void clear();

    // ========================================================================
    // Queries
    // ========================================================================

    /// Copies ordered by creation time
    std::vector<QueuedAction> pending_actions() const;
    std::vector<PendingActionSummary> summaries() const;
    std::vector<game::TentativeOp> tentative_ops() const;

    std::optional<QueuedAction> find(const ActionId& id) const;
    bool contains(const ActionId& id) const;
    SizeT size() const;
    bool empty() const;

    const ActionQueueConfig& config() const;
    ActionQueueStats stats() const;

    core::EventChannel<ActionEvent>& events();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nightfall::sync
