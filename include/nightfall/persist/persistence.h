#pragma once
/**
 * @file persistence.h
 * @brief Durable-state boundary of the sync engine
 *
 * Exactly three things survive a restart: the queued actions, the loader
 * cache and the last sync point. Connection status, conflicts and loading
 * progress are never written. The engine decides what is durable; an
 * IPersistenceStore decides how bytes are kept.
 */

#include "nightfall/loader/progressive_loader.h"
#include "nightfall/sync/action_queue.h"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nightfall::persist {

// ============================================================================
// Persist Result Enum
// ============================================================================

enum class PersistResult : UInt8 {
    Success = 0,
    NotFound,
    InvalidKey,
    IoError,
    CorruptData
};

inline const char* persist_result_to_string(PersistResult result) {
    switch (result) {
        case PersistResult::Success: return "Success";
        case PersistResult::NotFound: return "NotFound";
        case PersistResult::InvalidKey: return "InvalidKey";
        case PersistResult::IoError: return "IoError";
        case PersistResult::CorruptData: return "CorruptData";
        default: return "Unknown";
    }
}

// ============================================================================
// Storage Keys
// ============================================================================

namespace keys {

constexpr const char* OFFLINE_ACTIONS = "offline_actions";
constexpr const char* OFFLINE_DATA = "offline_data";
constexpr const char* LAST_SYNC_TIMESTAMP = "last_sync_timestamp";

} // namespace keys

// ============================================================================
// Store Interface
// ============================================================================

/**
 * @brief Key/value text storage
 */
class IPersistenceStore {
public:
    virtual ~IPersistenceStore() = default;

    virtual PersistResult write(const std::string& key, const std::string& value) = 0;

    /**
     * @return NotFound if the key was never written or has been removed
     */
    virtual PersistResult read(const std::string& key, std::string& out_value) = 0;

    /**
     * @brief Removing an absent key succeeds
     */
    virtual PersistResult remove(const std::string& key) = 0;
};

/**
 * @brief Process-local store, used by tests and ephemeral sessions
 */
class MemoryPersistenceStore : public IPersistenceStore {
public:
    PersistResult write(const std::string& key, const std::string& value) override;
    PersistResult read(const std::string& key, std::string& out_value) override;
    PersistResult remove(const std::string& key) override;

    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    SizeT size() const { return values_.size(); }
    UInt64 write_count() const { return write_count_; }

private:
    std::map<std::string, std::string> values_;
    UInt64 write_count_{0};
};

/**
 * @brief One file per key under a directory
 *
 * Writes go to a temporary file that is renamed over the target, so a crash
 * mid-write leaves the previous value intact.
 */
class FilePersistenceStore : public IPersistenceStore {
public:
    explicit FilePersistenceStore(std::filesystem::path directory);

    PersistResult write(const std::string& key, const std::string& value) override;
    PersistResult read(const std::string& key, std::string& out_value) override;
    PersistResult remove(const std::string& key) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path directory_;
};

// ============================================================================
// Durable State
// ============================================================================

struct DurableState {
    std::vector<sync::QueuedAction> actions;   ///< Creation order
    std::vector<loader::CacheEntry> cache;     ///< Insertion order
    Timestamp last_sync_time{0};

    bool empty() const { return actions.empty() && cache.empty() && last_sync_time == 0; }
};

// JSON text encoding of the durable pieces
std::string encode_actions(const std::vector<sync::QueuedAction>& actions);
std::optional<std::vector<sync::QueuedAction>> decode_actions(const std::string& text);
std::string encode_cache(const std::vector<loader::CacheEntry>& entries);
std::optional<std::vector<loader::CacheEntry>> decode_cache(const std::string& text);

struct PersistenceStats {
    UInt64 writes{0};
    UInt64 write_failures{0};
    UInt64 loads{0};
    UInt64 corrupt_entries{0};

    void reset() { *this = PersistenceStats{}; }
};

// ============================================================================
// Persistence Boundary
// ============================================================================

class PersistenceBoundary {
public:
    explicit PersistenceBoundary(IPersistenceStore& store);

    PersistResult save_actions(const std::vector<sync::QueuedAction>& actions);
    PersistResult save_cache(const std::vector<loader::CacheEntry>& entries);
    PersistResult save_last_sync_time(Timestamp timestamp);

    /**
     * @brief Read every durable key
     *
     * Missing keys leave their part empty. A corrupt key is skipped and
     * reported as CorruptData while the other parts are still filled in.
     */
    PersistResult load(DurableState& out_state);

    /**
     * @brief Remove every durable key (logout)
     */
    PersistResult clear();

    const PersistenceStats& stats() const { return stats_; }

private:
    PersistResult write(const char* key, const std::string& value);

    IPersistenceStore& store_;
    PersistenceStats stats_;
};

} // namespace nightfall::persist
