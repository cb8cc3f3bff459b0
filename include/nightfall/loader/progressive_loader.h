#pragma once
/**
 * @file progressive_loader.h
 * @brief Priority-ordered batched data loading with a bounded cache
 *
 * Requests are grouped by priority level (critical, high, medium, low) and
 * ordered within a level. A level is issued as one concurrent batch; the
 * next level starts only once every request of the current one settled.
 * Fetch completions are always processed on the control thread via
 * IScheduler::post(), so the fetcher may call back from any thread.
 *
 * The cache is bounded and evicts by insertion order, not recency. Entries
 * expire after a lifetime chosen by their data type.
 */

#include "nightfall/core/event_channel.h"
#include "nightfall/core/scheduler.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nightfall::loader {

// ============================================================================
// Loader Result Enum
// ============================================================================

enum class LoaderResult : UInt8 {
    Success = 0,
    EmptyRequest,
    InvalidRequest,
    DuplicateRequestId
};

inline const char* loader_result_to_string(LoaderResult result) {
    switch (result) {
        case LoaderResult::Success: return "Success";
        case LoaderResult::EmptyRequest: return "EmptyRequest";
        case LoaderResult::InvalidRequest: return "InvalidRequest";
        case LoaderResult::DuplicateRequestId: return "DuplicateRequestId";
        default: return "Unknown";
    }
}

// ============================================================================
// Request Types
// ============================================================================

enum class LoadPriority : UInt8 {
    Critical = 0,
    High,
    Medium,
    Low
};

inline const char* load_priority_to_string(LoadPriority priority) {
    switch (priority) {
        case LoadPriority::Critical: return "critical";
        case LoadPriority::High: return "high";
        case LoadPriority::Medium: return "medium";
        case LoadPriority::Low: return "low";
        default: return "unknown";
    }
}

struct RequestPriority {
    LoadPriority level{LoadPriority::Medium};
    UInt32 order{0};   ///< Tie-break within a level (lower = earlier)
};

struct DataRequest {
    std::string id;          ///< Also the cache key
    std::string type;
    std::string endpoint;
    RequestPriority priority;
    FieldMap params;
};

struct CacheEntry {
    std::string key;
    std::string data;
    std::string type;
    Timestamp fetched_at{0};
};

struct FetchResponse {
    bool ok{false};
    std::string data;
    std::string error;

    static FetchResponse success(std::string data) {
        FetchResponse response;
        response.ok = true;
        response.data = std::move(data);
        return response;
    }

    static FetchResponse failure(std::string error) {
        FetchResponse response;
        response.error = std::move(error);
        return response;
    }
};

using FetchCallback = std::function<void(const FetchResponse&)>;

/**
 * @brief Asynchronous data source
 */
class IDataFetcher {
public:
    virtual ~IDataFetcher() = default;

    /**
     * @brief Start one fetch; the callback must be invoked exactly once
     */
    virtual void fetch(const DataRequest& request, FetchCallback callback) = 0;
};

struct LoadResult {
    std::map<std::string, std::string> data;   ///< Request id -> payload
    std::vector<std::string> failed;           ///< Ids that failed after retries

    bool all_succeeded() const { return failed.empty(); }
};

using LoadCallback = std::function<void(const LoadResult&)>;
using LoadJobId = UInt64;

// ============================================================================
// Progress & Cache Events
// ============================================================================

struct LoadProgress {
    LoadJobId job{0};
    SizeT total{0};
    SizeT loaded{0};
    SizeT failed{0};
    UInt32 current_batch{0};
    UInt32 batch_count{0};
    bool complete{false};
};

struct CacheChange {
    enum class Kind : UInt8 {
        Inserted,
        Evicted,
        Expired,
        Invalidated,
        Cleared
    };

    Kind kind{Kind::Inserted};
    std::string key;
};

// ============================================================================
// Configuration
// ============================================================================

struct LoaderConfig {
    SizeT max_cache_size{50};
    UInt32 max_fetch_attempts{3};
    Duration retry_base_delay{1000};   ///< Delay before retry n is base * 2^(n-1)

    Duration default_expiry{300000};   ///< Lifetime of types without their own entry
    std::map<std::string, Duration> type_expiry{
        {"player_profile", Duration(600000)},
        {"game_history", Duration(300000)},
        {"friends_list", Duration(120000)},
        {"public_rooms", Duration(30000)},
        {"achievements", Duration(1800000)},
        {"statistics", Duration(300000)},
    };

    Duration expiry_for(const std::string& type) const {
        auto it = type_expiry.find(type);
        return it == type_expiry.end() ? default_expiry : it->second;
    }

    static LoaderConfig default_config() { return LoaderConfig{}; }

    static LoaderConfig low_memory() {
        LoaderConfig config;
        config.max_cache_size = 10;
        return config;
    }

    static LoaderConfig no_retry() {
        LoaderConfig config;
        config.max_fetch_attempts = 1;
        return config;
    }
};

struct LoaderStats {
    UInt64 jobs_started{0};
    UInt64 jobs_completed{0};
    UInt64 cache_hits{0};
    UInt64 fetches_issued{0};
    UInt64 fetch_retries{0};
    UInt64 fetch_failures{0};
    UInt64 deduplicated{0};
    UInt64 evictions{0};

    void reset() { *this = LoaderStats{}; }
};

// ============================================================================
// Progressive Loader
// ============================================================================

class ProgressiveLoader {
public:
    ProgressiveLoader(IDataFetcher& fetcher, core::IScheduler& scheduler,
                      const LoaderConfig& config = LoaderConfig::default_config());
    ~ProgressiveLoader();

    // Non-copyable, movable
    ProgressiveLoader(const ProgressiveLoader&) = delete;
    ProgressiveLoader& operator=(const ProgressiveLoader&) = delete;
    ProgressiveLoader(ProgressiveLoader&&) noexcept;
    ProgressiveLoader& operator=(ProgressiveLoader&&) noexcept;

    /**
     * @brief Load a set of requests level by level
     *
     * Cached ids are answered without fetching. Ids already in flight for
     * another load are fetched once and shared. on_complete runs once when
     * every request settled.
     */
    LoaderResult load_data(const std::vector<DataRequest>& requests, LoadCallback on_complete,
                           LoadJobId* out_job = nullptr);

    // ========================================================================
    // Cache
    // ========================================================================

    /// Pure lookup; never triggers a fetch. Expired entries read as absent.
    std::optional<std::string> get_cached_data(const std::string& key) const;

    /**
     * @brief Remove every entry whose key starts with the prefix
     * @return Number of entries removed
     */
    SizeT invalidate_cache(const std::string& prefix);

    void clear_cache();

    /**
     * @brief Insert entries in order, e.g. from durable storage
     *
     * Entries already past their lifetime are skipped.
     */
    void restore_cache(const std::vector<CacheEntry>& entries);

    /// Oldest insertion first
    std::vector<CacheEntry> cache_entries() const;
    SizeT cache_size() const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool is_loading() const;
    SizeT active_jobs() const;
    const LoaderConfig& config() const;
    LoaderStats stats() const;

    core::EventChannel<LoadProgress>& progress();
    core::EventChannel<CacheChange>& cache_changes();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Standard Request Sets
// ============================================================================

namespace presets {

/// Profile, friends and achievements needed right after login
std::vector<DataRequest> critical_data(const std::string& user_id);

/// Room details and players first, history later
std::vector<DataRequest> game_data(const std::string& room_id);

/// Friends activity, public rooms and leaderboard
std::vector<DataRequest> social_data();

/// Low-priority prefetch for what the given screen usually needs next
std::vector<DataRequest> screen_prefetch(const std::string& screen);

} // namespace presets

} // namespace nightfall::loader
