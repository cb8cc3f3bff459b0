/**
 * @file progressive_loader.cpp
 * @brief Level-by-level loading, fetch retry and insertion-order cache
 */

#include "nightfall/loader/progressive_loader.h"
#include "nightfall/core/backoff.h"
#include "nightfall/core/logging.h"
#include <algorithm>
#include <list>
#include <set>
#include <unordered_map>

namespace nightfall::loader {

// ============================================================================
// ProgressiveLoader::Impl
// ============================================================================

struct ProgressiveLoader::Impl {
    Impl(IDataFetcher& f, core::IScheduler& s, const LoaderConfig& c)
        : fetcher(f), scheduler(s), config(c), alive(std::make_shared<int>(0)) {}

    ~Impl() {
        for (auto& [id, flight] : flights) {
            if (flight.retry_timer != INVALID_TIMER_ID) {
                scheduler.cancel(flight.retry_timer);
            }
        }
    }

    struct Job {
        LoadJobId id{0};
        std::vector<std::vector<DataRequest>> levels;
        SizeT level_index{0};
        SizeT outstanding{0};
        SizeT total{0};
        LoadResult result;
        LoadCallback on_complete;
    };

    struct Flight {
        DataRequest request;
        UInt32 attempt{0};
        std::vector<LoadJobId> waiters;
        TimerId retry_timer{INVALID_TIMER_ID};
    };

    IDataFetcher& fetcher;
    core::IScheduler& scheduler;
    LoaderConfig config;

    // Lets posted completions detect that the loader is gone
    std::shared_ptr<int> alive;

    std::map<LoadJobId, Job> jobs;
    std::unordered_map<std::string, Flight> flights;
    LoadJobId next_job_id{1};

    // Cache in insertion order
    std::list<CacheEntry> cache;
    std::unordered_map<std::string, std::list<CacheEntry>::iterator> cache_index;

    core::EventChannel<LoadProgress> progress;
    core::EventChannel<CacheChange> cache_changes;
    LoaderStats stats;

    // ------------------------------------------------------------------------
    // Cache
    // ------------------------------------------------------------------------

    bool is_expired(const CacheEntry& entry) const {
        return scheduler.now() >= entry.fetched_at + config.expiry_for(entry.type).count();
    }

    const CacheEntry* cache_peek(const std::string& key) const {
        auto it = cache_index.find(key);
        if (it == cache_index.end() || is_expired(*it->second)) {
            return nullptr;
        }
        return &*it->second;
    }

    // Drops the entry when it outlived its type's lifetime
    const CacheEntry* cache_lookup(const std::string& key) {
        auto it = cache_index.find(key);
        if (it == cache_index.end()) {
            return nullptr;
        }
        if (is_expired(*it->second)) {
            log::logger()->debug("loader: {} expired", key);
            cache_erase(key, CacheChange::Kind::Expired);
            return nullptr;
        }
        return &*it->second;
    }

    void cache_erase(const std::string& key, CacheChange::Kind kind) {
        auto it = cache_index.find(key);
        if (it == cache_index.end()) return;
        cache.erase(it->second);
        cache_index.erase(it);
        cache_changes.publish(CacheChange{kind, key});
    }

    void cache_insert(CacheEntry entry) {
        if (config.max_cache_size == 0) {
            return;
        }
        // Overwriting counts as a fresh insertion
        auto existing = cache_index.find(entry.key);
        if (existing != cache_index.end()) {
            cache.erase(existing->second);
            cache_index.erase(existing);
        }

        std::string key = entry.key;
        cache.push_back(std::move(entry));
        cache_index[key] = std::prev(cache.end());
        cache_changes.publish(CacheChange{CacheChange::Kind::Inserted, key});

        while (cache.size() > config.max_cache_size) {
            std::string oldest = cache.front().key;
            ++stats.evictions;
            log::logger()->debug("loader: evicting {}", oldest);
            cache_erase(oldest, CacheChange::Kind::Evicted);
        }
    }

    // ------------------------------------------------------------------------
    // Jobs
    // ------------------------------------------------------------------------

    void publish_progress(const Job& job, bool complete) {
        LoadProgress p;
        p.job = job.id;
        p.total = job.total;
        p.loaded = job.result.data.size();
        p.failed = job.result.failed.size();
        p.current_batch = static_cast<UInt32>(std::min(job.level_index + 1, job.levels.size()));
        p.batch_count = static_cast<UInt32>(job.levels.size());
        p.complete = complete;
        progress.publish(p);
    }

    void start_level(LoadJobId job_id) {
        auto job_it = jobs.find(job_id);
        if (job_it == jobs.end()) return;
        Job& job = job_it->second;

        const auto& level = job.levels[job.level_index];
        std::vector<std::string> to_issue;
        job.outstanding = 0;

        for (const auto& request : level) {
            // Filled by an earlier level or another load in the meantime
            if (const CacheEntry* cached = cache_lookup(request.id)) {
                job.result.data[request.id] = cached->data;
                ++stats.cache_hits;
                continue;
            }

            ++job.outstanding;
            auto flight = flights.find(request.id);
            if (flight != flights.end()) {
                flight->second.waiters.push_back(job_id);
                ++stats.deduplicated;
                continue;
            }
            Flight fresh;
            fresh.request = request;
            fresh.waiters.push_back(job_id);
            flights.emplace(request.id, std::move(fresh));
            to_issue.push_back(request.id);
        }

        log::logger()->debug("loader: job {} batch {}/{} ({} requests)",
                             job_id, job.level_index + 1, job.levels.size(), level.size());
        publish_progress(job, false);

        if (job.outstanding == 0) {
            advance(job_id);
            return;
        }
        for (const auto& id : to_issue) {
            issue(id);
        }
    }

    void advance(LoadJobId job_id) {
        auto job_it = jobs.find(job_id);
        if (job_it == jobs.end()) return;

        Job& job = job_it->second;
        ++job.level_index;
        if (job.level_index < job.levels.size()) {
            start_level(job_id);
            return;
        }

        Job finished = std::move(job_it->second);
        jobs.erase(job_it);
        finished.level_index = finished.levels.empty() ? 0 : finished.levels.size() - 1;
        ++stats.jobs_completed;
        log::logger()->info("loader: job {} complete ({} loaded, {} failed)",
                            finished.id, finished.result.data.size(), finished.result.failed.size());
        publish_progress(finished, true);
        if (finished.on_complete) {
            finished.on_complete(finished.result);
        }
    }

    // ------------------------------------------------------------------------
    // Fetching
    // ------------------------------------------------------------------------

    void issue(const std::string& id) {
        auto it = flights.find(id);
        if (it == flights.end()) return;

        Flight& flight = it->second;
        flight.retry_timer = INVALID_TIMER_ID;
        ++flight.attempt;
        ++stats.fetches_issued;

        std::weak_ptr<int> token = alive;
        core::IScheduler* sched = &scheduler;
        fetcher.fetch(flight.request, [this, token, sched, id](const FetchResponse& response) {
            sched->post([this, token, id, response] {
                if (token.expired()) return;
                on_fetch_complete(id, response);
            });
        });
    }

    void on_fetch_complete(const std::string& id, const FetchResponse& response) {
        auto it = flights.find(id);
        if (it == flights.end()) return;
        Flight& flight = it->second;

        if (response.ok) {
            cache_insert(CacheEntry{id, response.data, flight.request.type, scheduler.now()});
            settle(id, true, response.data);
            return;
        }

        if (flight.attempt < config.max_fetch_attempts) {
            Duration delay = core::compute_backoff_delay(flight.attempt, config.retry_base_delay,
                                                         Duration::max());
            ++stats.fetch_retries;
            log::logger()->warn("loader: {} failed ({}), retry {} in {} ms",
                                id, response.error, flight.attempt, delay.count());
            flight.retry_timer = scheduler.schedule_after(delay, [this, id] { issue(id); });
            return;
        }

        ++stats.fetch_failures;
        log::logger()->warn("loader: {} failed after {} attempts ({})", id, flight.attempt, response.error);
        settle(id, false, "");
    }

    void settle(const std::string& id, bool ok, const std::string& data) {
        auto it = flights.find(id);
        if (it == flights.end()) return;
        std::vector<LoadJobId> waiters = std::move(it->second.waiters);
        flights.erase(it);

        for (LoadJobId job_id : waiters) {
            auto job_it = jobs.find(job_id);
            if (job_it == jobs.end()) continue;
            Job& job = job_it->second;

            if (ok) {
                job.result.data[id] = data;
            } else {
                job.result.failed.push_back(id);
            }
            if (job.outstanding > 0) {
                --job.outstanding;
            }
            publish_progress(job, false);
            if (job.outstanding == 0) {
                advance(job_id);
            }
        }
    }
};

// ============================================================================
// ProgressiveLoader
// ============================================================================

ProgressiveLoader::ProgressiveLoader(IDataFetcher& fetcher, core::IScheduler& scheduler,
                                     const LoaderConfig& config)
    : impl_(std::make_unique<Impl>(fetcher, scheduler, config)) {}

ProgressiveLoader::~ProgressiveLoader() = default;

ProgressiveLoader::ProgressiveLoader(ProgressiveLoader&&) noexcept = default;
ProgressiveLoader& ProgressiveLoader::operator=(ProgressiveLoader&&) noexcept = default;

LoaderResult ProgressiveLoader::load_data(const std::vector<DataRequest>& requests,
                                          LoadCallback on_complete, LoadJobId* out_job) {
    if (requests.empty()) {
        return LoaderResult::EmptyRequest;
    }
    std::set<std::string> seen;
    for (const auto& request : requests) {
        if (request.id.empty() || request.endpoint.empty()) {
            return LoaderResult::InvalidRequest;
        }
        if (!seen.insert(request.id).second) {
            return LoaderResult::DuplicateRequestId;
        }
    }

    Impl::Job job;
    job.id = impl_->next_job_id++;
    job.total = requests.size();
    job.on_complete = std::move(on_complete);

    std::vector<DataRequest> remaining;
    for (const auto& request : requests) {
        if (const CacheEntry* cached = impl_->cache_lookup(request.id)) {
            job.result.data[request.id] = cached->data;
            ++impl_->stats.cache_hits;
        } else {
            remaining.push_back(request);
        }
    }

    std::stable_sort(remaining.begin(), remaining.end(),
        [](const DataRequest& a, const DataRequest& b) {
            if (a.priority.level != b.priority.level) return a.priority.level < b.priority.level;
            return a.priority.order < b.priority.order;
        });
    for (auto& request : remaining) {
        if (job.levels.empty() || job.levels.back().front().priority.level != request.priority.level) {
            job.levels.emplace_back();
        }
        job.levels.back().push_back(std::move(request));
    }

    LoadJobId job_id = job.id;
    if (out_job) {
        *out_job = job_id;
    }
    ++impl_->stats.jobs_started;
    log::logger()->info("loader: job {} started ({} requests, {} cached, {} batches)",
                        job_id, requests.size(), requests.size() - remaining.size(), job.levels.size());

    bool nothing_to_fetch = job.levels.empty();
    impl_->jobs.emplace(job_id, std::move(job));

    if (nothing_to_fetch) {
        // Everything came from the cache
        impl_->jobs[job_id].level_index = 0;
        impl_->advance(job_id);
    } else {
        impl_->start_level(job_id);
    }
    return LoaderResult::Success;
}

std::optional<std::string> ProgressiveLoader::get_cached_data(const std::string& key) const {
    if (const CacheEntry* entry = impl_->cache_peek(key)) {
        return entry->data;
    }
    return std::nullopt;
}

SizeT ProgressiveLoader::invalidate_cache(const std::string& prefix) {
    std::vector<std::string> doomed;
    for (const auto& entry : impl_->cache) {
        if (entry.key.compare(0, prefix.size(), prefix) == 0) {
            doomed.push_back(entry.key);
        }
    }
    for (const auto& key : doomed) {
        impl_->cache_erase(key, CacheChange::Kind::Invalidated);
    }
    if (!doomed.empty()) {
        log::logger()->debug("loader: invalidated {} entries with prefix '{}'", doomed.size(), prefix);
    }
    return doomed.size();
}

void ProgressiveLoader::clear_cache() {
    impl_->cache.clear();
    impl_->cache_index.clear();
    impl_->cache_changes.publish(CacheChange{CacheChange::Kind::Cleared, ""});
}

void ProgressiveLoader::restore_cache(const std::vector<CacheEntry>& entries) {
    SizeT skipped = 0;
    for (const auto& entry : entries) {
        if (impl_->is_expired(entry)) {
            ++skipped;
            continue;
        }
        impl_->cache_insert(entry);
    }
    if (skipped > 0) {
        log::logger()->debug("loader: skipped {} expired entries on restore", skipped);
    }
}

std::vector<CacheEntry> ProgressiveLoader::cache_entries() const {
    return std::vector<CacheEntry>(impl_->cache.begin(), impl_->cache.end());
}

SizeT ProgressiveLoader::cache_size() const {
    return impl_->cache.size();
}

bool ProgressiveLoader::is_loading() const {
    return !impl_->jobs.empty();
}

SizeT ProgressiveLoader::active_jobs() const {
    return impl_->jobs.size();
}

const LoaderConfig& ProgressiveLoader::config() const {
    return impl_->config;
}

LoaderStats ProgressiveLoader::stats() const {
    return impl_->stats;
}

core::EventChannel<LoadProgress>& ProgressiveLoader::progress() {
    return impl_->progress;
}

core::EventChannel<CacheChange>& ProgressiveLoader::cache_changes() {
    return impl_->cache_changes;
}

// ============================================================================
// Standard Request Sets
// ============================================================================

namespace presets {

namespace {

DataRequest make_request(const std::string& id, const std::string& type, const std::string& endpoint,
                         LoadPriority level, UInt32 order) {
    DataRequest request;
    request.id = id;
    request.type = type;
    request.endpoint = endpoint;
    request.priority = RequestPriority{level, order};
    return request;
}

} // anonymous namespace

std::vector<DataRequest> critical_data(const std::string& user_id) {
    std::vector<DataRequest> requests{
        make_request("user_profile", "player_profile", "/players/profile", LoadPriority::Critical, 1),
        make_request("user_friends", "friends_list", "/players/friends", LoadPriority::Critical, 2),
        make_request("user_achievements", "achievements", "/games/achievements", LoadPriority::High, 1),
    };
    for (auto& request : requests) {
        request.params["userId"] = user_id;
    }
    return requests;
}

std::vector<DataRequest> game_data(const std::string& room_id) {
    // Room-scoped keys share a prefix so invalidate_cache("room_<id>") drops them together
    std::string prefix = "room_" + room_id;
    return {
        make_request(prefix + "_details", "room_details", "/rooms/" + room_id, LoadPriority::Critical, 1),
        make_request(prefix + "_players", "room_players", "/rooms/" + room_id + "/players",
                     LoadPriority::Critical, 2),
        make_request("game_history", "game_history", "/games/history", LoadPriority::Medium, 1),
    };
}

std::vector<DataRequest> social_data() {
    return {
        make_request("friends_activities", "friends_activities", "/players/friends/activities",
                     LoadPriority::Medium, 1),
        make_request("public_rooms", "public_rooms", "/rooms/public", LoadPriority::Medium, 2),
        make_request("friends_leaderboard", "leaderboard", "/players/friends/leaderboard",
                     LoadPriority::Low, 1),
    };
}

std::vector<DataRequest> screen_prefetch(const std::string& screen) {
    if (screen == "main_menu") {
        return {
            make_request("public_rooms_prefetch", "public_rooms", "/rooms/public", LoadPriority::Low, 1),
            make_request("friends_status_prefetch", "friends_status", "/players/friends/status",
                         LoadPriority::Low, 2),
        };
    }
    if (screen == "game_lobby") {
        return {
            make_request("game_settings_prefetch", "game_settings", "/games/settings", LoadPriority::Medium, 1),
        };
    }
    return {};
}

} // namespace presets

} // namespace nightfall::loader
