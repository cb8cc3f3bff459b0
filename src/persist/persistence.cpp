/**
 * @file persistence.cpp
 * @brief Stores and JSON encoding for durable engine state
 */

#include "nightfall/persist/persistence.h"
#include "nightfall/core/logging.h"
#include "nightfall/net/json_text.h"
#include "nightfall/net/wire_codec.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace nightfall::persist {

namespace json = net::json;

// ============================================================================
// MemoryPersistenceStore
// ============================================================================

PersistResult MemoryPersistenceStore::write(const std::string& key, const std::string& value) {
    if (key.empty()) {
        return PersistResult::InvalidKey;
    }
    values_[key] = value;
    ++write_count_;
    return PersistResult::Success;
}

PersistResult MemoryPersistenceStore::read(const std::string& key, std::string& out_value) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return PersistResult::NotFound;
    }
    out_value = it->second;
    return PersistResult::Success;
}

PersistResult MemoryPersistenceStore::remove(const std::string& key) {
    values_.erase(key);
    return PersistResult::Success;
}

// ============================================================================
// FilePersistenceStore
// ============================================================================

FilePersistenceStore::FilePersistenceStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FilePersistenceStore::path_for(const std::string& key) const {
    return directory_ / (key + ".json");
}

namespace {

bool is_valid_key(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '-';
    });
}

} // anonymous namespace

PersistResult FilePersistenceStore::write(const std::string& key, const std::string& value) {
    if (!is_valid_key(key)) {
        return PersistResult::InvalidKey;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        log::logger()->error("persist: cannot create {}: {}", directory_.string(), ec.message());
        return PersistResult::IoError;
    }

    std::filesystem::path target = path_for(key);
    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return PersistResult::IoError;
        }
        file << value;
        if (!file.good()) {
            return PersistResult::IoError;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        log::logger()->error("persist: cannot replace {}: {}", target.string(), ec.message());
        return PersistResult::IoError;
    }
    return PersistResult::Success;
}

PersistResult FilePersistenceStore::read(const std::string& key, std::string& out_value) {
    if (!is_valid_key(key)) {
        return PersistResult::InvalidKey;
    }
    std::ifstream file(path_for(key), std::ios::binary);
    if (!file.is_open()) {
        return PersistResult::NotFound;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return PersistResult::IoError;
    }
    out_value = buffer.str();
    return PersistResult::Success;
}

PersistResult FilePersistenceStore::remove(const std::string& key) {
    if (!is_valid_key(key)) {
        return PersistResult::InvalidKey;
    }
    std::error_code ec;
    std::filesystem::remove(path_for(key), ec);
    return ec ? PersistResult::IoError : PersistResult::Success;
}

// ============================================================================
// Encoding
// ============================================================================

std::string encode_actions(const std::vector<sync::QueuedAction>& actions) {
    std::vector<std::string> items;
    items.reserve(actions.size());
    for (const auto& action : actions) {
        items.push_back(json::ObjectBuilder()
            .add("id", action.id)
            .add("kind", action.kind)
            .add_raw("payload", net::encode_fields(action.payload))
            .add_int("createdAt", action.created_at)
            .add_int("retryCount", action.retry_count)
            .add_int("maxRetries", action.max_retries)
            .add_int("transmitCount", action.transmit_count)
            .add("priority", sync::action_priority_to_string(action.priority))
            .str());
    }
    return json::make_array(items);
}

std::optional<std::vector<sync::QueuedAction>> decode_actions(const std::string& text) {
    auto items = json::array_elements(text);
    if (!items) {
        return std::nullopt;
    }

    std::vector<sync::QueuedAction> actions;
    for (const auto& item : *items) {
        sync::QueuedAction action;
        action.id = json::find_string(item, "id");
        action.kind = json::find_string(item, "kind");
        if (action.id.empty() || action.kind.empty()) {
            return std::nullopt;
        }

        if (auto payload_raw = json::find_raw(item, "payload")) {
            auto payload = net::decode_fields(*payload_raw);
            if (!payload) {
                return std::nullopt;
            }
            action.payload = std::move(*payload);
        }
        action.created_at = json::find_int(item, "createdAt");
        action.retry_count = static_cast<UInt32>(json::find_int(item, "retryCount"));
        action.max_retries = static_cast<UInt32>(json::find_int(item, "maxRetries", 3));
        action.transmit_count = static_cast<UInt32>(json::find_int(item, "transmitCount"));
        action.priority = sync::action_priority_from_string(json::find_string(item, "priority"))
                              .value_or(sync::ActionPriority::Medium);
        action.status = sync::ActionStatus::Pending;
        actions.push_back(std::move(action));
    }

    std::stable_sort(actions.begin(), actions.end(),
        [](const sync::QueuedAction& a, const sync::QueuedAction& b) {
            if (a.created_at != b.created_at) return a.created_at < b.created_at;
            return a.id < b.id;
        });
    return actions;
}

std::string encode_cache(const std::vector<loader::CacheEntry>& entries) {
    std::vector<std::string> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        items.push_back(json::ObjectBuilder()
            .add("key", entry.key)
            .add("type", entry.type)
            .add("data", entry.data)
            .add_int("fetchedAt", entry.fetched_at)
            .str());
    }
    return json::make_array(items);
}

std::optional<std::vector<loader::CacheEntry>> decode_cache(const std::string& text) {
    auto items = json::array_elements(text);
    if (!items) {
        return std::nullopt;
    }

    std::vector<loader::CacheEntry> entries;
    for (const auto& item : *items) {
        loader::CacheEntry entry;
        entry.key = json::find_string(item, "key");
        if (entry.key.empty()) {
            return std::nullopt;
        }
        entry.type = json::find_string(item, "type");
        entry.data = json::find_string(item, "data");
        entry.fetched_at = json::find_int(item, "fetchedAt");
        entries.push_back(std::move(entry));
    }
    return entries;
}

// ============================================================================
// PersistenceBoundary
// ============================================================================

PersistenceBoundary::PersistenceBoundary(IPersistenceStore& store)
    : store_(store) {}

PersistResult PersistenceBoundary::write(const char* key, const std::string& value) {
    PersistResult result = store_.write(key, value);
    if (result == PersistResult::Success) {
        ++stats_.writes;
    } else {
        ++stats_.write_failures;
        log::logger()->error("persist: write of '{}' failed: {}", key, persist_result_to_string(result));
    }
    return result;
}

PersistResult PersistenceBoundary::save_actions(const std::vector<sync::QueuedAction>& actions) {
    return write(keys::OFFLINE_ACTIONS, encode_actions(actions));
}

PersistResult PersistenceBoundary::save_cache(const std::vector<loader::CacheEntry>& entries) {
    return write(keys::OFFLINE_DATA, encode_cache(entries));
}

PersistResult PersistenceBoundary::save_last_sync_time(Timestamp timestamp) {
    return write(keys::LAST_SYNC_TIMESTAMP, std::to_string(timestamp));
}

PersistResult PersistenceBoundary::load(DurableState& out_state) {
    ++stats_.loads;
    out_state = DurableState{};
    PersistResult overall = PersistResult::Success;

    auto corrupt = [&](const char* key) {
        ++stats_.corrupt_entries;
        log::logger()->warn("persist: discarding corrupt '{}'", key);
        overall = PersistResult::CorruptData;
    };

    std::string text;
    PersistResult result = store_.read(keys::OFFLINE_ACTIONS, text);
    if (result == PersistResult::Success) {
        if (auto actions = decode_actions(text)) {
            out_state.actions = std::move(*actions);
        } else {
            corrupt(keys::OFFLINE_ACTIONS);
        }
    } else if (result != PersistResult::NotFound) {
        return result;
    }

    result = store_.read(keys::OFFLINE_DATA, text);
    if (result == PersistResult::Success) {
        if (auto cache = decode_cache(text)) {
            out_state.cache = std::move(*cache);
        } else {
            corrupt(keys::OFFLINE_DATA);
        }
    } else if (result != PersistResult::NotFound) {
        return result;
    }

    result = store_.read(keys::LAST_SYNC_TIMESTAMP, text);
    if (result == PersistResult::Success) {
        Int64 timestamp = json::to_int(text, -1);
        if (timestamp >= 0) {
            out_state.last_sync_time = timestamp;
        } else {
            corrupt(keys::LAST_SYNC_TIMESTAMP);
        }
    } else if (result != PersistResult::NotFound) {
        return result;
    }

    log::logger()->info("persist: loaded {} actions, {} cache entries, last sync {}",
                        out_state.actions.size(), out_state.cache.size(), out_state.last_sync_time);
    return overall;
}

PersistResult PersistenceBoundary::clear() {
    PersistResult overall = PersistResult::Success;
    for (const char* key : {keys::OFFLINE_ACTIONS, keys::OFFLINE_DATA, keys::LAST_SYNC_TIMESTAMP}) {
        PersistResult result = store_.remove(key);
        if (result != PersistResult::Success) {
            log::logger()->error("persist: remove of '{}' failed: {}", key, persist_result_to_string(result));
            overall = result;
        }
    }
    return overall;
}

} // namespace nightfall::persist
