/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Engine configuration is read and written with pugixml. Durations are
 * stored in milliseconds.
 */

#include "nightfall/interface/config.h"
#include <pugixml.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace nightfall::config {

namespace {

// ============================================================================
// Parse Helpers
// ============================================================================

Duration read_ms(const pugi::xml_node& parent, const char* name, Duration fallback) {
    auto node = parent.child(name);
    if (!node) {
        return fallback;
    }
    return Duration(node.text().as_llong(fallback.count()));
}

UInt32 read_uint(const pugi::xml_node& parent, const char* name, UInt32 fallback) {
    return static_cast<UInt32>(parent.child(name).text().as_uint(fallback));
}

SizeT read_size(const pugi::xml_node& parent, const char* name, SizeT fallback) {
    return static_cast<SizeT>(parent.child(name).text().as_ullong(
        static_cast<unsigned long long>(fallback)));
}

void write_ms(pugi::xml_node& parent, const char* name, Duration value) {
    parent.append_child(name).text().set(static_cast<long long>(value.count()));
}

EngineConfig from_document(const pugi::xml_document& doc) {
    EngineConfig config = EngineConfig::defaults();

    auto root = doc.child("nightfall_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid engine config XML: no root element");
    }

    // Connection settings
    if (auto conn = root.child("connection")) {
        config.connection.url = conn.child("url").text().as_string(config.connection.url.c_str());
        config.connection.reconnect_base_delay =
            read_ms(conn, "reconnect_base_delay_ms", config.connection.reconnect_base_delay);
        config.connection.reconnect_max_delay =
            read_ms(conn, "reconnect_max_delay_ms", config.connection.reconnect_max_delay);
        config.connection.max_reconnect_attempts =
            read_uint(conn, "max_reconnect_attempts", config.connection.max_reconnect_attempts);
        config.connection.heartbeat_interval =
            read_ms(conn, "heartbeat_interval_ms", config.connection.heartbeat_interval);
        config.connection.heartbeat_timeout =
            read_ms(conn, "heartbeat_timeout_ms", config.connection.heartbeat_timeout);
    }

    // Action queue settings
    if (auto queue = root.child("queue")) {
        config.queue.default_max_retries =
            read_uint(queue, "max_retries", config.queue.default_max_retries);
        config.queue.ack_timeout = read_ms(queue, "ack_timeout_ms", config.queue.ack_timeout);
        config.queue.retry_flush_delay =
            read_ms(queue, "retry_flush_delay_ms", config.queue.retry_flush_delay);
        config.queue.max_queue_size = read_size(queue, "max_size", config.queue.max_queue_size);
    }

    // Sync settings
    if (auto sync = root.child("sync")) {
        config.sync.conflict_tolerance =
            read_ms(sync, "conflict_tolerance_ms", config.sync.conflict_tolerance);
        config.sync.sync_timeout = read_ms(sync, "sync_timeout_ms", config.sync.sync_timeout);
        config.sync.max_sync_attempts = read_uint(sync, "max_sync_attempts", config.sync.max_sync_attempts);
        config.sync.sync_retry_base_delay =
            read_ms(sync, "retry_base_delay_ms", config.sync.sync_retry_base_delay);
        config.sync.sync_retry_max_delay =
            read_ms(sync, "retry_max_delay_ms", config.sync.sync_retry_max_delay);
        config.sync.auto_resolve_server_hints =
            sync.child("auto_resolve_server_hints").text().as_bool(config.sync.auto_resolve_server_hints);
        config.sync.max_conflict_history =
            read_size(sync, "max_conflict_history", config.sync.max_conflict_history);
    }

    // Loader settings
    if (auto loader = root.child("loader")) {
        config.loader.max_cache_size = read_size(loader, "max_cache_size", config.loader.max_cache_size);
        config.loader.max_fetch_attempts =
            read_uint(loader, "max_fetch_attempts", config.loader.max_fetch_attempts);
        config.loader.retry_base_delay =
            read_ms(loader, "retry_base_delay_ms", config.loader.retry_base_delay);
        config.loader.default_expiry = read_ms(loader, "default_expiry_ms", config.loader.default_expiry);
        for (auto expiry : loader.children("expiry")) {
            std::string type = expiry.attribute("type").as_string();
            if (type.empty()) {
                throw std::runtime_error("Invalid engine config XML: <expiry> without type");
            }
            config.loader.type_expiry[type] = Duration(expiry.text().as_llong(0));
        }
    }

    // Logging settings
    if (auto logging = root.child("logging")) {
        config.logging.level = logging.child("level").text().as_string(config.logging.level.c_str());
        config.logging.pattern = logging.child("pattern").text().as_string(config.logging.pattern.c_str());
    }

    // Engine settings
    if (auto engine = root.child("engine")) {
        config.max_recent_errors = read_size(engine, "max_recent_errors", config.max_recent_errors);
        config.data_directory = engine.child("data_directory").text().as_string(config.data_directory.c_str());
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// EngineConfig Implementation
// ============================================================================

EngineConfig EngineConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }
    return from_document(doc);
}

EngineConfig EngineConfig::parse(const std::string& xml_text) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml_text.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }
    return from_document(doc);
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig{};
}

bool EngineConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("nightfall_config");

    // Connection settings
    auto conn = root.append_child("connection");
    conn.append_child("url").text().set(connection.url.c_str());
    write_ms(conn, "reconnect_base_delay_ms", connection.reconnect_base_delay);
    write_ms(conn, "reconnect_max_delay_ms", connection.reconnect_max_delay);
    conn.append_child("max_reconnect_attempts").text().set(connection.max_reconnect_attempts);
    write_ms(conn, "heartbeat_interval_ms", connection.heartbeat_interval);
    write_ms(conn, "heartbeat_timeout_ms", connection.heartbeat_timeout);

    // Action queue settings
    auto q = root.append_child("queue");
    q.append_child("max_retries").text().set(queue.default_max_retries);
    write_ms(q, "ack_timeout_ms", queue.ack_timeout);
    write_ms(q, "retry_flush_delay_ms", queue.retry_flush_delay);
    q.append_child("max_size").text().set(static_cast<unsigned long long>(queue.max_queue_size));

    // Sync settings
    auto s = root.append_child("sync");
    write_ms(s, "conflict_tolerance_ms", sync.conflict_tolerance);
    write_ms(s, "sync_timeout_ms", sync.sync_timeout);
    s.append_child("max_sync_attempts").text().set(sync.max_sync_attempts);
    write_ms(s, "retry_base_delay_ms", sync.sync_retry_base_delay);
    write_ms(s, "retry_max_delay_ms", sync.sync_retry_max_delay);
    s.append_child("auto_resolve_server_hints").text().set(sync.auto_resolve_server_hints);
    s.append_child("max_conflict_history").text().set(
        static_cast<unsigned long long>(sync.max_conflict_history));

    // Loader settings
    auto l = root.append_child("loader");
    l.append_child("max_cache_size").text().set(static_cast<unsigned long long>(loader.max_cache_size));
    l.append_child("max_fetch_attempts").text().set(loader.max_fetch_attempts);
    write_ms(l, "retry_base_delay_ms", loader.retry_base_delay);
    write_ms(l, "default_expiry_ms", loader.default_expiry);
    for (const auto& [type, lifetime] : loader.type_expiry) {
        auto expiry = l.append_child("expiry");
        expiry.append_attribute("type") = type.c_str();
        expiry.text().set(static_cast<long long>(lifetime.count()));
    }

    // Logging settings
    auto lg = root.append_child("logging");
    lg.append_child("level").text().set(logging.level.c_str());
    lg.append_child("pattern").text().set(logging.pattern.c_str());

    // Engine settings
    auto engine = root.append_child("engine");
    engine.append_child("max_recent_errors").text().set(static_cast<unsigned long long>(max_recent_errors));
    engine.append_child("data_directory").text().set(data_directory.c_str());

    return doc.save_file(path.c_str());
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./data");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

EngineConfig ConfigLoader::load_engine_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Engine config file not found: " + path);
    }
    return EngineConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    // Check if it's already a path that exists
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace nightfall::config
