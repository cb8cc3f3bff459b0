#pragma once
/**
 * @file config.h
 * @brief Sync engine settings and their XML loader
 */

#include "nightfall/core/logging.h"
#include "nightfall/loader/progressive_loader.h"
#include "nightfall/net/connection_manager.h"
#include "nightfall/sync/action_queue.h"
#include "nightfall/sync/sync_coordinator.h"
#include <string>
#include <vector>

namespace nightfall::config {

/**
 * @brief Settings for every engine component
 *
 * Every section is optional; absent values keep the component defaults.
 */
struct EngineConfig {
    net::ConnectionConfig connection;
    sync::ActionQueueConfig queue;
    sync::SyncCoordinatorConfig sync;
    loader::LoaderConfig loader;
    log::LoggingConfig logging;

    // Engine
    SizeT max_recent_errors{50};
    std::string data_directory{"./nightfall_data"};

    /**
     * @brief Read a <nightfall_config> document from disk
     * @throws std::runtime_error if the file cannot be parsed
     */
    static EngineConfig load(const std::string& path);

    /**
     * @brief Parse configuration from XML text
     * @throws std::runtime_error if the text cannot be parsed
     */
    static EngineConfig parse(const std::string& xml_text);

    /**
     * @brief Component defaults, no file involved
     */
    static EngineConfig defaults();

    /**
     * @brief Write every section, durations in milliseconds
     * @return false if the file could not be written
     */
    bool save(const std::string& path) const;
};

/**
 * @brief Resolves config file names against search paths
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Find and load an engine config file
     * @throws std::runtime_error if no search path holds the file
     */
    EngineConfig load_engine_config(const std::string& path);

    /**
     * @brief Append a directory to search after the defaults
     */
    void add_search_path(const std::string& path);

    /**
     * @return Resolved path, or an empty string if not found
     */
    std::string find_file(const std::string& filename) const;

private:
    std::vector<std::string> search_paths_;
};

} // namespace nightfall::config
