/**
 * @file main.cpp
 * @brief Nightfall command-line sync client
 *
 * Connects to a game server over WebSocket, restores offline state, joins a
 * room and keeps the local replica in sync until interrupted. Profile and
 * room data are served from JSON files under the data directory.
 */

#include "nightfall/nightfall.h"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

// Global shutdown flag
std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

namespace {

/**
 * @brief Serves requests from <root>/<endpoint>.json
 */
class LocalFileFetcher : public nightfall::loader::IDataFetcher {
public:
    explicit LocalFileFetcher(std::filesystem::path root) : root_(std::move(root)) {}

    void fetch(const nightfall::loader::DataRequest& request,
               nightfall::loader::FetchCallback callback) override {
        std::string relative = request.endpoint;
        while (!relative.empty() && relative.front() == '/') {
            relative.erase(relative.begin());
        }
        std::filesystem::path path = root_ / (relative + ".json");

        std::ifstream file(path);
        if (!file.is_open()) {
            callback(nightfall::loader::FetchResponse::failure("not found: " + path.string()));
            return;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        callback(nightfall::loader::FetchResponse::success(buffer.str()));
    }

private:
    std::filesystem::path root_;
};

void print_usage(const char* program) {
    std::cout << "Nightfall Sync Client\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --url <url>         Server WebSocket URL (default from config)\n"
              << "  --config <file>     Engine XML configuration\n"
              << "  --token <token>     Session credential\n"
              << "  --player <id>       Local player id\n"
              << "  --room <id>         Room to join after connecting\n"
              << "  --data-dir <dir>    Directory with local JSON data (default: ./data)\n"
              << "  --verbose           Trace-level logging\n"
              << "  --help              Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace nightfall;

    // Parse command line arguments
    std::string url;
    std::string config_path;
    std::string token;
    std::string player_id;
    std::string room_id;
    std::string data_dir = "./data";
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--token" && i + 1 < argc) {
            token = argv[++i];
        } else if (arg == "--player" && i + 1 < argc) {
            player_id = argv[++i];
        } else if (arg == "--room" && i + 1 < argc) {
            room_id = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration
    config::EngineConfig engine_config = config::EngineConfig::defaults();
    if (!config_path.empty()) {
        try {
            config::ConfigLoader loader;
            engine_config = loader.load_engine_config(config_path);
        } catch (const std::runtime_error& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return 1;
        }
    }
    if (!url.empty()) {
        engine_config.connection.url = url;
    }
    if (verbose) {
        engine_config.logging = log::LoggingConfig::verbose();
    }
    log::configure(engine_config.logging);

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    log::logger()->info("Nightfall sync client {}", GetVersionString());

    core::PollingScheduler scheduler;
    net::WebSocketTransport transport;
    LocalFileFetcher fetcher(data_dir);
    persist::FilePersistenceStore store(engine_config.data_directory);

    engine::SyncEngine engine(transport, scheduler, fetcher, store, engine_config);
    engine.set_local_player(player_id);

    engine.notices().subscribe([](const engine::EngineNotice& notice) {
        std::cout << "[" << engine::notice_severity_to_string(notice.severity) << "] "
                  << notice.code << ": " << notice.message << "\n";
    });
    engine.view_changes().subscribe([](const game::GameState& view) {
        std::cout << "room " << (view.room_id.empty() ? "-" : view.room_id)
                  << " | phase " << game::game_phase_to_string(view.phase)
                  << " | day " << view.day_number
                  << " | players " << view.players.size()
                  << " | votes " << view.votes.size() << "\n";
    });

    engine::EngineResult result = engine.restore_durable_state();
    if (result != engine::EngineResult::Success) {
        log::logger()->warn("Starting without offline state: {}", engine::engine_result_to_string(result));
    }

    result = engine.connect(token);
    if (result != engine::EngineResult::Success) {
        std::cerr << "Failed to connect: " << engine::engine_result_to_string(result) << "\n";
        return 1;
    }

    auto report = [](const char* what) {
        return [what](const loader::LoadResult& loaded) {
            std::cout << what << ": " << loaded.data.size() << " loaded, "
                      << loaded.failed.size() << " failed\n";
        };
    };
    result = engine.load_data(loader::presets::critical_data(player_id), report("profile data"));
    if (result != engine::EngineResult::Success) {
        log::logger()->warn("Profile data not requested: {}", engine::engine_result_to_string(result));
    }

    if (!room_id.empty()) {
        result = engine.enqueue_action(net::wire::JOIN_ROOM, FieldMap{{"roomId", room_id}},
                                       sync::ActionPriority::High);
        if (result != engine::EngineResult::Success) {
            log::logger()->warn("Could not join room: {}", engine::engine_result_to_string(result));
        }
        result = engine.load_data(loader::presets::game_data(room_id), report("room data"));
        if (result != engine::EngineResult::Success) {
            log::logger()->warn("Room data not requested: {}", engine::engine_result_to_string(result));
        }
    }

    // Main loop: service the socket, then timers and posted work
    while (g_running) {
        transport.poll();
        scheduler.poll();
        std::this_thread::sleep_for(scheduler.time_until_next(Duration(20)));
    }

    log::logger()->info("Shutting down ({} actions still queued)", engine.pending_actions().size());
    engine.disconnect();
    return 0;
}
