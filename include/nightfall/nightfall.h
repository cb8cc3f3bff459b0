#pragma once
/**
 * @file nightfall.h
 * @brief Main include file for the Nightfall sync engine
 *
 * Include this single header to access all public Nightfall APIs.
 */

#include "nightfall/core/types.h"
#include "nightfall/core/scheduler.h"
#include "nightfall/core/event_channel.h"
#include "nightfall/core/logging.h"

#include "nightfall/net/wire.h"
#include "nightfall/net/wire_codec.h"
#include "nightfall/net/transport.h"
#include "nightfall/net/websocket_transport.h"
#include "nightfall/net/connection_manager.h"

#include "nightfall/game/game_state.h"
#include "nightfall/game/replica_state.h"

#include "nightfall/sync/action_queue.h"
#include "nightfall/sync/sync_coordinator.h"

#include "nightfall/loader/progressive_loader.h"
#include "nightfall/persist/persistence.h"

#include "nightfall/interface/config.h"
#include "nightfall/engine/sync_engine.h"

/**
 * @namespace nightfall
 * @brief Root namespace for all Nightfall components
 */
namespace nightfall {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace nightfall
