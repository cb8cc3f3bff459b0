#pragma once
/**
 * @file types.h
 * @brief Core type definitions for Nightfall
 *
 * This file defines fundamental types used throughout the sync engine,
 * including numeric types, time units and the identifiers shared by the
 * queue, the coordinator and the loader.
 */

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <map>
#include <string>

namespace nightfall {

// ============================================================================
// Numeric Types
// ============================================================================

using Real = double;

// Integer types
using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Wall-clock time in milliseconds since the Unix epoch
 *
 * Server timestamps, action creation times and the last sync point all use
 * this unit so they can be compared directly.
 */
using Timestamp = Int64;

/**
 * @brief Millisecond duration used for every delay and timeout
 */
using Duration = std::chrono::milliseconds;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Handle for a scheduled timer
 */
using TimerId = UInt64;

/**
 * @brief Invalid timer handle constant
 */
constexpr TimerId INVALID_TIMER_ID = 0;

/**
 * @brief Handle returned when subscribing to an event channel
 */
using SubscriptionId = UInt64;

/**
 * @brief Invalid subscription handle constant
 */
constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/**
 * @brief Opaque, time-ordered identifier of a queued action
 */
using ActionId = std::string;

/**
 * @brief Identifier of a recorded conflict
 */
using ConflictId = std::string;

/**
 * @brief Flat string-keyed field map used for action payloads and request params
 */
using FieldMap = std::map<std::string, std::string>;

} // namespace nightfall
