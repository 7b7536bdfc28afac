#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for node bring-up and the protocol core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON file) per node.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace dronet::config::constants {

// =====================
// Packet layout
// =====================
/// Bytes of message data carried by a single fragment.
inline constexpr std::size_t FRAGMENT_DATA_SIZE = 128;

// =====================
// Routing header
// =====================
/// Cursor assigned to a freshly reversed header: position 0 is the replying node.
inline constexpr std::size_t REVERSED_HOP_INDEX = 1;

/// Cursor of a single-hop fan-out header `[self, neighbor]`.
inline constexpr std::size_t DIRECT_HOP_INDEX = 1;

// =====================
// Logging
// =====================
/// Logging state of a node built from defaults.
inline constexpr bool LOG_ENABLED_DEFAULT = true;

// =====================
// Node run loop
// =====================
/// Upper bound a node blocks on its inbound channel before re-checking commands/stop.
inline constexpr std::chrono::milliseconds RUN_LOOP_POLL{5};

} // namespace dronet::config::constants
