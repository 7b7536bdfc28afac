/**
 * @file types.hpp
 * @brief Node identity model shared by headers, packets, and the routing core.
 *
 * Centralizing these types keeps comparisons and printing consistent across the
 * routing header, the flood path trace, and the node base class.
 */
#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace dronet::net {

/// Identifier of a node, unique inside one simulated network.
using NodeId = std::uint8_t;

/**
 * @brief Role of a node, recorded in flood path traces.
 *
 * @note Topology consumers use the tag to tell relays (Drone) apart from
 *       endpoints (Client, Server).
 */
enum class NodeType : std::uint8_t {
  Client = 0,
  Drone  = 1,
  Server = 2
};

/// What a server offers to clients. A server starts as Undefined until told otherwise.
enum class ServerType : std::uint8_t {
  Content = 0,
  Communication,
  Undefined
};

/// One visited node in a flood path trace.
using PathHop = std::pair<NodeId, NodeType>;

/// Ordered record of every node a flood request has visited.
using PathTrace = std::vector<PathHop>;

/// Human-readable tag for logs.
constexpr std::string_view to_string(NodeType t) noexcept {
  switch (t) {
    case NodeType::Client: return "Client";
    case NodeType::Drone:  return "Drone";
    case NodeType::Server: return "Server";
  }
  return "Unknown";
}

constexpr std::string_view to_string(ServerType t) noexcept {
  switch (t) {
    case ServerType::Content:       return "Content";
    case ServerType::Communication: return "Communication";
    case ServerType::Undefined:     return "Undefined";
  }
  return "Unknown";
}

} // namespace dronet::net
