#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

#include "dronet/config/constants.hpp"
#include "dronet/net/routing_header.hpp"
#include "dronet/net/types.hpp"

namespace dronet::net {

/**
 * @file packet.hpp
 * @brief Packet envelope and its payload variants.
 *
 * Packets travel by value through in-process channels; there is no wire
 * encoding. Every type has structural equality so tests and the simulation
 * controller can compare a forwarded packet with the one reported in its
 * PacketSent event.
 */

/// @brief One piece of a fragmented message. The core never reads `data`.
struct Fragment final {
  std::uint64_t fragment_index{0};
  std::uint64_t total_n_fragments{0};
  /// @brief Valid bytes in `data`.
  std::uint8_t  length{0};
  std::array<std::uint8_t, config::constants::FRAGMENT_DATA_SIZE> data{};

  bool operator==(const Fragment&) const = default;
};

/// @brief Positive acknowledgement of one fragment.
struct Ack final {
  std::uint64_t fragment_index{0};

  bool operator==(const Ack&) const = default;
};

/**
 * @brief Closed taxonomy of forwarding failures.
 *
 * @note `ErrorInRouting` and `UnexpectedRecipient` carry the node involved in
 *       Nack::node; the others leave it at 0.
 */
enum class NackKind : std::uint8_t {
  ErrorInRouting = 0,   ///< Next hop missing from the neighbor table (node = missing hop)
  DestinationIsDrone,   ///< Path ends on a drone
  Dropped,              ///< Drone chose to drop the fragment
  UnexpectedRecipient   ///< Packet reached a node not at the cursor (node = receiver)
};

/// @brief Negative acknowledgement of one fragment.
struct Nack final {
  std::uint64_t fragment_index{0};
  NackKind      kind{NackKind::Dropped};
  NodeId        node{0};

  bool operator==(const Nack&) const = default;
};

/// @brief Network discovery probe; grows its path trace at every hop.
struct FloodRequest final {
  std::uint64_t flood_id{0};
  NodeId        initiator_id{0};
  PathTrace     path_trace{};

  bool operator==(const FloodRequest&) const = default;
};

/// @brief Answer to a flood request carrying the complete visited path.
struct FloodResponse final {
  std::uint64_t flood_id{0};
  PathTrace     path_trace{};

  bool operator==(const FloodResponse&) const = default;
};

using Payload = std::variant<Fragment, Ack, Nack, FloodRequest, FloodResponse>;

/**
 * @brief Packet envelope.
 *
 * `session_id` correlates related packets (fragments of a message and their
 * acks). Flood responses get a fresh one from the answering node.
 */
struct Packet final {
  RoutingHeader routing_header{};
  std::uint64_t session_id{0};
  Payload       payload{};

  bool operator==(const Packet&) const = default;
};

/// @brief Payload tag name for logs ("Fragment", "Ack", ...).
std::string_view payload_name(const Payload& p) noexcept;

/// @brief Payload tag name for logs.
std::string_view to_string(NackKind k) noexcept;

/// @brief Fragment index of the payload if it is a Fragment, Ack or Nack.
bool fragment_index_of(const Payload& p, std::uint64_t& out) noexcept;

} // namespace dronet::net
