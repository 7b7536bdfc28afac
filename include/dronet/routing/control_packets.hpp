#pragma once
/**
 * @file control_packets.hpp
 * @brief Ack/Nack construction from a received data fragment.
 * @details Built packets keep the session id of the fragment and travel back over
 *          the reversed header (see net::reverse). Nothing is sent here.
 */

#include <cstdint>

#include "dronet/compat/expected.hpp"
#include "dronet/net/packet.hpp"

namespace dronet::routing {

/** @enum PacketError
 *  @brief Caller handed in a packet of the wrong kind.
 */
enum class PacketError : uint8_t {
    NotAFragment = 1   ///< Ack/Nack requested for a payload that is not a Fragment
};

/**
 * @brief Acknowledge @p fragment_packet.
 * @return Ack{fragment_index} with the reversed header, or NotAFragment.
 */
dronet_detail::expected<net::Packet, PacketError>
build_ack(const net::Packet& fragment_packet);

/**
 * @brief Negatively acknowledge @p fragment_packet.
 * @param kind Failure reason.
 * @param node Node involved for ErrorInRouting / UnexpectedRecipient, 0 otherwise.
 * @return Nack with the reversed header, or NotAFragment.
 */
dronet_detail::expected<net::Packet, PacketError>
build_nack(const net::Packet& fragment_packet, net::NackKind kind, net::NodeId node = 0);

/**
 * @brief Nack for any routed packet; the fragment index falls back to the one carried
 *        by an Ack/Nack payload, or 0.
 * @details For drones that must bounce a control packet they cannot route.
 */
net::Packet build_nack_tolerant(const net::Packet& packet, net::NackKind kind, net::NodeId node = 0);

} // namespace dronet::routing
