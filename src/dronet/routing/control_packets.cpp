/**
 * @file control_packets.cpp
 * @brief Implementation of the Ack/Nack builders.
 */
#include "dronet/routing/control_packets.hpp"

#include <utility>
#include <variant>

namespace dronet::routing {

static net::Packet reply_to(const net::Packet& original, net::Payload payload) {
    return net::Packet{
        .routing_header = net::reverse(original.routing_header),
        .session_id     = original.session_id,
        .payload        = std::move(payload),
    };
}

dronet_detail::expected<net::Packet, PacketError>
build_ack(const net::Packet& fragment_packet) {
    const auto* frag = std::get_if<net::Fragment>(&fragment_packet.payload);
    if (!frag) return dronet_detail::unexpected(PacketError::NotAFragment);
    return reply_to(fragment_packet, net::Ack{.fragment_index = frag->fragment_index});
}

dronet_detail::expected<net::Packet, PacketError>
build_nack(const net::Packet& fragment_packet, net::NackKind kind, net::NodeId node) {
    const auto* frag = std::get_if<net::Fragment>(&fragment_packet.payload);
    if (!frag) return dronet_detail::unexpected(PacketError::NotAFragment);
    return reply_to(fragment_packet,
                    net::Nack{.fragment_index = frag->fragment_index, .kind = kind, .node = node});
}

net::Packet build_nack_tolerant(const net::Packet& packet, net::NackKind kind, net::NodeId node) {
    std::uint64_t index = 0;
    (void)net::fragment_index_of(packet.payload, index); // stays 0 for flood payloads
    return reply_to(packet, net::Nack{.fragment_index = index, .kind = kind, .node = node});
}

} // namespace dronet::routing
