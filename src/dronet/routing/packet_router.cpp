/**
 * @file packet_router.cpp
 * @brief Implementation of PacketRouter.
 */
#include "dronet/routing/packet_router.hpp"

#include <string>
#include <utility>

namespace dronet::routing {

void PacketRouter::emit(net::NodeEvent event) const {
    if (!events_->send(std::move(event))) {
        log_->error(self_, "Failed to send PacketSent event: simulation controller disconnected");
    }
}

dronet_detail::expected<void, chan::ChannelError>
PacketRouter::deliver(const net::PacketSender& link, net::Packet packet) const {
    emit(net::PacketSent{packet});
    return link.send(std::move(packet));
}

dronet_detail::expected<ForwardStatus, ForwardError>
PacketRouter::forward(net::Packet packet) const {
    const auto next = net::try_next_hop(packet.routing_header);
    if (!next) {
        log_->error(self_, "Cannot forward " + std::string(net::payload_name(packet.payload)) +
                           " with header " + net::to_string(packet.routing_header));
        return dronet_detail::unexpected(ForwardError::InvalidHeader);
    }

    const auto* link = neighbors_->find(*next);
    if (!link) {
        log_->status(self_, "No channel found for next hop: " + std::to_string(static_cast<unsigned>(*next)));
        return ForwardStatus::NoRoute;
    }

    if (!deliver(*link, std::move(packet))) {
        log_->error(self_, "Failed to forward the packet to " + std::to_string(static_cast<unsigned>(*next)));
        return dronet_detail::unexpected(ForwardError::LinkDisconnected);
    }
    return ForwardStatus::Delivered;
}

} // namespace dronet::routing
