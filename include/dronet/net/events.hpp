#pragma once
/**
 * @file events.hpp
 * @brief Events a node reports to the simulation controller.
 * @details The event channel is a side channel: the protocol core only appends to
 *          it and never takes decisions based on it.
 */

#include <variant>

#include "dronet/chan/channel.hpp"
#include "dronet/net/packet.hpp"

namespace dronet::net {

    /** @struct PacketSent
     *  @brief A packet was handed to a neighbor channel (copy of what was sent).
     */
    struct PacketSent {
        Packet packet;
        bool operator==(const PacketSent&) const = default;
    };

    /** @struct PacketDropped
     *  @brief A node discarded a fragment on purpose (drone drop rate).
     */
    struct PacketDropped {
        Packet packet;
        bool operator==(const PacketDropped&) const = default;
    };

    using NodeEvent = std::variant<PacketSent, PacketDropped>;

    /// Outbound handle to the simulation controller.
    using EventSender = chan::Sender<NodeEvent>;

    /// Outbound handle to a neighbor.
    using PacketSender = chan::Sender<Packet>;

    /// Inbound packet queue of a node.
    using PacketReceiver = chan::Receiver<Packet>;

} // namespace dronet::net
