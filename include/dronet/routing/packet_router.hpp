#pragma once
/**
 * @file packet_router.hpp
 * @brief Delivery of one packet to the neighbor under its header cursor.
 * @details Every attempted send is mirrored to the simulation controller as a
 *          PacketSent event before the packet goes on the link.
 */

#include <cstdint>

#include "dronet/chan/channel.hpp"
#include "dronet/compat/expected.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/obs/logger.hpp"
#include "dronet/routing/neighbor_table.hpp"

namespace dronet::routing {

/** @enum ForwardStatus
 *  @brief Non-error outcomes of PacketRouter::forward.
 */
enum class ForwardStatus : uint8_t {
    Delivered,  ///< Packet handed to the next hop's channel
    NoRoute     ///< Next hop is not a neighbor: packet dropped, logged only
};

/** @enum ForwardError
 *  @brief Failures that abort a forward.
 */
enum class ForwardError : uint8_t {
    InvalidHeader = 1,  ///< Cursor outside the hop list
    LinkDisconnected    ///< Neighbor channel refused the packet
};

/** @class PacketRouter
 *  @brief Stateless forwarding helper bound to one node's table, event link and logger.
 *  @note Holds references: the owning node must outlive it and must not move.
 */
class PacketRouter {
public:
    PacketRouter(net::NodeId self,
                 const NeighborTable& neighbors,
                 const net::EventSender& events,
                 obs::Logger& log) noexcept
        : self_(self), neighbors_(&neighbors), events_(&events), log_(&log) {}

    /**
     * @brief Send @p packet to hops[hop_index].
     * @return NoRoute when the hop is unknown (not an error); LinkDisconnected when the
     *         channel send fails. The cursor is not modified.
     */
    dronet_detail::expected<ForwardStatus, ForwardError> forward(net::Packet packet) const;

    /**
     * @brief Emit PacketSent for @p packet, then send it on @p link.
     * @details Event emission is best-effort: a failure is logged and delivery proceeds.
     */
    dronet_detail::expected<void, chan::ChannelError>
    deliver(const net::PacketSender& link, net::Packet packet) const;

    /// Best-effort event emission to the simulation controller.
    void emit(net::NodeEvent event) const;

    net::NodeId self() const noexcept { return self_; }

private:
    net::NodeId             self_;
    const NeighborTable*    neighbors_;
    const net::EventSender* events_;
    obs::Logger*            log_;
};

} // namespace dronet::routing
