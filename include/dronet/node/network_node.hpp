#pragma once
/**
 * @file network_node.hpp
 * @brief Base class shared by every node kind (drone, client, server).
 *
 * The base owns the protocol state (neighbor table, seen floods, session-id RNG,
 * inbound queue, event link, logger) and provides the shared operations:
 * dispatch, forwarding, flood handling, Ack/Nack building and topology edits.
 * A concrete node derives from it and implements only its kind-specific parts:
 *
 *   - handle_routed_packet(): everything that is not a FloodRequest
 *   - handle_command():       runtime reconfiguration
 *   - crashing():             optional faulty-behaviour flag (default false)
 *
 * Threading: one control thread per node calls run() or step(); nothing in the
 * base is synchronized, and the node must neither be copied nor moved once
 * constructed (the router and flood controller point into it).
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>

#include "dronet/compat/expected.hpp"
#include "dronet/config/config_loader.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/node/command.hpp"
#include "dronet/obs/logger.hpp"
#include "dronet/routing/control_packets.hpp"
#include "dronet/routing/flood_controller.hpp"
#include "dronet/routing/neighbor_table.hpp"
#include "dronet/routing/packet_router.hpp"

namespace dronet::node {

class NetworkNode {
public:
    /**
     * @param cfg      Identity, RNG seed and logging settings.
     * @param inbound  Receiving half of this node's packet channel.
     * @param events   Link to the simulation controller.
     * @param log      Shared logging sink (nullptr = silent).
     * @param commands Receiving half of this node's command channel (may be detached).
     */
    NetworkNode(const config::NodeConfig& cfg,
                net::PacketReceiver inbound,
                net::EventSender events,
                std::shared_ptr<obs::Logger> log,
                CommandReceiver commands = {});

    virtual ~NetworkNode() = default;

    NetworkNode(const NetworkNode&)            = delete;
    NetworkNode& operator=(const NetworkNode&) = delete;
    NetworkNode(NetworkNode&&)                 = delete;
    NetworkNode& operator=(NetworkNode&&)      = delete;

    // --------------------------- Identity ------------------------------------
    net::NodeId   id() const noexcept { return id_; }
    net::NodeType node_type() const noexcept { return type_; }

    /// Faulty-behaviour flag; a crashing node stops taking part in discovery.
    virtual bool crashing() const noexcept { return false; }

    // --------------------------- Shared operations ---------------------------
    /**
     * @brief Dispatch one arrived packet: FloodRequest to the flood controller,
     *        anything else to handle_routed_packet().
     * @return Whether the packet was handled.
     */
    bool handle_packet(net::Packet packet);

    /// Deliver @p packet to hops[hop_index] (see routing::PacketRouter::forward).
    dronet_detail::expected<routing::ForwardStatus, routing::ForwardError>
    forward_packet(net::Packet packet);

    dronet_detail::expected<net::Packet, routing::PacketError>
    build_ack(const net::Packet& fragment_packet) const;

    dronet_detail::expected<net::Packet, routing::PacketError>
    build_nack(const net::Packet& fragment_packet, net::NackKind kind, net::NodeId node = 0) const;

    /// Insert or replace the channel to neighbor @p id.
    void add_channel(net::NodeId id, net::PacketSender sender);

    /// Forget neighbor @p id; an unknown id is logged and leaves the table untouched.
    routing::NeighborErr remove_channel(net::NodeId id);

    /// Start a discovery flood from this node. Returns the number of neighbors reached.
    std::size_t start_flood(std::uint64_t flood_id);

    /// Fresh session id from this node's RNG.
    std::uint64_t next_session_id() { return flood_.next_session_id(); }

    /// Apply AddSender/RemoveSender of any node kind. Returns false for commands that are not topology edits.
    bool apply_topology_command(const Command& command);

    // --------------------------- Run loop ------------------------------------
    /**
     * @brief Drain pending commands, then wait up to @p wait for one packet and handle it.
     * @return false once the node should stop (stop requested, or inbound channel closed).
     */
    bool step(std::chrono::milliseconds wait);

    /// Call step() until @p st is triggered or step() returns false.
    void run(std::stop_token st);

    // --------------------------- State access --------------------------------
    routing::NeighborTable&       neighbors() noexcept { return neighbors_; }
    const routing::NeighborTable& neighbors() const noexcept { return neighbors_; }
    routing::SeenFloods&          seen_floods() noexcept { return seen_; }
    routing::SessionRng&          random_generator() noexcept { return rng_; }
    net::PacketReceiver&          packet_receiver() noexcept { return inbound_; }
    const net::EventSender&       event_sender() const noexcept { return events_; }
    obs::Logger&                  logger() const noexcept { return *log_; }

    /// Number of packets handled by this node since construction.
    std::uint64_t packets_handled() const noexcept { return packets_handled_; }

protected:
    /// Handle a non-flood packet. Return whether it was handled.
    virtual bool handle_routed_packet(net::Packet packet) = 0;

    /// Apply a runtime reconfiguration command.
    virtual void handle_command(Command command) = 0;

    /// Make the next step() return false.
    void request_stop() noexcept { stop_requested_ = true; }

    const routing::PacketRouter& router() const noexcept { return router_; }
    routing::FloodController&    flood() noexcept { return flood_; }

private:
    net::NodeId                  id_;
    net::NodeType                type_;
    std::shared_ptr<obs::Logger> log_;
    routing::NeighborTable       neighbors_;
    routing::SeenFloods          seen_;
    routing::SessionRng          rng_;
    net::PacketReceiver          inbound_;
    net::EventSender             events_;
    CommandReceiver              commands_;
    routing::PacketRouter        router_;
    routing::FloodController     flood_;
    bool                         stop_requested_{false};
    std::uint64_t                packets_handled_{0};
};

} // namespace dronet::node
