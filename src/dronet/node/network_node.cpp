/**
 * @file network_node.cpp
 * @brief Shared operations of NetworkNode.
 */
#include "dronet/node/network_node.hpp"
#include "dronet/config/constants.hpp"

#include <random>
#include <string>
#include <utility>
#include <variant>

namespace dronet::node {

static routing::SessionRng make_rng(const config::NodeConfig& cfg) {
    if (cfg.seed) return routing::SessionRng(*cfg.seed);
    std::random_device rd;
    return routing::SessionRng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

NetworkNode::NetworkNode(const config::NodeConfig& cfg,
                         net::PacketReceiver inbound,
                         net::EventSender events,
                         std::shared_ptr<obs::Logger> log,
                         CommandReceiver commands)
    : id_(cfg.id),
      type_(cfg.type),
      log_(log ? std::move(log) : obs::null_logger()),
      rng_(make_rng(cfg)),
      inbound_(std::move(inbound)),
      events_(std::move(events)),
      commands_(std::move(commands)),
      router_(id_, neighbors_, events_, *log_),
      flood_(id_, type_, neighbors_, seen_, rng_, router_, *log_) {}

bool NetworkNode::handle_packet(net::Packet packet) {
    ++packets_handled_;
    if (!std::holds_alternative<net::FloodRequest>(packet.payload)) {
        return handle_routed_packet(std::move(packet));
    }

    if (crashing()) {
        log_->status(id_, "Crashing: flood request dropped");
        return false;
    }
    return flood_.handle_request(packet).has_value();
}

dronet_detail::expected<routing::ForwardStatus, routing::ForwardError>
NetworkNode::forward_packet(net::Packet packet) {
    return router_.forward(std::move(packet));
}

dronet_detail::expected<net::Packet, routing::PacketError>
NetworkNode::build_ack(const net::Packet& fragment_packet) const {
    auto ack = routing::build_ack(fragment_packet);
    if (!ack) log_->error(id_, "Attempt of building an ack on a non-fragment packet");
    return ack;
}

dronet_detail::expected<net::Packet, routing::PacketError>
NetworkNode::build_nack(const net::Packet& fragment_packet, net::NackKind kind, net::NodeId node) const {
    auto nack = routing::build_nack(fragment_packet, kind, node);
    if (!nack) log_->error(id_, "Attempt of building a nack on a non-fragment packet");
    return nack;
}

void NetworkNode::add_channel(net::NodeId id, net::PacketSender sender) {
    if (neighbors_.add(id, std::move(sender))) {
        log_->status(id_, "Replaced channel to neighbour " + std::to_string(static_cast<unsigned>(id)));
    }
}

routing::NeighborErr NetworkNode::remove_channel(net::NodeId id) {
    const auto r = neighbors_.remove(id);
    if (r == routing::NeighborErr::NotFound) {
        log_->error(id_, "The current node " + std::to_string(static_cast<unsigned>(id_)) +
                         " has no neighbour node " + std::to_string(static_cast<unsigned>(id)) + ".");
    }
    return r;
}

std::size_t NetworkNode::start_flood(std::uint64_t flood_id) {
    return flood_.initiate(flood_id);
}

bool NetworkNode::apply_topology_command(const Command& command) {
    // AddSender/RemoveSender are alternatives of every per-kind command set.
    return std::visit([this](const auto& per_kind) {
        if (const auto* add = std::get_if<AddSender>(&per_kind)) {
            add_channel(add->id, add->sender);
            return true;
        }
        if (const auto* rm = std::get_if<RemoveSender>(&per_kind)) {
            (void)remove_channel(rm->id); // a miss is logged by remove_channel
            return true;
        }
        return false;
    }, command);
}

bool NetworkNode::step(std::chrono::milliseconds wait) {
    // Commands first: topology edits apply before the next packet is routed.
    while (auto cmd = commands_.try_recv()) {
        handle_command(std::move(*cmd));
    }
    if (stop_requested_) return false;

    auto packet = inbound_.recv_for(wait);
    if (packet) {
        (void)handle_packet(std::move(*packet));
    } else if (packet.error() == chan::ChannelError::Disconnected) {
        log_->status(id_, "Inbound channel closed, stopping");
        return false;
    }
    return !stop_requested_;
}

void NetworkNode::run(std::stop_token st) {
    log_->status(id_, std::string("Node started as ") + std::string(net::to_string(type_)));
    while (!st.stop_requested() && step(config::constants::RUN_LOOP_POLL)) {
    }
    log_->status(id_, "Node stopped");
}

} // namespace dronet::node
