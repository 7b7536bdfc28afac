/**
 * @file flood_controller.cpp
 * @brief Implementation of FloodController and the response builder.
 */
#include "dronet/routing/flood_controller.hpp"
#include "dronet/config/constants.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

namespace dronet::routing {

static std::string id_str(net::NodeId id) { return std::to_string(static_cast<unsigned>(id)); }

net::Packet build_flood_response(std::uint64_t flood_id, net::PathTrace trace, std::uint64_t session_id) {
    net::RoutingHeader back;
    back.hops.reserve(trace.size());
    for (const auto& hop : trace) back.hops.push_back(hop.first);
    std::reverse(back.hops.begin(), back.hops.end()); // answering node first
    back.hop_index = back.hops.size() > 1 ? config::constants::REVERSED_HOP_INDEX : 0;

    return net::Packet{
        .routing_header = std::move(back),
        .session_id     = session_id,
        .payload        = net::FloodResponse{.flood_id = flood_id, .path_trace = std::move(trace)},
    };
}

dronet_detail::expected<FloodOutcome, FloodError>
FloodController::handle_request(const net::Packet& packet) {
    const auto* req = std::get_if<net::FloodRequest>(&packet.payload);
    if (!req) {
        log_->error(self_, "The packet to be broadcast is not a flood request: " +
                           std::string(net::payload_name(packet.payload)));
        return dronet_detail::unexpected(FloodError::NotAFloodRequest);
    }
    if (req->path_trace.empty()) {
        log_->error(self_, "Flood request " + std::to_string(req->flood_id) + " carries an empty path trace");
        return dronet_detail::unexpected(FloodError::EmptyPathTrace);
    }

    const net::NodeId who_sent_me_this = req->path_trace.back().first;

    net::FloodRequest extended = *req;
    extended.path_trace.emplace_back(self_, type_);

    // 1. Termination tests
    const SeenFloodKey key{.initiator_id = req->initiator_id, .flood_id = req->flood_id};
    const bool already_seen = seen_->contains(key);
    // A single neighbor must be the one the request came from: nobody left to forward to.
    const bool dead_end = neighbors_->size() == 1;

    // 2a. Answer back toward the predecessor
    if (already_seen || dead_end) {
        auto response = build_flood_response(extended.flood_id, std::move(extended.path_trace),
                                             next_session_id());
        log_->status(self_, "Answering flood " + std::to_string(key.flood_id) + " of initiator " +
                            id_str(key.initiator_id) + " via " + net::to_string(response.routing_header) +
                            (already_seen ? " (already seen)" : " (dead end)"));
        if (!router_->forward(std::move(response))) {
            return dronet_detail::unexpected(FloodError::ResponseUndeliverable);
        }
        return FloodOutcome::Responded;
    }

    // 2b. Propagate
    seen_->insert(key);
    const net::Packet updated{
        .routing_header = packet.routing_header,
        .session_id     = packet.session_id,
        .payload        = std::move(extended),
    };
    (void)broadcast(updated, who_sent_me_this);
    return FloodOutcome::Broadcast;
}

std::size_t FloodController::initiate(std::uint64_t flood_id) {
    // The initiator counts its own flood as seen, so an echo is answered, not re-flooded.
    seen_->insert(SeenFloodKey{.initiator_id = self_, .flood_id = flood_id});

    const net::Packet request{
        .routing_header = {},
        .session_id     = next_session_id(),
        .payload        = net::FloodRequest{
            .flood_id     = flood_id,
            .initiator_id = self_,
            .path_trace   = {net::PathHop{self_, type_}},
        },
    };
    log_->status(self_, "Starting flood " + std::to_string(flood_id) + " to " +
                        std::to_string(neighbors_->size()) + " neighbour(s)");
    return fan_out(request, nullptr);
}

std::size_t FloodController::broadcast(const net::Packet& packet, net::NodeId exclude) {
    return fan_out(packet, &exclude);
}

std::size_t FloodController::fan_out(const net::Packet& packet, const net::NodeId* exclude) {
    std::size_t delivered = 0;
    // ids() is a sorted snapshot: fan-out order is deterministic.
    for (const auto node_id : neighbors_->ids()) {
        if (exclude && node_id == *exclude) continue;
        const auto* link = neighbors_->find(node_id);
        if (!link) continue;

        net::Packet copy = packet;
        copy.routing_header = net::direct(self_, node_id);
        if (router_->deliver(*link, std::move(copy))) {
            ++delivered;
        } else {
            log_->error(self_, "Failed to send packet to NodeId " + id_str(node_id));
        }
    }
    return delivered;
}

} // namespace dronet::routing
