/**
 * @file main.cpp
 * @brief dronet_sim: small in-process network exercising the shared protocol core.
 *
 * **Topology**
 *   client 1 -- drone 2 -- drone 3 -- server 5
 *                    \       |       /
 *                     `-- drone 4 --'
 *
 * **Phase 1: discovery**
 * - Client 1 starts flood 1; every reply path it receives is printed.
 *
 * **Phase 2: data**
 * - Server 5 is told its type (SetServerType) and client 1 is handed one
 *   fragment for server 5 over the shortest discovered path (SendPacket);
 *   the server acks it and the ack travels back over the reversed header.
 *
 * **Usage**
 *   dronet_sim [config-file]
 * The optional file uses the node configuration format (see config_loader.hpp);
 * only its `seed` and `log` keys are used here.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "dronet/chan/channel.hpp"
#include "dronet/config/config_loader.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/node/network_node.hpp"
#include "dronet/obs/logger.hpp"
#include "dronet/routing/control_packets.hpp"
#include "dronet/version.hpp"

using namespace std::chrono_literals;
using dronet::net::NodeId;
using dronet::net::NodeType;
using dronet::net::Packet;

namespace {

std::string id_str(NodeId id) { return std::to_string(static_cast<unsigned>(id)); }

/// Drone: relays routed packets one hop along their header, drops fragments at its drop rate.
class RelayNode final : public dronet::node::NetworkNode {
public:
    using NetworkNode::NetworkNode;

    bool crashing() const noexcept override { return crashing_; }

protected:
    bool handle_routed_packet(Packet packet) override {
        const bool handled = relay(std::move(packet));
        if (crashing_ && packet_receiver().empty()) request_stop();
        return handled;
    }

    void handle_command(dronet::node::Command command) override {
        if (apply_topology_command(command)) return;
        const auto* cmd = std::get_if<dronet::node::DroneCommand>(&command);
        if (!cmd) {
            logger().error(id(), "Ignoring command for a " +
                                 std::string(dronet::net::to_string(dronet::node::target_kind(command))));
            return;
        }
        if (const auto* rate = std::get_if<dronet::node::drone::SetPacketDropRate>(cmd)) {
            drop_rate_ = std::clamp(rate->rate, 0.0f, 1.0f);
            return;
        }
        if (std::holds_alternative<dronet::node::drone::Crash>(*cmd)) {
            crashing_ = true;
            logger().status(id(), "Crash requested");
            if (packet_receiver().empty()) request_stop();
        }
    }

private:
    bool relay(Packet packet) {
        using dronet::net::NackKind;
        const auto here = dronet::net::try_next_hop(packet.routing_header);
        if (!here || *here != id()) {
            bounce(packet, NackKind::UnexpectedRecipient, id());
            return false;
        }

        const Packet at_self = packet; // cursor on this node, used for replies
        if (!dronet::net::advance(packet.routing_header)) {
            bounce(at_self, NackKind::DestinationIsDrone, 0);
            return false;
        }

        const NodeId next = dronet::net::next_hop(packet.routing_header);
        const bool is_fragment = std::holds_alternative<dronet::net::Fragment>(packet.payload);

        if (is_fragment && crashing_) {
            bounce(at_self, NackKind::ErrorInRouting, next);
            return false;
        }
        if (!neighbors().contains(next)) {
            bounce(at_self, NackKind::ErrorInRouting, next);
            return false;
        }
        if (is_fragment && drop_rate_ > 0.0f &&
            std::bernoulli_distribution(drop_rate_)(drop_rng_)) {
            router().emit(dronet::net::PacketDropped{packet});
            bounce(at_self, NackKind::Dropped, 0);
            return false;
        }
        return forward_packet(std::move(packet)).has_value();
    }

    void bounce(const Packet& at_self, dronet::net::NackKind kind, NodeId node) {
        // Fragments get a proper Nack; control packets fall back to index 0.
        Packet reply;
        if (std::holds_alternative<dronet::net::Fragment>(at_self.payload)) {
            auto nack = build_nack(at_self, kind, node);
            if (!nack) return;
            reply = std::move(*nack);
        } else {
            reply = dronet::routing::build_nack_tolerant(at_self, kind, node);
        }
        logger().status(id(), std::string("Nack ") + std::string(dronet::net::to_string(kind)) +
                              " via " + dronet::net::to_string(reply.routing_header));
        (void)forward_packet(std::move(reply));
    }

    bool         crashing_{false};
    float        drop_rate_{0.0f};
    std::mt19937 drop_rng_{std::random_device{}()};
};

/// Client or server: terminates routed packets, acks fragments, records discovered paths.
class EndpointNode final : public dronet::node::NetworkNode {
public:
    using NetworkNode::NetworkNode;

    const std::vector<dronet::net::PathTrace>& discovered() const noexcept { return discovered_; }
    const std::vector<std::uint64_t>& acked() const noexcept { return acked_; }
    const std::vector<std::uint64_t>& received() const noexcept { return received_; }
    dronet::net::ServerType server_type() const noexcept { return server_type_; }

protected:
    bool handle_routed_packet(Packet packet) override {
        const auto& h = packet.routing_header;
        if (!dronet::net::is_valid(h) || dronet::net::next_hop(h) != id() ||
            h.hop_index + 1 != h.hops.size()) {
            logger().error(id(), "Endpoint is not the destination of " + dronet::net::to_string(h));
            return false;
        }

        if (const auto* resp = std::get_if<dronet::net::FloodResponse>(&packet.payload)) {
            discovered_.push_back(resp->path_trace);
            return true;
        }
        if (const auto* frag = std::get_if<dronet::net::Fragment>(&packet.payload)) {
            received_.push_back(frag->fragment_index);
            auto ack = build_ack(packet);
            return ack && forward_packet(std::move(*ack)).has_value();
        }
        if (const auto* ack = std::get_if<dronet::net::Ack>(&packet.payload)) {
            acked_.push_back(ack->fragment_index);
            return true;
        }
        if (const auto* nack = std::get_if<dronet::net::Nack>(&packet.payload)) {
            logger().status(id(), "Nack for fragment " + std::to_string(nack->fragment_index) + ": " +
                                  std::string(dronet::net::to_string(nack->kind)));
            return true;
        }
        return false;
    }

    void handle_command(dronet::node::Command command) override {
        if (apply_topology_command(command)) return;
        if (const auto* cmd = std::get_if<dronet::node::ServerCommand>(&command)) {
            if (const auto* set = std::get_if<dronet::node::server::SetServerType>(cmd)) {
                server_type_ = set->type;
                logger().status(id(), "Server type set to " + std::string(dronet::net::to_string(server_type_)));
            }
            return;
        }
        if (const auto* cmd = std::get_if<dronet::node::ClientCommand>(&command)) {
            if (auto* send = std::get_if<dronet::node::client::SendPacket>(cmd)) {
                (void)forward_packet(std::move(send->packet)); // failures are logged by the router
                return;
            }
        }
        logger().status(id(), "Command not supported by this endpoint");
    }

private:
    dronet::net::ServerType             server_type_{dronet::net::ServerType::Undefined};
    std::vector<dronet::net::PathTrace> discovered_;
    std::vector<std::uint64_t>          acked_;
    std::vector<std::uint64_t>          received_;
};

std::string render(const dronet::net::PathTrace& trace) {
    std::string s;
    for (const auto& [node, type] : trace) {
        if (!s.empty()) s += " -> ";
        s += id_str(node) + "(" + std::string(dronet::net::to_string(type)) + ")";
    }
    return s;
}

/// Run every node on its own thread for @p duration.
void run_for(const std::vector<dronet::node::NetworkNode*>& nodes, std::chrono::milliseconds duration) {
    std::vector<std::jthread> threads;
    threads.reserve(nodes.size());
    for (auto* n : nodes) {
        threads.emplace_back([n](std::stop_token st) { n->run(st); });
    }
    std::this_thread::sleep_for(duration);
    // jthread destructors request stop and join
}

} // namespace

int main(int argc, char** argv) {
    dronet::config::NodeConfig base = dronet::config::Loader::defaults(0, NodeType::Drone);
    if (argc > 1) {
        auto loaded = dronet::config::Loader::load_from_file(argv[1]);
        if (!loaded) {
            std::cerr << "dronet_sim: cannot load " << argv[1] << ": "
                      << dronet::config::to_string(loaded.error().error);
            if (!loaded.error().key.empty()) std::cerr << " (key " << loaded.error().key << ")";
            if (loaded.error().offset != 0) std::cerr << " (byte " << loaded.error().offset << ")";
            std::cerr << "\n";
            return 1;
        }
        base = *loaded;
    }

    std::cout << "dronet_sim " << dronet::version_string << "\n";
    auto log = dronet::obs::make_logger(base.log);

    auto [event_tx, event_rx] = dronet::chan::make_channel<dronet::net::NodeEvent>();

    const std::map<NodeId, NodeType> kinds{
        {1, NodeType::Client}, {2, NodeType::Drone}, {3, NodeType::Drone},
        {4, NodeType::Drone},  {5, NodeType::Server},
    };
    const std::vector<std::pair<NodeId, NodeId>> links{
        {1, 2}, {2, 3}, {2, 4}, {3, 4}, {3, 5}, {4, 5},
    };

    std::map<NodeId, dronet::net::PacketSender> inbox;
    std::map<NodeId, dronet::node::CommandSender> control;
    std::map<NodeId, std::unique_ptr<dronet::node::NetworkNode>> nodes;
    for (const auto& [id, type] : kinds) {
        auto [tx, rx] = dronet::chan::make_channel<Packet>();
        auto [cmd_tx, cmd_rx] = dronet::chan::make_channel<dronet::node::Command>();
        inbox.emplace(id, std::move(tx));
        control.emplace(id, std::move(cmd_tx));

        auto cfg = dronet::config::Loader::defaults(id, type);
        cfg.log = base.log;
        if (base.seed) cfg.seed = *base.seed + id;

        if (type == NodeType::Drone) {
            nodes.emplace(id, std::make_unique<RelayNode>(cfg, std::move(rx), event_tx, log, std::move(cmd_rx)));
        } else {
            nodes.emplace(id, std::make_unique<EndpointNode>(cfg, std::move(rx), event_tx, log, std::move(cmd_rx)));
        }
    }
    for (const auto& [a, b] : links) {
        nodes.at(a)->add_channel(b, inbox.at(b));
        nodes.at(b)->add_channel(a, inbox.at(a));
    }

    std::vector<dronet::node::NetworkNode*> all;
    for (auto& [id, n] : nodes) all.push_back(n.get());
    auto& client = static_cast<EndpointNode&>(*nodes.at(1));
    auto& server = static_cast<EndpointNode&>(*nodes.at(5));

    // Phase 1: discovery (flood is started before the threads run, so only this thread touches node 1)
    client.start_flood(1);
    run_for(all, 300ms);

    std::cout << "\nDiscovered " << client.discovered().size() << " path(s) from node 1:\n";
    const dronet::net::PathTrace* best = nullptr;
    for (const auto& trace : client.discovered()) {
        std::cout << "  " << render(trace) << "\n";
        if (trace.back().first == 5 && (!best || trace.size() < best->size())) best = &trace;
    }
    if (!best) {
        std::cout << "Server 5 was not discovered\n";
        return 1;
    }

    // Phase 2: one fragment to the server over the shortest discovered path
    Packet fragment;
    for (const auto& hop : *best) fragment.routing_header.hops.push_back(hop.first);
    fragment.routing_header.hop_index = 1;
    fragment.session_id = client.next_session_id();
    dronet::net::Fragment frag{.fragment_index = 0, .total_n_fragments = 1};
    const std::string text = "hello from node 1";
    frag.length = static_cast<std::uint8_t>(text.size());
    std::copy(text.begin(), text.end(), frag.data.begin());
    fragment.payload = frag;

    // Both go through the command channels, as a simulation controller would send them.
    const bool queued =
        control.at(5).send(dronet::node::ServerCommand{
            dronet::node::server::SetServerType{.type = dronet::net::ServerType::Content}}) &&
        control.at(1).send(dronet::node::ClientCommand{dronet::node::client::SendPacket{.packet = fragment}});
    if (!queued) {
        std::cout << "Commands could not be queued\n";
        return 1;
    }
    run_for(all, 300ms);

    std::size_t sent_events = 0;
    while (auto ev = event_rx.try_recv()) {
        if (std::holds_alternative<dronet::net::PacketSent>(*ev)) ++sent_events;
    }

    std::cout << "\nServer " << dronet::net::to_string(server.server_type()) << " received "
              << server.received().size() << " fragment(s), client got "
              << client.acked().size() << " ack(s)\n"
              << "Simulation controller saw " << sent_events << " PacketSent event(s)\n";
    const auto counters = log->snapshot();
    std::cout << "Log lines: " << counters.status_lines << " status, " << counters.error_lines
              << " error, " << counters.suppressed << " suppressed\n";
    return client.acked().empty() ? 1 : 0;
}
