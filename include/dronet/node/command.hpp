#pragma once
/**
 * @file command.hpp
 * @brief Runtime messages a simulation controller sends to a node.
 *
 * Each node kind has its own command set; the controller wraps one of them in
 * a Command. Every kind accepts AddSender and RemoveSender, which
 * NetworkNode::apply_topology_command() applies for all three.
 */

#include <string>
#include <variant>

#include "dronet/chan/channel.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/net/types.hpp"

namespace dronet::node {

    /// Register (or replace) the outbound channel to a neighbor.
    struct AddSender {
        net::NodeId       id{0};
        net::PacketSender sender;
    };

    /// Forget a neighbor.
    struct RemoveSender {
        net::NodeId id{0};
    };

    // ------------------------------- Drone ----------------------------------
    namespace drone {
        /// Switch the node into crashing mode: drain what is queued, then stop.
        struct Crash {};

        /// Drop probability for fragments, in [0, 1].
        struct SetPacketDropRate {
            float rate{0.0f};
        };
    } // namespace drone

    using DroneCommand = std::variant<AddSender, RemoveSender, drone::Crash, drone::SetPacketDropRate>;

    // ------------------------------- Client ---------------------------------
    /// Requests a client issues on the controller's behalf. `server` is always the target server.
    namespace client {
        struct ServerTypeRequest             { net::NodeId server{0}; };
        struct AllServerTypesRequest         {};
        struct FileListRequest               { net::NodeId server{0}; };
        struct FileRequest                   { net::NodeId server{0}; std::string filename; };
        struct RegisterToCommunicationServer { net::NodeId server{0}; };
        struct ClientListRequest             { net::NodeId server{0}; };

        /// Send @p text to client @p recipient through communication server @p server.
        struct Chat {
            net::NodeId server{0};
            net::NodeId recipient{0};
            std::string text;
        };

        /// Inject a ready-made packet; it is forwarded along its own routing header.
        struct SendPacket {
            net::Packet packet;
        };
    } // namespace client

    using ClientCommand = std::variant<client::ServerTypeRequest,
                                       client::AllServerTypesRequest,
                                       client::FileListRequest,
                                       client::FileRequest,
                                       client::RegisterToCommunicationServer,
                                       client::Chat,
                                       client::ClientListRequest,
                                       client::SendPacket,
                                       RemoveSender,
                                       AddSender>;

    // ------------------------------- Server ---------------------------------
    namespace server {
        struct SetServerType {
            net::ServerType type{net::ServerType::Undefined};
        };
    } // namespace server

    using ServerCommand = std::variant<RemoveSender, AddSender, server::SetServerType>;

    /// Controller -> node message, tagged by the node kind it is meant for.
    using Command = std::variant<ClientCommand, ServerCommand, DroneCommand>;

    /// Node kind a command is addressed to.
    inline net::NodeType target_kind(const Command& c) noexcept {
        switch (c.index()) {
            case 0:  return net::NodeType::Client;
            case 1:  return net::NodeType::Server;
            default: return net::NodeType::Drone;
        }
    }

    using CommandSender   = chan::Sender<Command>;
    using CommandReceiver = chan::Receiver<Command>;

} // namespace dronet::node
