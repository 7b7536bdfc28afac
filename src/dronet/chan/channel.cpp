/**
 * @file channel.cpp
 * @brief Explicit template instantiations for the channel types the core uses.
*/

#include "dronet/chan/channel.hpp"
#include "dronet/net/events.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/node/command.hpp"

namespace dronet::chan {

    /// One compiled instance for the channel kinds every node touches.
    template class Sender<net::Packet>;     // neighbor links
    template class Receiver<net::Packet>;   // inbound queue
    template class Sender<net::NodeEvent>;  // simulation controller side channel
    template class Receiver<net::NodeEvent>;
    template class Sender<node::Command>;      // controller -> node reconfiguration
    template class Receiver<node::Command>;
} // namespace dronet::chan
