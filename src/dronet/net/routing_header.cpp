
#include "dronet/net/routing_header.hpp"
#include "dronet/config/constants.hpp"

#include <algorithm>

namespace dronet::net {

bool is_valid(const RoutingHeader& h) noexcept {
    return h.hop_index < h.hops.size();
}

NodeId next_hop(const RoutingHeader& h) noexcept {
    return h.hops[h.hop_index];
}

dronet_detail::expected<NodeId, HeaderError> try_next_hop(const RoutingHeader& h) noexcept {
    if (h.hops.empty()) return dronet_detail::unexpected(HeaderError::EmptyPath);
    if (!is_valid(h))   return dronet_detail::unexpected(HeaderError::CursorOutOfRange);
    return h.hops[h.hop_index];
}

dronet_detail::expected<NodeId, HeaderError> destination(const RoutingHeader& h) noexcept {
    if (h.hops.empty()) return dronet_detail::unexpected(HeaderError::EmptyPath);
    return h.hops.back();
}

bool advance(RoutingHeader& h) noexcept {
    if (h.hop_index + 1 >= h.hops.size()) return false;
    ++h.hop_index;
    return true;
}

RoutingHeader reverse(const RoutingHeader& h) {
    RoutingHeader out;
    if (h.hops.empty()) return out;

    // Keep [0..cursor]; anything past the cursor was never traveled.
    const auto keep = std::min(h.hop_index + 1, h.hops.size());
    out.hops.assign(h.hops.begin(), h.hops.begin() + static_cast<std::ptrdiff_t>(keep));
    std::reverse(out.hops.begin(), out.hops.end());

    out.hop_index = out.hops.size() > 1 ? config::constants::REVERSED_HOP_INDEX : 0;
    return out;
}

RoutingHeader direct(NodeId from, NodeId to) {
    return RoutingHeader{.hop_index = config::constants::DIRECT_HOP_INDEX, .hops = {from, to}};
}

std::string to_string(const RoutingHeader& h) {
    std::string s = "[";
    for (std::size_t i = 0; i < h.hops.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(static_cast<unsigned>(h.hops[i]));
    }
    s += "]@";
    s += std::to_string(h.hop_index);
    return s;
}

} // namespace dronet::net
