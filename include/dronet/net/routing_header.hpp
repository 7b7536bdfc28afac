#pragma once


/**
 * @file routing_header.hpp
 * @brief Source-routing header: hop list plus cursor, and its reversal.
 * @note The cursor marks the hop the packet is delivered to next. Collaborators
 *       advance it before forwarding a multi-hop packet onward; the router never does.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dronet/compat/expected.hpp"
#include "dronet/net/types.hpp"

namespace dronet::net {

/// Path of a packet plus the position of the current hop.
struct RoutingHeader final {
    std::size_t         hop_index{0};
    std::vector<NodeId> hops{};

    bool operator==(const RoutingHeader&) const = default;
};

/// Reasons a header cannot be read.
enum class HeaderError : std::uint8_t {
    EmptyPath = 1,      ///< No hops at all
    CursorOutOfRange    ///< hop_index >= hops.size()
};

/// True when `0 <= hop_index < hops.size()`.
bool is_valid(const RoutingHeader& h) noexcept;

/// Node the packet is delivered to next (hops[hop_index]). Precondition: is_valid(h).
NodeId next_hop(const RoutingHeader& h) noexcept;

/// Checked variant of next_hop for packets arriving from outside the node.
dronet_detail::expected<NodeId, HeaderError> try_next_hop(const RoutingHeader& h) noexcept;

/// Final hop of the path, if any.
dronet_detail::expected<NodeId, HeaderError> destination(const RoutingHeader& h) noexcept;

/// Move the cursor one hop forward. Returns false if already on the last hop.
bool advance(RoutingHeader& h) noexcept;

/// Turn a header into the return path toward its origin.
///
/// Hops beyond the cursor are discarded (the untraveled suffix is never part of
/// a reply), the remaining prefix is reversed, and the cursor lands on the first
/// hop away from self (1). A single-hop path keeps cursor 0. A cursor past the
/// end is treated as "whole path traveled".
RoutingHeader reverse(const RoutingHeader& h);

/// Direct one-hop header `[from, to]` with cursor on `to`.
RoutingHeader direct(NodeId from, NodeId to);

/// "[1, 2, 3]@1" style rendering for logs.
std::string to_string(const RoutingHeader& h);

} // namespace dronet::net
