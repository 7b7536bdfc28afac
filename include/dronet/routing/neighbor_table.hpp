#pragma once
// dronet — NeighborTable
// Ownership model: exclusively owned by one node and touched only from that node's
// control thread, so no internal synchronization. Senders stored here are copies
// of the neighbors' inbound channel handles.
// Runtime policy: no exceptions on lookups; removals of unknown ids are reported
// as a result code, never as a failure of the node.

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "dronet/net/events.hpp"
#include "dronet/net/types.hpp"

namespace dronet::routing {

// -----------------------------------------------------------------------------
// Result codes for table mutations.
// -----------------------------------------------------------------------------
enum class NeighborErr {
    Ok,         ///< Operation succeeded.
    NotFound    ///< Remove failed because the neighbor is not registered.
};

///
/// Maps neighbor NodeId -> outbound packet channel.
/// - add() inserts or overwrites.
/// - remove() erases if present; absent ids leave the table untouched.
/// - Topology edits may interleave with in-flight routing of the owning node.
///
class NeighborTable final {
public:
    using Map = std::unordered_map<net::NodeId, net::PacketSender>;

    // --------------------------- Mutations -----------------------------------
    /// Insert or overwrite the channel for @p id. Returns true if an entry was replaced.
    bool add(net::NodeId id, net::PacketSender sender);

    /// Erase the channel for @p id.
    NeighborErr remove(net::NodeId id) noexcept;

    /// Drop every neighbor.
    void clear() noexcept;

    // --------------------------- Read utilities ------------------------------
    /// Channel for @p id, or nullptr if not a neighbor.
    [[nodiscard]] const net::PacketSender* find(net::NodeId id) const noexcept;
    [[nodiscard]] bool contains(net::NodeId id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }
    [[nodiscard]] bool empty() const noexcept { return map_.empty(); }

    /// Neighbor ids in ascending order.
    [[nodiscard]] std::vector<net::NodeId> ids() const;

    /// Direct read access for iteration (valid until the next mutation).
    [[nodiscard]] const Map& entries() const noexcept { return map_; }

    // --------------------------- Observability -------------------------------
    /// Cumulative counters since construction.
    struct Stats {
        uint64_t adds{0}, replaces{0}, removes{0}, misses{0};
    };
    [[nodiscard]] Stats stats() const noexcept { return stats_; }

private:
    Map   map_;
    Stats stats_{};
};

} // namespace dronet::routing
