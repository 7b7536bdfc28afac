#include "dronet/routing/neighbor_table.hpp"

#include <algorithm>
#include <utility>

namespace dronet::routing {

//------------------------------- Mutations ------------------------------------

bool NeighborTable::add(net::NodeId id, net::PacketSender sender) {
    auto [it, inserted] = map_.try_emplace(id, std::move(sender));
    if (!inserted) {
        it->second = std::move(sender); // overwrite: neighbor re-registered its channel
        stats_.replaces++;
        return true;
    }
    stats_.adds++;
    return false;
}

NeighborErr NeighborTable::remove(net::NodeId id) noexcept {
    if (map_.erase(id) == 0) {
        stats_.misses++;
        return NeighborErr::NotFound;
    }
    stats_.removes++;
    return NeighborErr::Ok;
}

void NeighborTable::clear() noexcept {
    map_.clear();
}

//------------------------------- Reads ----------------------------------------

const net::PacketSender* NeighborTable::find(net::NodeId id) const noexcept {
    auto it = map_.find(id);
    return it == map_.end() ? nullptr : &it->second;
}

bool NeighborTable::contains(net::NodeId id) const noexcept {
    return map_.find(id) != map_.end();
}

std::vector<net::NodeId> NeighborTable::ids() const {
    std::vector<net::NodeId> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace dronet::routing
