#pragma once
/**
 * @file flood_controller.hpp
 * @brief Network discovery: controlled flooding with loop avoidance and path recording.
 * @details Decision taken locally on every FloodRequest arrival:
 *          append self to the trace; if the flood was already seen here, or this node
 *          is a dead end (single neighbor), answer with a FloodResponse; otherwise mark
 *          it seen and fan a copy out to every other neighbor.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <unordered_set>

#include "dronet/compat/expected.hpp"
#include "dronet/net/packet.hpp"
#include "dronet/obs/logger.hpp"
#include "dronet/routing/neighbor_table.hpp"
#include "dronet/routing/packet_router.hpp"

namespace dronet::routing {

/** @struct SeenFloodKey
 *  @brief Identity of one flood: floods are numbered per initiator, so the id alone is ambiguous.
 */
struct SeenFloodKey {
    net::NodeId   initiator_id{0};
    std::uint64_t flood_id{0};

    bool operator==(const SeenFloodKey&) const = default;
};

struct SeenFloodKeyHash {
    std::size_t operator()(const SeenFloodKey& k) const noexcept {
        return std::hash<std::uint64_t>{}(k.flood_id * 0x9E3779B97F4A7C15ULL ^ k.initiator_id);
    }
};

/// Floods this node has already propagated. Never pruned.
using SeenFloods = std::unordered_set<SeenFloodKey, SeenFloodKeyHash>;

/// Source of fresh session ids.
using SessionRng = std::mt19937_64;

/** @enum FloodOutcome
 *  @brief What the node did with a request.
 */
enum class FloodOutcome : uint8_t {
    Responded,   ///< FloodResponse sent back toward the predecessor
    Broadcast    ///< Request propagated to the other neighbors
};

/** @enum FloodError
 *  @brief Requests the controller refuses or cannot answer.
 */
enum class FloodError : uint8_t {
    NotAFloodRequest = 1,   ///< Payload is not a FloodRequest
    EmptyPathTrace,         ///< No predecessor recorded
    ResponseUndeliverable   ///< Link to the predecessor refused the response
};

/**
 * @brief Build a FloodResponse that retraces @p trace backwards.
 * @param trace Complete trace, answering node last.
 * @return Packet with hops = trace ids reversed, cursor 1, the given flood and session ids.
 */
net::Packet build_flood_response(std::uint64_t flood_id, net::PathTrace trace, std::uint64_t session_id);

/** @class FloodController
 *  @brief Per-node flood state machine.
 *  @note Holds references into the owning node (table, seen set, RNG, router, logger).
 */
class FloodController {
public:
    FloodController(net::NodeId self, net::NodeType type,
                    const NeighborTable& neighbors, SeenFloods& seen, SessionRng& rng,
                    const PacketRouter& router, obs::Logger& log) noexcept
        : self_(self), type_(type), neighbors_(&neighbors), seen_(&seen),
          rng_(&rng), router_(&router), log_(&log) {}

    /**
     * @brief Handle one FloodRequest packet that arrived at this node.
     * @return Responded/Broadcast, or why nothing was done.
     */
    dronet_detail::expected<FloodOutcome, FloodError> handle_request(const net::Packet& packet);

    /**
     * @brief Start a new flood from this node toward every neighbor.
     * @return Number of neighbors the request was delivered to.
     */
    std::size_t initiate(std::uint64_t flood_id);

    /**
     * @brief Send a copy of @p packet to every neighbor except @p exclude, each with a
     *        direct `[self, neighbor]` header.
     * @return Number of successful deliveries. Per-neighbor failures are logged only.
     */
    std::size_t broadcast(const net::Packet& packet, net::NodeId exclude);

    /// Fresh session id from the node's RNG.
    std::uint64_t next_session_id() { return (*rng_)(); }

    net::NodeType node_type() const noexcept { return type_; }

private:
    std::size_t fan_out(const net::Packet& packet, const net::NodeId* exclude);

    net::NodeId          self_;
    net::NodeType        type_;
    const NeighborTable* neighbors_;
    SeenFloods*          seen_;
    SessionRng*          rng_;
    const PacketRouter*  router_;
    obs::Logger*         log_;
};

} // namespace dronet::routing
