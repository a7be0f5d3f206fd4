/* Routing edge tables extracted from a river network. */
#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Edge list ready for shortest-path routing. Parallel arrays; entry k is the
// directed edge from[k] -> to[k] with non-negative cost distance[k], and
// direction[k] records the organism movement that edge represents.
struct RoutingTable {
  std::vector<ReachId> from;
  std::vector<ReachId> to;
  std::vector<Distance> distance;
  std::vector<MoveDirection> direction;

  [[nodiscard]] std::size_t size() const noexcept { return from.size(); }
};

// Reach attribute `distance_field` checked for use as a routing distance.
// Throws InvalidAttribute if the field is missing or holds NaN, infinite or
// negative values.
[[nodiscard]] std::span<const double> distance_column(const RiverNetwork& net,
                                                      std::string_view distance_field);

// Build the routing table of `net` using reach attribute `distance_field`.
// Each link yields two edges: the downstream one (from -> to, flagged
// Downstream) and the upstream one (to -> from, flagged Upstream). Their cost
// is the midpoint-to-midpoint distance (d[from] + d[to]) / 2.
// Throws InvalidAttribute as distance_column does.
[[nodiscard]] RoutingTable extract_routing_table(const RiverNetwork& net,
                                                 std::string_view distance_field);

// Derive the routing table of one directional leg. Edges flagged `leg` keep
// their cost; each of them is also made reverse-traversable at zero cost, so
// routing between any two reaches accumulates only distance travelled in the
// `leg` direction.
[[nodiscard]] RoutingTable directional_leg(const RoutingTable& table, MoveDirection leg);

} // namespace riverconn::core
