/* Shortest path distances (Dijkstra) over a RoutingGraph. */
#pragma once

#include <vector>

#include "riverconn/core/routing_graph.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Distances from `src` to every node; unreachable nodes get kUnreachable.
[[nodiscard]] std::vector<Distance> shortest_distances(const RoutingGraph& g, ReachId src);

// All-pairs distances. Column j holds the distances from source j, so
// D(i, j) is the distance of the movement j -> i.
[[nodiscard]] Matrix all_pairs_distances(const RoutingGraph& g);

} // namespace riverconn::core
