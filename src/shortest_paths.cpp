/*
  shortest_paths — Dijkstra over a RoutingGraph.

  Parallel edges between the same (u, v) pair are contiguous in CSR order and
  sorted by cost, so the first edge of each neighbor group is the cheapest.
*/
#include "riverconn/core/shortest_paths.hpp"

#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace riverconn::core {

std::vector<Distance> shortest_distances(const RoutingGraph& g, ReachId src) {
  const auto N = g.num_nodes();
  if (src < 0 || src >= N) {
    throw std::out_of_range("shortest_distances: src out of range");
  }
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto cost = g.cost_view();

  std::vector<Distance> dist(static_cast<std::size_t>(N), kUnreachable);
  dist[static_cast<std::size_t>(src)] = 0.0;

  using QItem = std::pair<Distance, ReachId>;
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> pq;
  pq.emplace(0.0, src);
  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    if (d_u > dist[static_cast<std::size_t>(u)]) continue;
    auto start = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
    auto end   = static_cast<std::size_t>(row[static_cast<std::size_t>(u) + 1]);
    std::size_t i = start;
    while (i < end) {
      ReachId v = col[i];
      const Distance ecost = cost[i];
      // skip the rest of the neighbor group; they cost at least as much
      std::size_t j = i;
      while (j < end && col[j] == v) ++j;
      const Distance nd = d_u + ecost;
      auto v_idx = static_cast<std::size_t>(v);
      if (nd < dist[v_idx]) { dist[v_idx] = nd; pq.emplace(nd, v); }
      i = j;
    }
  }
  return dist;
}

Matrix all_pairs_distances(const RoutingGraph& g) {
  const auto N = g.num_nodes();
  Matrix out(N, N);
  for (ReachId s = 0; s < N; ++s) {
    auto dist = shortest_distances(g, s);
    for (ReachId t = 0; t < N; ++t) out(t, s) = dist[static_cast<std::size_t>(t)];
  }
  return out;
}

} // namespace riverconn::core
