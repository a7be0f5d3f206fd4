/*
  RoutingGraph — immutable directed graph with deterministic layout.

  Construction validates the routing table and compacts it into CSR
  adjacency. Edges are sorted by (src, dst, cost), so the CSR position of an
  edge doubles as its id and neighbor groups are contiguous.
*/
#include "riverconn/core/routing_graph.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace riverconn::core {

RoutingGraph RoutingGraph::from_table(std::int32_t num_nodes, const RoutingTable& table) {
  if (num_nodes < 0) {
    throw std::invalid_argument("num_nodes must be >= 0");
  }
  const std::size_t m = table.size();
  if (table.to.size() != m || table.distance.size() != m) {
    throw std::invalid_argument("routing table columns must have the same length");
  }
  for (std::size_t i = 0; i < m; ++i) {
    if (table.from[i] < 0 || table.to[i] < 0 || table.from[i] >= num_nodes || table.to[i] >= num_nodes) {
      throw std::out_of_range("routing edge endpoint out of range of num_nodes");
    }
    if (!(table.distance[i] >= 0.0) || std::isinf(table.distance[i])) {
      throw std::invalid_argument("routing edge cost must be finite and >= 0");
    }
  }

  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (table.from[a] != table.from[b]) return table.from[a] < table.from[b];
    if (table.to[a] != table.to[b]) return table.to[a] < table.to[b];
    return table.distance[a] < table.distance[b];
  });

  RoutingGraph g;
  g.num_nodes_ = num_nodes;
  g.src_.resize(m);
  g.dst_.resize(m);
  g.cost_.resize(m);
  for (std::size_t i = 0; i < m; ++i) {
    g.src_[i] = table.from[idx[i]];
    g.dst_[i] = table.to[idx[i]];
    g.cost_[i] = table.distance[idx[i]];
  }

  g.row_offsets_.assign(static_cast<std::size_t>(num_nodes) + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  // Edges are already grouped by source, so CSR order equals edge order.
  g.col_indices_ = g.dst_;
  return g;
}

} // namespace riverconn::core
