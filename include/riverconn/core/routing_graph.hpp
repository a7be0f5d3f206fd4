/* Immutable directed routing graph with CSR adjacency. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "riverconn/core/routing_table.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Notes on edge identifiers:
// - Edge k of the graph is the k-th edge after a deterministic reorder by
//   (src, dst, cost); it does not match the row order of the RoutingTable.
class RoutingGraph {
public:
  [[nodiscard]] static RoutingGraph from_table(std::int32_t num_nodes, const RoutingTable& table);
  ~RoutingGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(cost_.size()); }

  [[nodiscard]] std::span<const Distance> cost_view() const noexcept { return cost_; }
  [[nodiscard]] std::span<const ReachId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const ReachId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const ReachId> col_indices_view() const noexcept { return col_indices_; }

private:
  std::int32_t num_nodes_ {0};
  std::vector<Distance> cost_ {};
  std::vector<ReachId> src_ {};
  std::vector<ReachId> dst_ {};
  // CSR adjacency: outgoing edges of u are [row_offsets[u], row_offsets[u+1]);
  // col_indices holds the neighbor, and the CSR position is the edge id.
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<ReachId> col_indices_ {};
};

} // namespace riverconn::core
