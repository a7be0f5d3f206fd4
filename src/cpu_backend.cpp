/*
  CPU Backend — thin adapter that delegates to in-process Dijkstra.
*/
#include "riverconn/core/backend.hpp"
#include "riverconn/core/routing_graph.hpp"
#include "riverconn/core/shortest_paths.hpp"

namespace riverconn::core {

namespace {
class CpuBackend final : public Backend {
public:
  Matrix distances(std::int32_t num_reaches, const RoutingTable& table) const override {
    auto g = RoutingGraph::from_table(num_reaches, table);
    return all_pairs_distances(g);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace riverconn::core
