#include "riverconn/core/engine.hpp"
#include "riverconn/core/dispersal.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace riverconn::core {

Engine::Engine(BackendPtr backend) : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("Engine: backend must not be null");
  }
}

Matrix Engine::functional_matrix(const RiverNetwork& net, const DispersalOptions& opts) const {
  return riverconn::core::functional_matrix(net, opts, *backend_);
}

Matrix Engine::structural_matrix(const RiverNetwork& net, const StructuralOptions& opts,
                                 const PassabilityOverrides& overrides) const {
  return riverconn::core::structural_matrix(net, opts, overrides);
}

Matrix Engine::dispersal_probability(const RiverNetwork& net, const IndexOptions& opts) const {
  validate_index(net, opts);
  std::optional<Matrix> c;
  std::optional<Matrix> b;
  if (opts.structural) c = riverconn::core::structural_matrix(net, opts.fragmentation);
  if (opts.functional) b = riverconn::core::functional_matrix(net, opts.dispersal, *backend_);
  return combine_contributions(c ? &*c : nullptr, b ? &*b : nullptr);
}

IndexResult Engine::index(const RiverNetwork& net, const IndexOptions& opts) const {
  return compute_index(net, opts, *backend_);
}

PrioritizationResult Engine::prioritize(const RiverNetwork& net,
                                        const std::vector<BarrierScenario>& scenarios,
                                        const PrioritizationOptions& opts) const {
  auto executor = opts.workers > 1 ? make_tbb_executor(opts.workers) : make_sequential_executor();
  return prioritize(net, scenarios, opts, *executor);
}

PrioritizationResult Engine::prioritize(const RiverNetwork& net,
                                        const std::vector<BarrierScenario>& scenarios,
                                        const PrioritizationOptions& opts,
                                        Executor& executor) const {
  return prioritize_barriers(net, scenarios, opts, *backend_, executor);
}

} // namespace riverconn::core
