/*
  Barrier prioritization — recompute the index once per barrier scenario.

  B_ij does not depend on passability, so it is routed and evaluated once and
  shared by every scenario. The structural spanning forest is also built
  once; a scenario only rebuilds its link factors and the c_ij products.
  Scenarios read shared state and write only their own pre-sized result row.
*/
#include "riverconn/core/prioritization.hpp"
#include "riverconn/core/dispersal.hpp"
#include "riverconn/core/error.hpp"
#include "riverconn/core/structural.hpp"

#include <limits>
#include <exception>
#include <optional>
#include <utility>

namespace riverconn::core {

namespace {

bool is_probability(double p) { return p >= 0.0 && p <= 1.0; }

// Raised inside the scenario task; becomes the row's failure reason.
void check_scenario(const RiverNetwork& net, const BarrierScenario& s) {
  if (net.links_of_barrier(s.barrier_id).empty()) {
    throw ScenarioFailure("barrier '" + s.barrier_id + "' not found in the network");
  }
  if (!is_probability(s.pass_u) || !is_probability(s.pass_d)) {
    throw ScenarioFailure("updated passability of barrier '" + s.barrier_id + "' must be in [0, 1]");
  }
}

double percent_change(double value, double baseline) {
  if (baseline == 0.0) return std::numeric_limits<double>::quiet_NaN();
  return 100.0 * (value - baseline) / baseline;
}

} // namespace

PrioritizationResult prioritize_barriers(const RiverNetwork& net,
                                         const std::vector<BarrierScenario>& scenarios,
                                         const PrioritizationOptions& opts,
                                         const Backend& backend,
                                         Executor& executor) {
  const IndexOptions& iopts = opts.index;
  validate_index(net, iopts);
  const auto weights = reach_weights(net, iopts.weight_field);

  std::optional<Matrix> b;
  if (iopts.functional) b = functional_matrix(net, iopts.dispersal, backend);
  std::optional<StructuralModel> model;
  if (iopts.structural) model.emplace(net);

  auto evaluate = [&](const PassabilityOverrides& overrides) {
    std::optional<Matrix> c;
    if (model) c = model->matrix(link_factors(net, iopts.fragmentation, overrides));
    return aggregate(combine_contributions(c ? &*c : nullptr, b ? &*b : nullptr),
                     weights, iopts.scale, iopts.mode);
  };

  // AddOne starts from every (valid) update applied at once.
  PassabilityOverrides baseline_overrides;
  if (opts.mode == PrioritizationMode::AddOne) {
    for (auto const& s : scenarios) {
      if (net.links_of_barrier(s.barrier_id).empty()) continue;
      if (!is_probability(s.pass_u) || !is_probability(s.pass_d)) continue;
      baseline_overrides.insert_or_assign(s.barrier_id, std::make_pair(s.pass_u, s.pass_d));
    }
  }

  PrioritizationResult out;
  out.baseline = evaluate(baseline_overrides);
  out.scenarios.resize(scenarios.size());

  executor.run(scenarios.size(), [&](std::size_t k) {
    const BarrierScenario& s = scenarios[k];
    ScenarioResult& row = out.scenarios[k];
    row.barrier_id = s.barrier_id;
    try {
      check_scenario(net, s);
      PassabilityOverrides overrides;
      if (opts.mode == PrioritizationMode::LeaveOneOut) {
        overrides.emplace(s.barrier_id, std::make_pair(s.pass_u, s.pass_d));
      } else {
        overrides = baseline_overrides;
        overrides.erase(s.barrier_id);
      }
      auto result = evaluate(overrides);
      row.d_index.reserve(result.values.size());
      for (std::size_t v = 0; v < result.values.size(); ++v) {
        row.d_index.push_back(percent_change(result.values[v].index, out.baseline.values[v].index));
      }
      row.values = std::move(result.values);
    } catch (const std::exception& e) {
      row.values.clear();
      row.d_index.clear();
      row.failure = e.what();
    }
  });
  return out;
}

} // namespace riverconn::core
