/* Barrier prioritization: index change under per-barrier passability scenarios. */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "riverconn/core/backend.hpp"
#include "riverconn/core/executor.hpp"
#include "riverconn/core/index.hpp"
#include "riverconn/core/options.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// One row of the barrier metadata table: the barrier to modify and its
// updated passabilities.
struct BarrierScenario {
  std::string barrier_id;
  Passability pass_u { 1.0 };
  Passability pass_d { 1.0 };
};

// Outcome of one scenario. On success `values` mirrors the baseline layout
// (one value, or one per reach) and d_index[k] = 100 (values[k].index -
// baseline[k].index) / baseline[k].index. On failure both are empty and
// `failure` carries the reason.
//
// d_index is positive when the scenario raises connectivity (scenario minus
// baseline, not baseline minus scenario).
struct ScenarioResult {
  std::string barrier_id;
  std::vector<IndexValue> values;
  std::vector<double> d_index;
  std::optional<std::string> failure;

  [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }
};

struct PrioritizationResult {
  IndexResult baseline;
  std::vector<ScenarioResult> scenarios;  // same order as the input table
};

// Run every scenario against the baseline on `executor`. Option and network
// errors are raised before any scenario starts; a scenario that cannot be
// computed (unknown barrier id, passability outside [0, 1], or any other
// std::exception raised while evaluating it) yields a failed row instead of
// aborting the batch.
[[nodiscard]] PrioritizationResult prioritize_barriers(const RiverNetwork& net,
                                                       const std::vector<BarrierScenario>& scenarios,
                                                       const PrioritizationOptions& opts,
                                                       const Backend& backend,
                                                       Executor& executor);

} // namespace riverconn::core
