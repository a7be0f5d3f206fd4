/*
  Engine — façade over the connectivity pipeline.

  Holds the routing backend and exposes the three caller-facing entry points:
  matrix computation, index computation, and barrier prioritization. The
  engine itself is stateless beyond the backend pointer, so one instance can
  serve concurrent callers.
*/
#pragma once

#include <vector>

#include "riverconn/core/backend.hpp"
#include "riverconn/core/executor.hpp"
#include "riverconn/core/index.hpp"
#include "riverconn/core/options.hpp"
#include "riverconn/core/prioritization.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/structural.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

class Engine {
public:
  explicit Engine(BackendPtr backend = make_cpu_backend());

  [[nodiscard]] const Backend& backend() const noexcept { return *backend_; }

  // B_ij matrix.
  [[nodiscard]] Matrix functional_matrix(const RiverNetwork& net, const DispersalOptions& opts) const;

  // c_ij matrix, optionally under barrier overrides.
  [[nodiscard]] Matrix structural_matrix(const RiverNetwork& net, const StructuralOptions& opts,
                                         const PassabilityOverrides& overrides = {}) const;

  // I_ij = c_ij * B_ij with either term dropped when disabled in `opts`.
  [[nodiscard]] Matrix dispersal_probability(const RiverNetwork& net, const IndexOptions& opts) const;

  [[nodiscard]] IndexResult index(const RiverNetwork& net, const IndexOptions& opts) const;

  // Runs on a sequential executor when opts.workers <= 1, otherwise on a
  // TBB worker pool of that size.
  [[nodiscard]] PrioritizationResult prioritize(const RiverNetwork& net,
                                                const std::vector<BarrierScenario>& scenarios,
                                                const PrioritizationOptions& opts) const;

  [[nodiscard]] PrioritizationResult prioritize(const RiverNetwork& net,
                                                const std::vector<BarrierScenario>& scenarios,
                                                const PrioritizationOptions& opts,
                                                Executor& executor) const;

private:
  BackendPtr backend_;
};

} // namespace riverconn::core
