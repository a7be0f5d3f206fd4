/* Functional connectivity (B_ij): distance-based dispersal probabilities. */
#pragma once

#include "riverconn/core/backend.hpp"
#include "riverconn/core/options.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Routing distances for one dispersal configuration. In symmetric mode only
// `total` is filled; in asymmetric mode only `upstream` and `downstream`
// (distance travelled against / with the flow on the path j -> i).
struct DispersalDistances {
  Directionality directionality { Directionality::Symmetric };
  Matrix total {};
  Matrix upstream {};
  Matrix downstream {};
};

// Directionality actually used: the leptokurtic kernel forces Symmetric.
[[nodiscard]] Directionality effective_directionality(const DispersalOptions& opts) noexcept;

// Check kernel parameters for the effective directionality. Throws
// InvalidParameter naming the offending field (param, param_u, param_d,
// param_l). Does not touch the network.
void validate_dispersal(const DispersalOptions& opts);

// Routing distances for `opts` (validated first). Throws InvalidAttribute if
// opts.distance_field is not a usable reach attribute.
[[nodiscard]] DispersalDistances dispersal_distances(const RiverNetwork& net,
                                                     const DispersalOptions& opts,
                                                     const Backend& backend);

// Map distances to probabilities with the configured kernel. Unreachable
// pairs get 0.
[[nodiscard]] Matrix apply_kernel(const DispersalDistances& dist, const DispersalOptions& opts);

// B matrix: validate, route, apply the kernel.
[[nodiscard]] Matrix functional_matrix(const RiverNetwork& net,
                                       const DispersalOptions& opts,
                                       const Backend& backend);

} // namespace riverconn::core
