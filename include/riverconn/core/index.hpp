/* Index aggregation: catchment- and reach-scale connectivity indices. */
#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "riverconn/core/backend.hpp"
#include "riverconn/core/options.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// A normalized index with the terms it was derived from. Numerator and
// denominator are kept so results can be re-aggregated or differenced
// without recomputing the weight total.
struct IndexValue {
  double index { 0.0 };
  double numerator { 0.0 };
  double denominator { 0.0 };
};

// Index values at one scale. Full/Sum: a single value. Reach: one value per
// reach, in reach order.
struct IndexResult {
  IndexScale scale { IndexScale::Full };
  IndexMode mode { IndexMode::To };
  std::vector<IndexValue> values;
};

// Weight column: must exist, be finite and >= 0, and sum to a positive total.
// Throws InvalidAttribute otherwise.
[[nodiscard]] std::vector<double> reach_weights(const RiverNetwork& net, std::string_view field);

// Every check an index computation needs, run before any matrix is built:
// contribution flags, dispersal parameters, structural parameters, weights,
// and the distance field.
void validate_index(const RiverNetwork& net, const IndexOptions& opts);

// I = C (x) B elementwise. Either pointer may be null to drop that term;
// throws InvalidConfiguration if both are.
[[nodiscard]] Matrix combine_contributions(const Matrix* structural, const Matrix* functional);

// Reduce I with weights w to the requested scale.
//   Full/Sum: sum_ij I(i,j) w_i w_j / W^2
//   Reach To: sum_j I(i,j) w_j / W       Reach From: sum_j I(j,i) w_j / W
[[nodiscard]] IndexResult aggregate(const Matrix& dispersal_probability,
                                    std::span<const double> weights,
                                    IndexScale scale, IndexMode mode);

// Full pipeline: validate, build the enabled matrices, combine, aggregate.
[[nodiscard]] IndexResult compute_index(const RiverNetwork& net,
                                        const IndexOptions& opts,
                                        const Backend& backend);

} // namespace riverconn::core
