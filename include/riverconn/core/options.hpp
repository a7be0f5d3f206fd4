/* Option structs for the connectivity entry points.
 *
 * Every entry point takes its options by const reference; there are no
 * module-level defaults, so concurrent calls never share mutable state.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Names of the network attributes the engine reads.
struct FieldNames {
  std::string distance { "length" };  // Reach attribute used for routing distances
  std::string weight { "length" };    // Reach attribute used as index weight
  std::string pass_u { "pass_u" };    // Link attribute: upstream passability
  std::string pass_d { "pass_d" };    // Link attribute: downstream passability
};

// Functional connectivity (B_ij) configuration.
//
// Symmetric mode reads `param`; asymmetric mode reads `param_u` and
// `param_d`. The leptokurtic kernel reads `param_l` = {sigma_stat,
// sigma_mob, p} and always runs in symmetric mode.
struct DispersalOptions {
  DispersalKernel kernel { DispersalKernel::Exponential };
  Directionality directionality { Directionality::Symmetric };
  std::optional<double> param {};
  std::optional<double> param_u {};
  std::optional<double> param_d {};
  std::vector<double> param_l {};
  std::string distance_field { "length" };
};

// Structural connectivity (c_ij) configuration.
struct StructuralOptions {
  Directionality directionality { Directionality::Symmetric };
  Passability pass_confluence { 1.0 };
  ConfluenceRule confluence_rule { ConfluenceRule::OncePerTraversal };
  std::string pass_u_field { "pass_u" };
  std::string pass_d_field { "pass_d" };
};

// Index computation configuration.
struct IndexOptions {
  bool structural { true };   // Include c_ij
  bool functional { true };   // Include B_ij
  IndexScale scale { IndexScale::Full };
  IndexMode mode { IndexMode::To };
  std::string weight_field { "length" };
  StructuralOptions fragmentation {};
  DispersalOptions dispersal {};
};

// Barrier prioritization configuration.
struct PrioritizationOptions {
  IndexOptions index {};
  PrioritizationMode mode { PrioritizationMode::LeaveOneOut };
  // Number of concurrent workers; values <= 1 run sequentially.
  int workers { 1 };
};

// Fill the field-name members of the option structs from a single FieldNames.
[[nodiscard]] IndexOptions with_fields(IndexOptions opts, const FieldNames& fields);

} // namespace riverconn::core
