/* Structural connectivity (c_ij): barrier passability along reach-to-reach paths. */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "riverconn/core/options.hpp"
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Scenario overrides: barrier id -> (pass_u, pass_d). Applied on top of the
// network's own passabilities without modifying the network.
using PassabilityOverrides = std::map<std::string, std::pair<Passability, Passability>, std::less<>>;

// Multiplicative factor contributed by each link, per movement direction.
// up[l]: crossing link l against the flow (to -> from).
// down[l]: crossing link l with the flow (from -> to).
struct LinkFactors {
  std::vector<Passability> up;
  std::vector<Passability> down;
};

// Check pass_confluence and, for every barrier link, the presence and range
// of pass_u / pass_d. Throws InvalidParameter or InvalidAttribute.
void validate_structural(const RiverNetwork& net, const StructuralOptions& opts);

// Per-link factors under `opts`, with `overrides` replacing the passability of
// the named barriers. Symmetric mode gives every barrier the factor
// pass_u * pass_d in both directions. Throws InvalidParameter for an override
// outside [0, 1] or naming no barrier of the network.
[[nodiscard]] LinkFactors link_factors(const RiverNetwork& net,
                                       const StructuralOptions& opts,
                                       const PassabilityOverrides& overrides = {});

// Rooted spanning forest of a river network, built once and reused for every
// passability scenario. The network is assumed acyclic: a link closing a
// cycle is not part of the forest and is ignored.
class StructuralModel {
public:
  explicit StructuralModel(const RiverNetwork& net);

  [[nodiscard]] std::int32_t num_reaches() const noexcept { return static_cast<std::int32_t>(parent_.size()); }

  // C(i, j): product of link factors along the unique path j -> i; 0 when
  // i and j are in different components, 1 on the diagonal.
  [[nodiscard]] Matrix matrix(const LinkFactors& factors) const;

private:
  std::vector<ReachId> order_ {};        // BFS order, roots first in each component
  std::vector<ReachId> parent_ {};       // -1 for roots
  std::vector<LinkId> parent_link_ {};   // link joining v to parent_[v]
  std::vector<char> towards_parent_is_downstream_ {};
  std::vector<std::int32_t> component_ {};
};

// C matrix: validate, build factors and model, combine.
[[nodiscard]] Matrix structural_matrix(const RiverNetwork& net,
                                       const StructuralOptions& opts,
                                       const PassabilityOverrides& overrides = {});

} // namespace riverconn::core
