/* Core type aliases and closed enums.
 *
 * For Python developers:
 * - ReachId/LinkId: int32 (matches np.int32)
 * - Distance/Passability: double (matches np.float64)
 * - Matrix: Eigen::MatrixXd, returned to Python as a float64 ndarray
 * - enum class: closed set of values, no string dispatch at runtime
 */
#pragma once

#include <cstdint>
#include <limits>

#include <Eigen/Core>

namespace riverconn::core {

// Reach (vertex) and link (edge) identifiers are signed 32-bit integers.
using ReachId = std::int32_t;
using LinkId = std::int32_t;
using Distance = double;     // Routing distance (same unit as the distance field)
using Passability = double;  // Probability in [0, 1]

// Dense n x n matrix. M(i, j) describes a movement from reach j to reach i:
// rows are destinations, columns are origins.
using Matrix = Eigen::MatrixXd;

inline constexpr Distance kUnreachable = std::numeric_limits<Distance>::infinity();

// Category of a link between two reaches.
enum class LinkType {
  Confluence = 1,  // Non-restrictive junction, uses the constant pass_confluence
  Barrier = 2      // Dam, culvert, weir: directional pass_u / pass_d
};

// How movement direction is treated.
enum class Directionality {
  Symmetric = 1,   // Undirected: one path per reach pair, orientation ignored
  Asymmetric = 2   // Directed: upstream and downstream legs handled separately
};

// Direction of organism movement along a link relative to the flow.
enum class MoveDirection {
  Upstream = 1,    // Against the flow (link traversed to -> from)
  Downstream = 2   // With the flow (link traversed from -> to)
};

// Distance-to-probability function for B_ij.
enum class DispersalKernel {
  Exponential = 1,  // B = base^d
  Threshold = 2,    // B = 1 if d <= cutoff else 0
  Leptokurtic = 3   // Two-component Gaussian tail mixture (symmetric only)
};

// How pass_confluence enters the structural product.
enum class ConfluenceRule {
  OncePerTraversal = 1,  // Each confluence crossed contributes pass_confluence
  AsBarrier = 2          // Treated as a barrier with pass_u = pass_d = pass_confluence
};

// Aggregation scale of the index.
enum class IndexScale {
  Full = 1,   // Catchment scale (CCI)
  Reach = 2,  // One value per reach (RCI)
  Sum = 3     // Catchment scale tagged per barrier scenario
};

// Summation direction for reach-scale indices.
enum class IndexMode {
  To = 1,    // Inbound: sum over origins (row i)
  From = 2   // Outbound: sum over destinations (column i)
};

// Barrier prioritization strategy.
enum class PrioritizationMode {
  LeaveOneOut = 1,  // Baseline as given; each scenario applies one barrier update
  AddOne = 2        // Baseline has all updates; each scenario reverts one barrier
};

} // namespace riverconn::core
