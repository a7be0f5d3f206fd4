/*
  Index aggregation — combine c_ij and B_ij and reduce with reach weights.
*/
#include "riverconn/core/index.hpp"
#include "riverconn/core/dispersal.hpp"
#include "riverconn/core/error.hpp"
#include "riverconn/core/routing_table.hpp"
#include "riverconn/core/structural.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace riverconn::core {

std::vector<double> reach_weights(const RiverNetwork& net, std::string_view field) {
  if (!net.has_reach_attribute(field)) {
    throw InvalidAttribute("weight field '" + std::string(field) + "' must be a valid reach attribute of the network");
  }
  auto col = net.reach_attribute(field);
  double total = 0.0;
  for (std::size_t v = 0; v < col.size(); ++v) {
    if (!std::isfinite(col[v]) || col[v] < 0.0) {
      throw InvalidAttribute("weight field '" + std::string(field) + "' must be finite and >= 0 (reach " + std::to_string(v) + ")");
    }
    total += col[v];
  }
  if (!(total > 0.0)) {
    throw InvalidAttribute("weight field '" + std::string(field) + "' must sum to a positive total");
  }
  return {col.begin(), col.end()};
}

void validate_index(const RiverNetwork& net, const IndexOptions& opts) {
  if (!opts.structural && !opts.functional) {
    throw InvalidConfiguration("at least one of the structural (c_ij) and functional (B_ij) contributions must be enabled");
  }
  if (opts.functional) {
    validate_dispersal(opts.dispersal);
    (void)distance_column(net, opts.dispersal.distance_field);
  }
  if (opts.structural) {
    validate_structural(net, opts.fragmentation);
  }
  (void)reach_weights(net, opts.weight_field);
}

Matrix combine_contributions(const Matrix* structural, const Matrix* functional) {
  if (structural && functional) return structural->cwiseProduct(*functional);
  if (structural) return *structural;
  if (functional) return *functional;
  throw InvalidConfiguration("at least one of the structural (c_ij) and functional (B_ij) contributions must be enabled");
}

IndexResult aggregate(const Matrix& dispersal_probability,
                      std::span<const double> weights,
                      IndexScale scale, IndexMode mode) {
  const auto n = static_cast<Eigen::Index>(weights.size());
  if (dispersal_probability.rows() != n || dispersal_probability.cols() != n) {
    throw std::invalid_argument("aggregate: weights length must match the matrix size");
  }
  Eigen::Map<const Eigen::VectorXd> w(weights.data(), n);
  const double total = w.sum();

  IndexResult out;
  out.scale = scale;
  out.mode = mode;
  if (scale == IndexScale::Reach) {
    Eigen::VectorXd num = (mode == IndexMode::To)
        ? Eigen::VectorXd(dispersal_probability * w)
        : Eigen::VectorXd(dispersal_probability.transpose() * w);
    out.values.reserve(static_cast<std::size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
      out.values.push_back(IndexValue{num(i) / total, num(i), total});
    }
    return out;
  }
  const double num = w.dot(dispersal_probability * w);
  const double den = total * total;
  out.values.push_back(IndexValue{num / den, num, den});
  return out;
}

IndexResult compute_index(const RiverNetwork& net,
                          const IndexOptions& opts,
                          const Backend& backend) {
  validate_index(net, opts);
  const auto weights = reach_weights(net, opts.weight_field);
  std::optional<Matrix> c;
  std::optional<Matrix> b;
  if (opts.structural) c = structural_matrix(net, opts.fragmentation);
  if (opts.functional) b = functional_matrix(net, opts.dispersal, backend);
  return aggregate(combine_contributions(c ? &*c : nullptr, b ? &*b : nullptr),
                   weights, opts.scale, opts.mode);
}

} // namespace riverconn::core
