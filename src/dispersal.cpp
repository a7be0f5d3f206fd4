/*
  Functional connectivity — dispersal kernels over routed distances.

  Kernels:
    - Exponential:  B = base^d, base in (0, 1]. Asymmetric mode multiplies
      base_u^d_u by base_d^d_d.
    - Threshold:    B = 1 if d <= cutoff else 0, cutoff >= 0. Asymmetric mode
      requires both legs under their own cutoff.
    - Leptokurtic:  B = 2 (p Q(d; sigma_stat) + (1 - p) Q(d; sigma_mob)) with
      Q the upper tail of a zero-mean normal. Symmetric only.
*/
#include "riverconn/core/dispersal.hpp"
#include "riverconn/core/error.hpp"
#include "riverconn/core/routing_table.hpp"

#include <cmath>
#include <optional>
#include <string>

namespace riverconn::core {

namespace {

double require(const std::optional<double>& value, const char* name, const char* when) {
  if (!value.has_value() || std::isnan(*value)) {
    throw InvalidParameter(std::string("'") + name + "' must be defined when " + when);
  }
  return *value;
}

void check_kernel_range(DispersalKernel kernel, double value, const char* name) {
  switch (kernel) {
    case DispersalKernel::Exponential:
      if (!(value > 0.0 && value <= 1.0)) {
        throw InvalidParameter(std::string("'") + name + "' must be in (0, 1] for the exponential kernel");
      }
      return;
    case DispersalKernel::Threshold:
      if (!(value >= 0.0)) {
        throw InvalidParameter(std::string("'") + name + "' must be >= 0 for the threshold kernel");
      }
      return;
    case DispersalKernel::Leptokurtic:
      return;
  }
}

// Upper tail of N(0, sigma) at d, doubled: 2 P(X > d) = erfc(d / (sigma sqrt 2)).
double two_sided_tail(double d, double sigma) {
  return std::erfc(d / (sigma * std::sqrt(2.0)));
}

} // namespace

Directionality effective_directionality(const DispersalOptions& opts) noexcept {
  if (opts.kernel == DispersalKernel::Leptokurtic) return Directionality::Symmetric;
  return opts.directionality;
}

void validate_dispersal(const DispersalOptions& opts) {
  if (opts.kernel == DispersalKernel::Leptokurtic) {
    if (opts.param_l.size() != 3) {
      throw InvalidParameter("'param_l' must have exactly 3 entries {sigma_stat, sigma_mob, p} for the leptokurtic kernel");
    }
    const double sigma_stat = opts.param_l[0];
    const double sigma_mob = opts.param_l[1];
    const double p = opts.param_l[2];
    if (!(sigma_stat > 0.0) || std::isinf(sigma_stat)) {
      throw InvalidParameter("'param_l[0]' (sigma_stat) must be finite and > 0");
    }
    if (!(sigma_mob > 0.0) || std::isinf(sigma_mob)) {
      throw InvalidParameter("'param_l[1]' (sigma_mob) must be finite and > 0");
    }
    if (!(p >= 0.0 && p <= 1.0)) {
      throw InvalidParameter("'param_l[2]' (p) must be in [0, 1]");
    }
    return;
  }
  if (opts.directionality == Directionality::Asymmetric) {
    const double pu = require(opts.param_u, "param_u", "directionality is asymmetric");
    const double pd = require(opts.param_d, "param_d", "directionality is asymmetric");
    check_kernel_range(opts.kernel, pu, "param_u");
    check_kernel_range(opts.kernel, pd, "param_d");
  } else {
    const double p = require(opts.param, "param", "directionality is symmetric");
    check_kernel_range(opts.kernel, p, "param");
  }
}

DispersalDistances dispersal_distances(const RiverNetwork& net,
                                       const DispersalOptions& opts,
                                       const Backend& backend) {
  validate_dispersal(opts);
  auto table = extract_routing_table(net, opts.distance_field);
  DispersalDistances out;
  out.directionality = effective_directionality(opts);
  if (out.directionality == Directionality::Symmetric) {
    out.total = backend.distances(net.num_reaches(), table);
  } else {
    out.upstream = backend.distances(net.num_reaches(), directional_leg(table, MoveDirection::Upstream));
    out.downstream = backend.distances(net.num_reaches(), directional_leg(table, MoveDirection::Downstream));
  }
  return out;
}

Matrix apply_kernel(const DispersalDistances& dist, const DispersalOptions& opts) {
  if (dist.directionality == Directionality::Symmetric) {
    const Matrix& d = dist.total;
    switch (opts.kernel) {
      case DispersalKernel::Exponential: {
        const double base = *opts.param;
        return d.unaryExpr([base](double x) { return std::isinf(x) ? 0.0 : std::pow(base, x); });
      }
      case DispersalKernel::Threshold: {
        const double cutoff = *opts.param;
        return d.unaryExpr([cutoff](double x) { return (!std::isinf(x) && x <= cutoff) ? 1.0 : 0.0; });
      }
      case DispersalKernel::Leptokurtic: {
        const double sigma_stat = opts.param_l[0];
        const double sigma_mob = opts.param_l[1];
        const double p = opts.param_l[2];
        return d.unaryExpr([=](double x) {
          if (std::isinf(x)) return 0.0;
          return p * two_sided_tail(x, sigma_stat) + (1.0 - p) * two_sided_tail(x, sigma_mob);
        });
      }
    }
  }

  const Matrix& du = dist.upstream;
  const Matrix& dd = dist.downstream;
  const double pu = *opts.param_u;
  const double pd = *opts.param_d;
  Matrix b(du.rows(), du.cols());
  for (Eigen::Index j = 0; j < b.cols(); ++j) {
    for (Eigen::Index i = 0; i < b.rows(); ++i) {
      const double xu = du(i, j);
      const double xd = dd(i, j);
      if (std::isinf(xu) || std::isinf(xd)) { b(i, j) = 0.0; continue; }
      if (opts.kernel == DispersalKernel::Threshold) {
        b(i, j) = (xu <= pu && xd <= pd) ? 1.0 : 0.0;
      } else {
        b(i, j) = std::pow(pu, xu) * std::pow(pd, xd);
      }
    }
  }
  return b;
}

Matrix functional_matrix(const RiverNetwork& net,
                         const DispersalOptions& opts,
                         const Backend& backend) {
  return apply_kernel(dispersal_distances(net, opts, backend), opts);
}

} // namespace riverconn::core
