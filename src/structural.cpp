/*
  Structural connectivity — passability products over the unique tree path.

  Every reach pair of an acyclic network is joined by exactly one path, so
  instead of listing paths we accumulate, for each reach v, the log-product
  of link factors from v up to its root (`up_log`) and from the root down to
  v (`down_log`), counting zero factors separately so fully blocking barriers
  stay exact. For a movement j -> i with lowest common ancestor a:

      C(i, j) = exp(up_log[j] - up_log[a] + down_log[i] - down_log[a])

  or 0 when any zero factor lies on either leg.
*/
#include "riverconn/core/structural.hpp"
#include "riverconn/core/error.hpp"

#include <cmath>
#include <deque>
#include <string>

namespace riverconn::core {

namespace {

bool is_probability(double p) { return p >= 0.0 && p <= 1.0; }

} // namespace

void validate_structural(const RiverNetwork& net, const StructuralOptions& opts) {
  if (!is_probability(opts.pass_confluence)) {
    throw InvalidParameter("'pass_confluence' must be in [0, 1]");
  }
  const auto types = net.link_type_view();
  bool any_barrier = false;
  for (auto t : types) any_barrier = any_barrier || (t == LinkType::Barrier);
  if (!any_barrier) return;

  for (const std::string* field : {&opts.pass_u_field, &opts.pass_d_field}) {
    if (!net.has_link_attribute(*field)) {
      throw InvalidAttribute("'" + *field + "' must be a valid link attribute of the network");
    }
    const auto values = net.link_attribute(*field);
    for (std::size_t l = 0; l < values.size(); ++l) {
      if (types[l] != LinkType::Barrier) continue;
      if (std::isnan(values[l])) {
        throw InvalidAttribute("'" + *field + "' is missing on barrier link " + std::to_string(l));
      }
      if (!is_probability(values[l])) {
        throw InvalidParameter("'" + *field + "' on barrier link " + std::to_string(l) + " must be in [0, 1]");
      }
    }
  }
}

LinkFactors link_factors(const RiverNetwork& net,
                         const StructuralOptions& opts,
                         const PassabilityOverrides& overrides) {
  const auto m = static_cast<std::size_t>(net.num_links());
  const auto types = net.link_type_view();
  std::vector<double> pass_u(m, 1.0);
  std::vector<double> pass_d(m, 1.0);
  if (net.has_link_attribute(opts.pass_u_field)) {
    auto col = net.link_attribute(opts.pass_u_field);
    pass_u.assign(col.begin(), col.end());
  }
  if (net.has_link_attribute(opts.pass_d_field)) {
    auto col = net.link_attribute(opts.pass_d_field);
    pass_d.assign(col.begin(), col.end());
  }
  for (auto const& [id, pass] : overrides) {
    if (!is_probability(pass.first) || !is_probability(pass.second)) {
      throw InvalidParameter("updated passability of barrier '" + id + "' must be in [0, 1]");
    }
    auto links = net.links_of_barrier(id);
    if (links.empty()) {
      throw InvalidParameter("no barrier with id '" + id + "' in the network");
    }
    for (auto l : links) {
      pass_u[static_cast<std::size_t>(l)] = pass.first;
      pass_d[static_cast<std::size_t>(l)] = pass.second;
    }
  }

  const bool symmetric = opts.directionality == Directionality::Symmetric;
  const double pc = opts.pass_confluence;
  LinkFactors f;
  f.up.resize(m);
  f.down.resize(m);
  for (std::size_t l = 0; l < m; ++l) {
    double u = 0.0;
    double d = 0.0;
    if (types[l] == LinkType::Confluence) {
      u = d = (symmetric && opts.confluence_rule == ConfluenceRule::AsBarrier) ? pc * pc : pc;
    } else if (symmetric) {
      u = d = pass_u[l] * pass_d[l];
    } else {
      u = pass_u[l];
      d = pass_d[l];
    }
    f.up[l] = u;
    f.down[l] = d;
  }
  return f;
}

StructuralModel::StructuralModel(const RiverNetwork& net) {
  const auto N = static_cast<std::size_t>(net.num_reaches());
  const auto off = net.incident_offsets_view();
  const auto nbr = net.incident_reach_view();
  const auto lnk = net.incident_link_view();
  const auto from = net.link_from_view();

  order_.reserve(N);
  parent_.assign(N, -1);
  parent_link_.assign(N, -1);
  towards_parent_is_downstream_.assign(N, 0);
  component_.assign(N, -1);

  std::int32_t comp = 0;
  std::deque<ReachId> queue;
  for (std::size_t root = 0; root < N; ++root) {
    if (component_[root] >= 0) continue;
    component_[root] = comp;
    queue.push_back(static_cast<ReachId>(root));
    while (!queue.empty()) {
      ReachId u = queue.front();
      queue.pop_front();
      order_.push_back(u);
      auto s = static_cast<std::size_t>(off[static_cast<std::size_t>(u)]);
      auto e = static_cast<std::size_t>(off[static_cast<std::size_t>(u) + 1]);
      for (std::size_t p = s; p < e; ++p) {
        auto v = static_cast<std::size_t>(nbr[p]);
        if (component_[v] >= 0) continue;
        component_[v] = comp;
        parent_[v] = u;
        parent_link_[v] = lnk[p];
        // v -> u follows the flow when the link was stored as v -> u
        towards_parent_is_downstream_[v] = (from[static_cast<std::size_t>(lnk[p])] == static_cast<ReachId>(v)) ? 1 : 0;
        queue.push_back(static_cast<ReachId>(v));
      }
    }
    ++comp;
  }
}

Matrix StructuralModel::matrix(const LinkFactors& factors) const {
  const auto N = parent_.size();
  std::vector<double> up_log(N, 0.0), down_log(N, 0.0);
  std::vector<std::int32_t> up_zeros(N, 0), down_zeros(N, 0);
  for (auto v_id : order_) {
    auto v = static_cast<std::size_t>(v_id);
    if (parent_[v] < 0) continue;
    auto p = static_cast<std::size_t>(parent_[v]);
    auto l = static_cast<std::size_t>(parent_link_[v]);
    const double to_parent = towards_parent_is_downstream_[v] ? factors.down[l] : factors.up[l];
    const double from_parent = towards_parent_is_downstream_[v] ? factors.up[l] : factors.down[l];
    up_zeros[v] = up_zeros[p] + (to_parent == 0.0 ? 1 : 0);
    up_log[v] = up_log[p] + (to_parent == 0.0 ? 0.0 : std::log(to_parent));
    down_zeros[v] = down_zeros[p] + (from_parent == 0.0 ? 1 : 0);
    down_log[v] = down_log[p] + (from_parent == 0.0 ? 0.0 : std::log(from_parent));
  }

  Matrix c = Matrix::Zero(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(N));
  std::vector<std::size_t> ancestor_stamp(N, N);
  std::vector<ReachId> lca(N, -1);
  for (std::size_t i = 0; i < N; ++i) {
    // mark every ancestor of destination i (including i)
    for (ReachId a = static_cast<ReachId>(i); a >= 0; a = parent_[static_cast<std::size_t>(a)]) {
      ancestor_stamp[static_cast<std::size_t>(a)] = i;
    }
    // BFS order visits parents first, so lca of a non-ancestor is its parent's
    for (auto j_id : order_) {
      auto j = static_cast<std::size_t>(j_id);
      if (component_[j] != component_[i]) { lca[j] = -1; continue; }
      lca[j] = (ancestor_stamp[j] == i) ? j_id : lca[static_cast<std::size_t>(parent_[j])];
      auto a = static_cast<std::size_t>(lca[j]);
      if (up_zeros[j] - up_zeros[a] + down_zeros[i] - down_zeros[a] > 0) continue;
      c(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
          std::exp((up_log[j] - up_log[a]) + (down_log[i] - down_log[a]));
    }
  }
  return c;
}

Matrix structural_matrix(const RiverNetwork& net,
                         const StructuralOptions& opts,
                         const PassabilityOverrides& overrides) {
  validate_structural(net, opts);
  StructuralModel model(net);
  return model.matrix(link_factors(net, opts, overrides));
}

} // namespace riverconn::core
