/*
  RiverNetwork — reach/link arrays with named attribute columns.

  Construction from arrays validates endpoint ranges and builds an undirected
  incidence list in CSR form, sorted by (reach, neighbor, link) so that every
  traversal over the network visits links in the same order.
*/
#include "riverconn/core/river_network.hpp"
#include "riverconn/core/error.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace riverconn::core {

RiverNetwork RiverNetwork::from_arrays(
    std::int32_t num_reaches,
    std::span<const ReachId> from,
    std::span<const ReachId> to,
    std::span<const LinkType> type) {

  if (num_reaches < 0) {
    throw std::invalid_argument("num_reaches must be >= 0");
  }
  if (from.size() != to.size() || from.size() != type.size()) {
    throw std::invalid_argument("from, to, and type must have the same length");
  }
  const std::size_t m = from.size();
  for (std::size_t i = 0; i < m; ++i) {
    if (from[i] < 0 || to[i] < 0 || from[i] >= num_reaches || to[i] >= num_reaches) {
      throw std::out_of_range("link endpoint out of range of num_reaches");
    }
    if (from[i] == to[i]) {
      throw std::invalid_argument("self-loop links are not allowed");
    }
  }
  RiverNetwork net;
  net.num_reaches_ = num_reaches;
  net.from_.assign(from.begin(), from.end());
  net.to_.assign(to.begin(), to.end());
  net.type_.assign(type.begin(), type.end());
  net.barrier_ids_.assign(m, std::string{});
  net.labels_.resize(static_cast<std::size_t>(num_reaches));
  for (std::int32_t v = 0; v < num_reaches; ++v) {
    net.labels_[static_cast<std::size_t>(v)] = std::to_string(v);
  }
  net.build_incidence();
  return net;
}

void RiverNetwork::build_incidence() {
  const std::size_t m = from_.size();
  const auto n = static_cast<std::size_t>(num_reaches_);
  // Each link appears twice, once per endpoint.
  std::vector<std::size_t> idx(2 * m);
  std::iota(idx.begin(), idx.end(), 0);
  auto owner = [&](std::size_t k) { return k < m ? from_[k] : to_[k - m]; };
  auto other = [&](std::size_t k) { return k < m ? to_[k] : from_[k - m]; };
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (owner(a) != owner(b)) return owner(a) < owner(b);
    if (other(a) != other(b)) return other(a) < other(b);
    return (a % m) < (b % m);
  });
  inc_offsets_.assign(n + 1, 0);
  for (std::size_t k = 0; k < 2 * m; ++k) {
    inc_offsets_[static_cast<std::size_t>(owner(k)) + 1]++;
  }
  for (std::size_t i = 1; i < inc_offsets_.size(); ++i) {
    inc_offsets_[i] += inc_offsets_[i - 1];
  }
  inc_reach_.resize(2 * m);
  inc_link_.resize(2 * m);
  for (std::size_t p = 0; p < idx.size(); ++p) {
    inc_reach_[p] = other(idx[p]);
    inc_link_[p] = static_cast<LinkId>(idx[p] % m);
  }
}

void RiverNetwork::set_reach_attribute(std::string name, std::vector<double> values) {
  if (values.size() != static_cast<std::size_t>(num_reaches_)) {
    throw std::invalid_argument("reach attribute '" + name + "' length must equal num_reaches");
  }
  reach_attrs_.insert_or_assign(std::move(name), std::move(values));
}

void RiverNetwork::set_link_attribute(std::string name, std::vector<double> values) {
  if (values.size() != from_.size()) {
    throw std::invalid_argument("link attribute '" + name + "' length must equal num_links");
  }
  link_attrs_.insert_or_assign(std::move(name), std::move(values));
}

void RiverNetwork::set_reach_labels(std::vector<std::string> labels) {
  if (labels.size() != static_cast<std::size_t>(num_reaches_)) {
    throw std::invalid_argument("reach labels length must equal num_reaches");
  }
  labels_ = std::move(labels);
}

void RiverNetwork::set_barrier_ids(std::vector<std::string> ids) {
  if (ids.size() != from_.size()) {
    throw std::invalid_argument("barrier ids length must equal num_links");
  }
  barrier_ids_ = std::move(ids);
}

bool RiverNetwork::has_reach_attribute(std::string_view name) const {
  return reach_attrs_.find(name) != reach_attrs_.end();
}

bool RiverNetwork::has_link_attribute(std::string_view name) const {
  return link_attrs_.find(name) != link_attrs_.end();
}

std::span<const double> RiverNetwork::reach_attribute(std::string_view name) const {
  auto it = reach_attrs_.find(name);
  if (it == reach_attrs_.end()) {
    throw InvalidAttribute("'" + std::string(name) + "' is not a reach attribute of the network");
  }
  return it->second;
}

std::span<const double> RiverNetwork::link_attribute(std::string_view name) const {
  auto it = link_attrs_.find(name);
  if (it == link_attrs_.end()) {
    throw InvalidAttribute("'" + std::string(name) + "' is not a link attribute of the network");
  }
  return it->second;
}

std::vector<std::string> RiverNetwork::reach_attribute_names() const {
  std::vector<std::string> out;
  out.reserve(reach_attrs_.size());
  for (auto const& kv : reach_attrs_) out.push_back(kv.first);
  return out;
}

std::vector<std::string> RiverNetwork::link_attribute_names() const {
  std::vector<std::string> out;
  out.reserve(link_attrs_.size());
  for (auto const& kv : link_attrs_) out.push_back(kv.first);
  return out;
}

std::vector<LinkId> RiverNetwork::links_of_barrier(std::string_view barrier_id) const {
  std::vector<LinkId> out;
  if (barrier_id.empty()) return out;
  for (std::size_t e = 0; e < barrier_ids_.size(); ++e) {
    if (type_[e] == LinkType::Barrier && barrier_ids_[e] == barrier_id) {
      out.push_back(static_cast<LinkId>(e));
    }
  }
  return out;
}

} // namespace riverconn::core
