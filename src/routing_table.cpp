/*
  Routing table extraction — per-link midpoint distances and movement flags.
*/
#include "riverconn/core/routing_table.hpp"
#include "riverconn/core/error.hpp"

#include <cmath>
#include <string>

namespace riverconn::core {

std::span<const double> distance_column(const RiverNetwork& net, std::string_view distance_field) {
  if (!net.has_reach_attribute(distance_field)) {
    throw InvalidAttribute("distance field '" + std::string(distance_field) +
                           "' must be a valid reach attribute of the network");
  }
  const auto d = net.reach_attribute(distance_field);
  for (std::size_t v = 0; v < d.size(); ++v) {
    if (!std::isfinite(d[v]) || d[v] < 0.0) {
      throw InvalidAttribute("distance field '" + std::string(distance_field) +
                             "' must be finite and >= 0 (reach " + std::to_string(v) + ")");
    }
  }
  return d;
}

RoutingTable extract_routing_table(const RiverNetwork& net, std::string_view distance_field) {
  const auto d = distance_column(net, distance_field);
  const auto from = net.link_from_view();
  const auto to = net.link_to_view();
  const std::size_t m = from.size();

  RoutingTable t;
  t.from.reserve(2 * m);
  t.to.reserve(2 * m);
  t.distance.reserve(2 * m);
  t.direction.reserve(2 * m);
  for (std::size_t e = 0; e < m; ++e) {
    const Distance mid = (d[static_cast<std::size_t>(from[e])] + d[static_cast<std::size_t>(to[e])]) / 2.0;
    t.from.push_back(from[e]);
    t.to.push_back(to[e]);
    t.distance.push_back(mid);
    t.direction.push_back(MoveDirection::Downstream);
    t.from.push_back(to[e]);
    t.to.push_back(from[e]);
    t.distance.push_back(mid);
    t.direction.push_back(MoveDirection::Upstream);
  }
  return t;
}

RoutingTable directional_leg(const RoutingTable& table, MoveDirection leg) {
  RoutingTable out;
  for (std::size_t k = 0; k < table.size(); ++k) {
    if (table.direction[k] != leg) continue;
    out.from.push_back(table.from[k]);
    out.to.push_back(table.to[k]);
    out.distance.push_back(table.distance[k]);
    out.direction.push_back(leg);
  }
  const std::size_t flagged = out.size();
  for (std::size_t k = 0; k < flagged; ++k) {
    out.from.push_back(out.to[k]);
    out.to.push_back(out.from[k]);
    out.distance.push_back(0.0);
    out.direction.push_back(leg);
  }
  return out;
}

} // namespace riverconn::core
