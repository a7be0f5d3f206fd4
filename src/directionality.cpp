/*
  Directionality assignment — re-orient links toward a designated outlet.

  A breadth-first search from the outlet labels each reach with the link it
  was discovered through; that link then points from the discovered reach to
  its discoverer, which is the downstream direction.
*/
#include "riverconn/core/directionality.hpp"
#include "riverconn/core/error.hpp"

#include <deque>
#include <string>
#include <vector>

namespace riverconn::core {

RiverNetwork orient_towards_outlet(const RiverNetwork& net, ReachId outlet) {
  const auto N = net.num_reaches();
  if (outlet < 0 || outlet >= N) {
    throw InvalidParameter("outlet " + std::to_string(outlet) + " is out of range of the network reaches");
  }
  const auto off = net.incident_offsets_view();
  const auto nbr = net.incident_reach_view();
  const auto lnk = net.incident_link_view();

  std::vector<ReachId> from(net.link_from_view().begin(), net.link_from_view().end());
  std::vector<ReachId> to(net.link_to_view().begin(), net.link_to_view().end());
  std::vector<char> seen(static_cast<std::size_t>(N), 0);
  std::vector<char> oriented(from.size(), 0);
  std::deque<ReachId> queue;
  seen[static_cast<std::size_t>(outlet)] = 1;
  queue.push_back(outlet);
  while (!queue.empty()) {
    ReachId u = queue.front();
    queue.pop_front();
    auto s = static_cast<std::size_t>(off[static_cast<std::size_t>(u)]);
    auto e = static_cast<std::size_t>(off[static_cast<std::size_t>(u) + 1]);
    for (std::size_t p = s; p < e; ++p) {
      auto v = nbr[p];
      auto l = static_cast<std::size_t>(lnk[p]);
      if (oriented[l]) continue;
      oriented[l] = 1;
      // v drains into u
      from[l] = v;
      to[l] = u;
      if (!seen[static_cast<std::size_t>(v)]) {
        seen[static_cast<std::size_t>(v)] = 1;
        queue.push_back(v);
      }
    }
  }

  auto types = net.link_type_view();
  RiverNetwork out = RiverNetwork::from_arrays(N, from, to, types);
  out.set_reach_labels(net.reach_labels());
  out.set_barrier_ids(net.barrier_ids());
  for (auto const& name : net.reach_attribute_names()) {
    auto col = net.reach_attribute(name);
    out.set_reach_attribute(name, std::vector<double>(col.begin(), col.end()));
  }
  for (auto const& name : net.link_attribute_names()) {
    auto col = net.link_attribute(name);
    out.set_link_attribute(name, std::vector<double>(col.begin(), col.end()));
  }
  return out;
}

} // namespace riverconn::core
