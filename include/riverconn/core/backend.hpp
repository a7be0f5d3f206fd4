/*
  Backend interface — abstracts the all-pairs routing oracle.

  The connectivity builders never compute shortest paths themselves; they
  hand a routing table to a Backend and receive the distance matrix. The
  default CPU backend runs Dijkstra from every source in-process.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <cstdint>
#include <memory>

#include "riverconn/core/routing_table.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

class Backend {
public:
  virtual ~Backend() noexcept = default;

  // All-pairs distances over `table` for reaches [0, num_reaches).
  // D(i, j) is the distance of the movement j -> i; kUnreachable if none.
  // Implementations must be safe to call concurrently.
  [[nodiscard]] virtual Matrix distances(std::int32_t num_reaches,
                                         const RoutingTable& table) const = 0;
};

using BackendPtr = std::shared_ptr<const Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace riverconn::core
