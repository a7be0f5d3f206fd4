/* Flow directionality assignment relative to a network outlet. */
#pragma once

#include "riverconn/core/river_network.hpp"
#include "riverconn/core/types.hpp"

namespace riverconn::core {

// Return a copy of `net` whose links all point downstream, i.e. toward
// `outlet`. Orientation is derived breadth-first from the outlet over the
// undirected network; links not reachable from the outlet keep their
// original orientation. Link attributes, barrier ids and link order are
// preserved. Throws InvalidParameter if `outlet` is out of range.
[[nodiscard]] RiverNetwork orient_towards_outlet(const RiverNetwork& net, ReachId outlet);

} // namespace riverconn::core
