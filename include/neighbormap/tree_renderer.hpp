#ifndef NEIGHBORMAP_TREE_RENDERER_HPP
#define NEIGHBORMAP_TREE_RENDERER_HPP

#include "neighbormap/topology.hpp"
#include <string>
#include <optional>

namespace neighbormap {

// Text tree of the topology, treating every link as undirected:
//
//   CORE-SW-01 (192.168.1.1)
//      ├─[CDP+LLDP] GigabitEthernet1/0/1 ↔ GigabitEthernet1/0/48 (192.168.1.10)
//      │  DIST-SW-01 (192.168.1.10)
//
// Without an explicit root the first device inserted is used, which for a
// crawl result is the seed. Neighbors are visited depth-first in name order.
// A device's children are its neighbors not yet drawn when it is reached, so
// in a cycle a device can appear both under a sibling and under its parent.
std::string render_topology_tree(const Topology& topology,
                                 const std::optional<std::string>& root = std::nullopt);

} // namespace neighbormap

#endif // NEIGHBORMAP_TREE_RENDERER_HPP
