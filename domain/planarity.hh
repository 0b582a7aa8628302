
#pragma once

#include <vector>

#include "domain/region_graph.hh"

namespace kami::domain {

// Returns true if the graph on regions 0 ... node_count - 1 with the given adjacency can be drawn
// in the plane without crossing edges. Repeated edges are ignored.
// Throws MalformedGraphError if an edge references an unknown region or is a self loop.
bool is_planar(const int node_count, const std::vector<Edge> &edges);

// Returns true if every region can be reached from every other region
bool is_connected(const int node_count, const std::vector<Edge> &edges);

}  // namespace kami::domain
