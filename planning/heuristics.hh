
#pragma once

#include <vector>

#include "domain/region_graph.hh"
#include "wise_enum.h"

namespace kami::planning {

// COLOR_COUNT never overestimates the number of remaining moves. MAX_EDGE_REDUCTION may, so a
// search guided by it can return a longer solution than necessary.
WISE_ENUM_CLASS(Heuristic, COLOR_COUNT, MAX_EDGE_REDUCTION)

bool is_admissible(const Heuristic heuristic);

// The number of distinct colors minus one. A move can only remove the recolored region's old
// color from the puzzle, so at least this many moves remain.
int color_count_heuristic(const domain::RegionGraph &graph);

// The number of edges divided by the most edges any single move removes, rounded up.
int max_edge_reduction_heuristic(const domain::RegionGraph &graph);

int evaluate(const Heuristic heuristic, const domain::RegionGraph &graph);

// The maximum over the enabled heuristics, or zero if none are enabled
int combined_heuristic(const std::vector<Heuristic> &heuristics, const domain::RegionGraph &graph);

}  // namespace kami::planning
