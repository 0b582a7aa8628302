
#include "planning/heuristics.hh"

#include <algorithm>

#include "domain/move_applicator.hh"

namespace kami::planning {

bool is_admissible(const Heuristic heuristic) {
    switch (heuristic) {
        case Heuristic::COLOR_COUNT:
            return true;
        case Heuristic::MAX_EDGE_REDUCTION:
            return false;
    }
    return false;
}

int color_count_heuristic(const domain::RegionGraph &graph) {
    return static_cast<int>(graph.colors_present().size()) - 1;
}

int max_edge_reduction_heuristic(const domain::RegionGraph &graph) {
    const int num_edges = graph.num_edges();
    if (num_edges == 0) {
        return 0;
    }

    // Recoloring a region removes one edge to each neighbor of the new color, plus any edges that
    // become duplicates when the merged regions share a neighbor.
    int max_reduction = 0;
    for (const domain::Move &move : domain::valid_moves(graph)) {
        const domain::RegionGraph next = graph.recolored(move);
        max_reduction = std::max(max_reduction, num_edges - next.num_edges());
    }
    if (max_reduction == 0) {
        return num_edges;
    }
    return (num_edges + max_reduction - 1) / max_reduction;
}

int evaluate(const Heuristic heuristic, const domain::RegionGraph &graph) {
    switch (heuristic) {
        case Heuristic::COLOR_COUNT:
            return color_count_heuristic(graph);
        case Heuristic::MAX_EDGE_REDUCTION:
            return max_edge_reduction_heuristic(graph);
    }
    return 0;
}

int combined_heuristic(const std::vector<Heuristic> &heuristics, const domain::RegionGraph &graph) {
    int out = 0;
    for (const Heuristic heuristic : heuristics) {
        out = std::max(out, evaluate(heuristic, graph));
    }
    return out;
}

}  // namespace kami::planning
