
#include "domain/move_applicator.hh"

namespace kami::domain {

bool is_valid_move(const RegionGraph &graph, const Move &move) {
    return graph.contains(move.target) && graph.color(move.target) != move.color;
}

std::optional<RegionGraph> apply_move(const RegionGraph &graph, const Move &move) {
    if (!is_valid_move(graph, move)) {
        return std::nullopt;
    }
    return graph.recolored(move);
}

std::optional<RegionGraph> apply_moves(const RegionGraph &graph, const std::vector<Move> &moves) {
    std::optional<RegionGraph> maybe_state = graph;
    for (const Move &move : moves) {
        maybe_state = apply_move(maybe_state.value(), move);
        if (!maybe_state.has_value()) {
            return std::nullopt;
        }
    }
    return maybe_state;
}

std::vector<Move> valid_moves(const RegionGraph &graph) {
    // Recoloring to a color that no region has can never merge anything, so only the colors that
    // are present are considered.
    const std::vector<Color> colors = graph.colors_present();
    std::vector<Move> out;
    out.reserve(graph.num_nodes() * (colors.size() - 1));
    for (const auto &[id, node] : graph.nodes()) {
        for (const Color color : colors) {
            if (color != node.color) {
                out.push_back(Move{.target = id, .color = color});
            }
        }
    }
    return out;
}

}  // namespace kami::domain
