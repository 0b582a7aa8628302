
#pragma once

#include <optional>
#include <vector>

#include "domain/move.hh"
#include "domain/region_graph.hh"

namespace kami::domain {

// A move is valid if its target is a live region and it changes that region's color
bool is_valid_move(const RegionGraph &graph, const Move &move);

// Applies a move to produce the next state. Invalid moves are rejected with std::nullopt and the
// input graph is left untouched.
std::optional<RegionGraph> apply_move(const RegionGraph &graph, const Move &move);

// Applies each move in order. Returns std::nullopt if any move in the sequence is invalid.
std::optional<RegionGraph> apply_moves(const RegionGraph &graph, const std::vector<Move> &moves);

// Every move that recolors a live region to a different color that is present in the graph.
// Moves are ordered by target id and then by color.
std::vector<Move> valid_moves(const RegionGraph &graph);

}  // namespace kami::domain
