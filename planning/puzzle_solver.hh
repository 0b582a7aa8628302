
#pragma once

#include <optional>
#include <vector>

#include "domain/canonical_signature.hh"
#include "domain/move.hh"
#include "domain/region_graph.hh"
#include "planning/heuristics.hh"
#include "wise_enum.h"

namespace kami::planning {

WISE_ENUM_CLASS(SearchStrategy, BREADTH_FIRST, BEST_FIRST)

// A node of the search. The move list of a state is recovered by following parents back to the
// initial state, so each state only records the move that produced it.
struct SearchState {
    domain::RegionGraph graph;
    // Empty for the initial state
    std::optional<domain::Move> move;
    int depth;
    domain::Signature signature;
};

struct SolverOptions {
    SearchStrategy strategy = SearchStrategy::BREADTH_FIRST;
    // Only consulted by BEST_FIRST. The search is guided by the maximum of the enabled heuristics.
    std::vector<Heuristic> heuristics = {};
    domain::SignatureMode signature_mode = domain::SignatureMode::EXACT;
    // Solutions with more moves than this are not searched for
    std::optional<int> max_moves = std::nullopt;
    // Cache for exact signatures. If null, a cache local to the call is used.
    domain::SignatureCache *cache = nullptr;
};

struct Solution {
    std::vector<domain::Move> moves;
    int num_states_expanded;
    int num_states_visited;
};

// True if a search with these options always returns a solution with the fewest moves. This
// requires exact signatures and, for BEST_FIRST, only admissible heuristics.
bool guarantees_minimal(const SolverOptions &options);

// Searches for a move sequence that reduces the puzzle to a single region. Returns std::nullopt if
// there is none with at most `options.max_moves` moves.
std::optional<Solution> solve_within(const domain::RegionGraph &puzzle,
                                     const SolverOptions &options);

// Solves the puzzle without a bound on the number of moves.
// Throws UnsolvableError if every reachable state is exhausted without solving the puzzle.
std::vector<domain::Move> solve(const domain::RegionGraph &puzzle, const SearchStrategy strategy,
                                const std::vector<Heuristic> &heuristics = {});

}  // namespace kami::planning
