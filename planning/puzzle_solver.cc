
#include "planning/puzzle_solver.hh"

#include <algorithm>
#include <unordered_set>

#include "domain/errors.hh"
#include "domain/move_applicator.hh"
#include "fmt/format.h"
#include "planning/a_star.hh"
#include "planning/breadth_first_search.hh"

namespace kami::planning {
namespace {

std::vector<domain::Move> moves_from_path(const std::vector<SearchState> &path) {
    std::vector<domain::Move> out;
    out.reserve(path.size());
    for (const SearchState &state : path) {
        if (state.move.has_value()) {
            out.push_back(state.move.value());
        }
    }
    return out;
}

// Every state reachable in one move, skipping children deeper than the move limit
std::vector<SearchState> expand(const SearchState &state, const SolverOptions &options,
                                domain::SignatureCache &cache) {
    std::vector<SearchState> out;
    if (options.max_moves.has_value() && state.depth >= options.max_moves.value()) {
        return out;
    }
    for (const domain::Move &move : domain::valid_moves(state.graph)) {
        std::optional<domain::RegionGraph> maybe_child = domain::apply_move(state.graph, move);
        if (!maybe_child.has_value()) {
            continue;
        }
        const domain::Signature signature =
            domain::compute_signature(maybe_child.value(), options.signature_mode, cache);
        out.push_back(SearchState{
            .graph = std::move(maybe_child.value()),
            .move = move,
            .depth = state.depth + 1,
            .signature = signature,
        });
    }
    return out;
}

std::optional<Solution> solve_breadth_first(const SearchState &initial_state,
                                            const SolverOptions &options,
                                            domain::SignatureCache &cache) {
    std::unordered_set<domain::Signature> visited = {initial_state.signature};

    const SuccessorFunc<SearchState> successors_for_state = [&options,
                                                             &cache](const SearchState &state) {
        std::vector<BFSSuccessor<SearchState>> out;
        for (auto &child : expand(state, options, cache)) {
            out.push_back({.state = std::move(child)});
        }
        return out;
    };

    const ShouldQueueFunc<SearchState> have_not_visited_before =
        [&visited](const BFSSuccessor<SearchState> &to_add, const int,
                   const std::vector<Node<SearchState>> &) -> ShouldQueueResult {
        if (!visited.insert(to_add.state.signature).second) {
            return ShouldQueueResult::SKIP;
        }
        return ShouldQueueResult::QUEUE;
    };

    const GoalCheckFunc<SearchState> is_solved = [](const Node<SearchState> &node) {
        return node.state.graph.is_solved();
    };

    const auto maybe_result = breadth_first_search<SearchState>(
        initial_state, successors_for_state, have_not_visited_before, is_solved,
        {.max_depth = options.max_moves});
    if (!maybe_result.has_value()) {
        return std::nullopt;
    }
    return Solution{
        .moves = moves_from_path(maybe_result->path),
        .num_states_expanded = maybe_result->num_nodes_expanded,
        .num_states_visited = maybe_result->num_nodes_visited,
    };
}

std::optional<Solution> solve_best_first(const SearchState &initial_state,
                                         const SolverOptions &options,
                                         domain::SignatureCache &cache) {
    const auto successors_for_state = [&options, &cache](const SearchState &state) {
        std::vector<Successor<SearchState>> out;
        for (auto &child : expand(state, options, cache)) {
            out.push_back({.state = std::move(child), .edge_cost = 1.0});
        }
        return out;
    };
    const auto heuristic = [&options](const SearchState &state) -> double {
        return combined_heuristic(options.heuristics, state.graph);
    };
    const auto is_solved = [](const SearchState &state) { return state.graph.is_solved(); };
    const auto signature_for_state = [](const SearchState &state) { return state.signature; };

    const auto maybe_result =
        a_star(initial_state, successors_for_state, heuristic, is_solved, signature_for_state);
    if (!maybe_result.has_value()) {
        return std::nullopt;
    }
    return Solution{
        .moves = moves_from_path(maybe_result->states),
        .num_states_expanded = maybe_result->num_nodes_expanded,
        .num_states_visited = maybe_result->num_nodes_visited,
    };
}
}  // namespace

bool guarantees_minimal(const SolverOptions &options) {
    if (options.signature_mode != domain::SignatureMode::EXACT) {
        return false;
    }
    if (options.strategy == SearchStrategy::BREADTH_FIRST) {
        return true;
    }
    return std::all_of(options.heuristics.begin(), options.heuristics.end(),
                       [](const Heuristic heuristic) { return is_admissible(heuristic); });
}

std::optional<Solution> solve_within(const domain::RegionGraph &puzzle,
                                     const SolverOptions &options) {
    domain::SignatureCache local_cache;
    domain::SignatureCache &cache = options.cache != nullptr ? *options.cache : local_cache;

    const SearchState initial_state{
        .graph = puzzle,
        .move = std::nullopt,
        .depth = 0,
        .signature = domain::compute_signature(puzzle, options.signature_mode, cache),
    };

    switch (options.strategy) {
        case SearchStrategy::BREADTH_FIRST:
            return solve_breadth_first(initial_state, options, cache);
        case SearchStrategy::BEST_FIRST:
            return solve_best_first(initial_state, options, cache);
    }
    return std::nullopt;
}

std::vector<domain::Move> solve(const domain::RegionGraph &puzzle, const SearchStrategy strategy,
                                const std::vector<Heuristic> &heuristics) {
    const auto maybe_solution =
        solve_within(puzzle, {.strategy = strategy, .heuristics = heuristics});
    if (!maybe_solution.has_value()) {
        throw domain::UnsolvableError(
            fmt::format("Exhausted every state reachable from a puzzle with {} regions",
                        puzzle.num_nodes()));
    }
    return maybe_solution->moves;
}

}  // namespace kami::planning
