
#pragma once

#include <algorithm>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace kami::planning {
template <typename State>
struct Node {
    State state;
    std::optional<int> maybe_parent_idx;
    int depth;
};

template <typename State>
struct BFSSuccessor {
    State state;
};

template <typename State>
struct BreadthFirstResult {
    std::vector<State> path;
    int num_nodes_expanded;
    int num_nodes_visited;
};

struct BreadthFirstOptions {
    // Successors deeper than this are not generated
    std::optional<int> max_depth = std::nullopt;
};

enum class ShouldQueueResult {
    SKIP,
    QUEUE,
};

template <typename State>
using SuccessorFunc = std::function<std::vector<BFSSuccessor<State>>(const State &start)>;

template <typename State>
using ShouldQueueFunc = std::function<ShouldQueueResult(
    const BFSSuccessor<State> &, const int parent_idx, const std::vector<Node<State>> &node_list)>;

template <typename State>
using GoalCheckFunc = std::function<bool(const Node<State> &)>;

// Expands states in order of non-decreasing depth. Every edge has unit cost, so the first goal
// state that is generated is at minimum depth. The goal check is applied when a state is
// generated rather than when it is expanded, which saves expanding the final layer.
// Returns std::nullopt if no goal is reachable within `options.max_depth`.
template <typename State>
std::optional<BreadthFirstResult<State>> breadth_first_search(
    const State &initial_state, const SuccessorFunc<State> &successors_for_state,
    const ShouldQueueFunc<State> &should_queue_check, const GoalCheckFunc<State> &goal_check_func,
    const BreadthFirstOptions &options = {}) {
    int nodes_expanded = 0;
    int nodes_visited = 0;

    std::vector<Node<State>> nodes = {
        {.state = initial_state, .maybe_parent_idx = {}, .depth = 0}};

    const auto extract_path = [&nodes](const int end_idx) {
        std::vector<State> path;
        for (std::optional<int> node_idx = end_idx; node_idx.has_value();
             node_idx = nodes.at(node_idx.value()).maybe_parent_idx) {
            path.push_back(nodes.at(node_idx.value()).state);
        }
        std::reverse(path.begin(), path.end());
        return path;
    };

    if (goal_check_func(nodes.front())) {
        return BreadthFirstResult<State>{
            .path = extract_path(0),
            .num_nodes_expanded = nodes_expanded,
            .num_nodes_visited = nodes_visited,
        };
    }

    std::deque<int> node_idx_queue = {0};
    while (!node_idx_queue.empty()) {
        const int node_idx = node_idx_queue.front();
        node_idx_queue.pop_front();
        // Make a copy to avoid invalidated references when pushing back on nodes
        const Node<State> n = nodes.at(node_idx);
        if (options.max_depth.has_value() && n.depth >= options.max_depth.value()) {
            // Every remaining node in the queue is at least as deep
            break;
        }
        nodes_expanded++;

        for (auto &successor : successors_for_state(n.state)) {
            nodes_visited++;

            if (should_queue_check(successor, node_idx, nodes) == ShouldQueueResult::SKIP) {
                continue;
            }

            nodes.push_back(Node<State>{.state = std::move(successor.state),
                                        .maybe_parent_idx = node_idx,
                                        .depth = n.depth + 1});
            const int successor_idx = nodes.size() - 1;
            if (goal_check_func(nodes.back())) {
                return BreadthFirstResult<State>{
                    .path = extract_path(successor_idx),
                    .num_nodes_expanded = nodes_expanded,
                    .num_nodes_visited = nodes_visited,
                };
            }
            node_idx_queue.push_back(successor_idx);
        }
    }
    return std::nullopt;
}
}  // namespace kami::planning
