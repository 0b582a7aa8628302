
#pragma once

#include <algorithm>
#include <optional>
#include <queue>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kami::planning {

template <typename State>
struct AStarResult {
    std::vector<State> states;
    double cost;
    int num_nodes_expanded;
    int num_nodes_visited;
};

template <typename State>
struct Successor {
    State state;
    double edge_cost;
};

// Find a path through a graph.
// SuccessorFunc returns a list of successors and must have the interface:
//     Iterable<Successor<State>>(const State &)
// HeuristicFunc returns the estimated cost from the argument node to a goal node. It should have
//     the interface: double(const State &)
// GoalCheck returns true if the node is a goal state.
// KeyFunc maps a state to a hashable key. States with equal keys are treated as the same node of
//     the graph, so only the cheapest path to each key is kept.
// The returned path is optimal if the heuristic never overestimates the remaining cost.
template <typename State, typename SuccessorFunc, typename HeuristicFunc, typename GoalCheck,
          typename KeyFunc>
std::optional<AStarResult<State>> a_star(const State &initial_state,
                                         const SuccessorFunc &successors_for_state,
                                         const HeuristicFunc &heuristic,
                                         const GoalCheck &termination_check,
                                         const KeyFunc &key_for_state) {
    using Key = std::decay_t<decltype(key_for_state(initial_state))>;
    struct Node {
        State state;
        std::optional<int> maybe_parent_idx;
        double cost_to_come;
        double est_cost_to_go;
        bool should_skip;
    };
    struct Compare {
        std::vector<Node> *nodes;
        bool operator()(const int a, const int b) const {
            // This operator should return true if a should be expanded after b;
            const auto &head_a = nodes->at(a);
            const auto &head_b = nodes->at(b);
            const double cost_a = head_a.cost_to_come + head_a.est_cost_to_go;
            const double cost_b = head_b.cost_to_come + head_b.est_cost_to_go;

            if (cost_a == cost_b) {
                // If the total estimated costs are equal, prefer the one that has been expanded
                // more.
                if (head_a.cost_to_come == head_b.cost_to_come) {
                    // Otherwise prefer the one that was generated first
                    return a > b;
                }
                return head_a.cost_to_come < head_b.cost_to_come;
            }
            return cost_a > cost_b;
        }
    };

    const auto extract_path = [](const int end_idx, const auto &nodes) {
        std::vector<State> out;
        for (std::optional<int> node_idx = end_idx; node_idx.has_value();
             node_idx = nodes.at(node_idx.value()).maybe_parent_idx) {
            const auto &node = nodes.at(node_idx.value());
            out.push_back(node.state);
        }
        std::reverse(out.begin(), out.end());
        return out;
    };

    std::vector<Node> nodes;
    nodes.push_back(Node{
        .state = initial_state,
        .maybe_parent_idx = std::nullopt,
        .cost_to_come = 0,
        .est_cost_to_go = heuristic(initial_state),
        .should_skip = false,
    });

    std::priority_queue<int, std::vector<int>, Compare> queue(Compare{.nodes = &nodes});
    queue.push(0);
    std::unordered_map<Key, double> expanded_nodes;
    // The index of the queued node for each key that is still in the open set
    std::unordered_map<Key, int> open_idx_from_key = {{key_for_state(initial_state), 0}};
    int nodes_expanded = 0;
    while (!queue.empty()) {
        const int node_idx = queue.top();
        queue.pop();
        if (nodes.at(node_idx).should_skip) {
            continue;
        }
        const Key curr_key = key_for_state(nodes.at(node_idx).state);
        open_idx_from_key.erase(curr_key);

        nodes_expanded++;
        expanded_nodes[curr_key] = nodes.at(node_idx).cost_to_come;

        // Goal Check
        if (termination_check(nodes.at(node_idx).state)) {
            // Extract the path
            return AStarResult<State>{
                .states = extract_path(node_idx, nodes),
                .cost = nodes.at(node_idx).cost_to_come,
                .num_nodes_expanded = nodes_expanded,
                .num_nodes_visited = static_cast<int>(nodes.size()),
            };
        }

        // nodes.push_back() can re-alloc, so store a copy of the cost to come
        const double curr_node_cost_to_come = nodes.at(node_idx).cost_to_come;
        for (auto &successor : successors_for_state(nodes.at(node_idx).state)) {
            const double cost_to_come = curr_node_cost_to_come + successor.edge_cost;
            const Key successor_key = key_for_state(successor.state);
            auto in_expanded_iter = expanded_nodes.find(successor_key);
            if (in_expanded_iter != expanded_nodes.end()) {
                if (in_expanded_iter->second <= cost_to_come) {
                    continue;
                } else {
                    // Remove the existing element from the closed list
                    expanded_nodes.erase(in_expanded_iter);
                }
            }

            // if the node is in the open set and it's not better than the previous item
            // skip it
            auto in_open_iter = open_idx_from_key.find(successor_key);
            if (in_open_iter != open_idx_from_key.end()) {
                Node &existing = nodes.at(in_open_iter->second);
                if (existing.cost_to_come <= cost_to_come) {
                    continue;
                }
                // The new successor is better than the existing item in the queue. We should
                // skip the existing item.
                existing.should_skip = true;
            }

            const double est_cost_to_go = heuristic(successor.state);
            nodes.push_back(Node{
                .state = std::move(successor.state),
                .maybe_parent_idx = node_idx,
                .cost_to_come = cost_to_come,
                .est_cost_to_go = est_cost_to_go,
                .should_skip = false,
            });
            open_idx_from_key[successor_key] = nodes.size() - 1;
            queue.push(nodes.size() - 1);
        }
    }
    return std::nullopt;
}

}  // namespace kami::planning
