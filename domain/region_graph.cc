
#include "domain/region_graph.hh"

#include <algorithm>
#include <set>
#include <vector>

#include "common/check.hh"
#include "domain/errors.hh"
#include "fmt/format.h"
#include "fmt/ranges.h"

namespace kami::domain {
namespace {
bool is_connected(const std::map<NodeId, RegionGraph::Node> &nodes) {
    if (nodes.empty()) {
        return false;
    }
    std::set<NodeId> visited;
    std::vector<NodeId> to_visit = {nodes.begin()->first};
    while (!to_visit.empty()) {
        const NodeId id = to_visit.back();
        to_visit.pop_back();
        if (!visited.insert(id).second) {
            continue;
        }
        for (const NodeId neighbor : nodes.at(id).neighbors) {
            if (!visited.contains(neighbor)) {
                to_visit.push_back(neighbor);
            }
        }
    }
    return visited.size() == nodes.size();
}
}  // namespace

RegionGraph RegionGraph::create(const PuzzleDescription &description) {
    if (description.node_count < 1) {
        throw MalformedGraphError(
            fmt::format("A puzzle needs at least one region, got {}", description.node_count));
    }
    if (static_cast<int>(description.coloring.size()) != description.node_count) {
        throw MalformedGraphError(fmt::format("Expected a color for each of the {} regions, got {}",
                                              description.node_count,
                                              description.coloring.size()));
    }

    RegionGraph out;
    for (NodeId id = 0; id < description.node_count; id++) {
        if (description.coloring.at(id).index < 0) {
            throw MalformedGraphError(fmt::format("Region {} has invalid color index {}", id,
                                                  description.coloring.at(id).index));
        }
        out.nodes_[id] = Node{.id = id, .color = description.coloring.at(id), .neighbors = {}};
    }

    for (const Edge &edge : description.edges) {
        const bool is_a_known = edge.node_a >= 0 && edge.node_a < description.node_count;
        const bool is_b_known = edge.node_b >= 0 && edge.node_b < description.node_count;
        if (!is_a_known || !is_b_known) {
            throw MalformedGraphError(fmt::format("Edge ({}, {}) references an unknown region",
                                                  edge.node_a, edge.node_b));
        }
        if (edge.node_a == edge.node_b) {
            throw MalformedGraphError(
                fmt::format("Region {} cannot be adjacent to itself", edge.node_a));
        }
        out.nodes_.at(edge.node_a).neighbors.push_back(edge.node_b);
        out.nodes_.at(edge.node_b).neighbors.push_back(edge.node_a);
    }

    for (auto &[id, node] : out.nodes_) {
        std::sort(node.neighbors.begin(), node.neighbors.end());
        const auto repeated = std::adjacent_find(node.neighbors.begin(), node.neighbors.end());
        if (repeated != node.neighbors.end()) {
            throw MalformedGraphError(
                fmt::format("Edge ({}, {}) is listed more than once", id, *repeated));
        }
    }

    if (!is_connected(out.nodes_)) {
        throw MalformedGraphError("The regions of a puzzle must be connected");
    }

    RegionGraph collapsed = out.collapsed();
    KAMI_CHECK(collapsed.is_stable(), "Adjacent regions share a color after collapse");
    return collapsed;
}

int RegionGraph::num_edges() const {
    int num_endpoints = 0;
    for (const auto &[id, node] : nodes_) {
        num_endpoints += node.neighbors.size();
    }
    return num_endpoints / 2;
}

std::vector<Color> RegionGraph::colors_present() const {
    std::vector<Color> out;
    for (const auto &[id, node] : nodes_) {
        out.push_back(node.color);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool RegionGraph::is_stable() const {
    for (const auto &[id, node] : nodes_) {
        for (const NodeId neighbor : node.neighbors) {
            if (nodes_.at(neighbor).color == node.color) {
                return false;
            }
        }
    }
    return true;
}

RegionGraph RegionGraph::recolored(const Move &move) const {
    const auto iter = nodes_.find(move.target);
    if (iter == nodes_.end()) {
        throw InvalidMoveError(fmt::format("Node {} is not a live region", move.target));
    }
    if (iter->second.color == move.color) {
        throw InvalidMoveError(
            fmt::format("Node {} is already {}", move.target, to_string(move.color)));
    }

    RegionGraph out = *this;
    out.nodes_.at(move.target).color = move.color;
    out.collapse(move.target);
    KAMI_CHECK(out.is_stable(), "Adjacent regions share a color after recoloring", move.target);
    return out;
}

RegionGraph RegionGraph::collapsed() const {
    RegionGraph out = *this;
    // Ids are visited in ascending order, so the survivor of each component is its lowest id
    for (const auto &[id, node] : nodes_) {
        if (out.contains(id)) {
            out.collapse(id);
        }
    }
    return out;
}

void RegionGraph::collapse(const NodeId survivor_id) {
    const Color color = nodes_.at(survivor_id).color;

    // Flood fill through the subgraph induced by regions of the survivor's color
    std::set<NodeId> component;
    std::vector<NodeId> to_visit = {survivor_id};
    while (!to_visit.empty()) {
        const NodeId id = to_visit.back();
        to_visit.pop_back();
        if (!component.insert(id).second) {
            continue;
        }
        for (const NodeId neighbor : nodes_.at(id).neighbors) {
            if (!component.contains(neighbor) && nodes_.at(neighbor).color == color) {
                to_visit.push_back(neighbor);
            }
        }
    }

    if (component.size() == 1) {
        return;
    }

    std::set<NodeId> external_neighbors;
    for (const NodeId id : component) {
        for (const NodeId neighbor : nodes_.at(id).neighbors) {
            if (!component.contains(neighbor)) {
                external_neighbors.insert(neighbor);
            }
        }
    }

    for (const NodeId id : component) {
        if (id != survivor_id) {
            nodes_.erase(id);
        }
    }

    // Point the surrounding regions at the survivor
    for (const NodeId neighbor_id : external_neighbors) {
        std::vector<NodeId> &neighbors = nodes_.at(neighbor_id).neighbors;
        std::erase_if(neighbors, [&component](const NodeId id) { return component.contains(id); });
        neighbors.push_back(survivor_id);
        std::sort(neighbors.begin(), neighbors.end());
    }

    nodes_.at(survivor_id).neighbors =
        std::vector<NodeId>(external_neighbors.begin(), external_neighbors.end());
}

RegionGraph build_puzzle(const PuzzleDescription &description) {
    return RegionGraph::create(description);
}

std::string describe(const RegionGraph &graph) {
    std::string out;
    for (const auto &[id, node] : graph.nodes()) {
        out += fmt::format("Node {}: Color {}, Neighbors [{}]\n", id, to_string(node.color),
                           fmt::join(node.neighbors, ", "));
    }
    return out;
}

}  // namespace kami::domain
