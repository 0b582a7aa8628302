
#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/color.hh"
#include "domain/move.hh"

namespace kami::domain {

// An undirected adjacency between two regions. The order of the endpoints does not matter.
struct Edge {
    NodeId node_a;
    NodeId node_b;

    bool operator==(const Edge &other) const = default;
};

// Everything needed to build a puzzle. Regions are identified by 0 ... node_count - 1 and
// `coloring[i]` is the color of region i.
struct PuzzleDescription {
    int node_count;
    std::vector<Edge> edges;
    std::vector<Color> coloring;
};

// The state of a puzzle: a connected graph of uniformly colored regions. In a stable graph no two
// adjacent regions share a color. A RegionGraph is never modified in place after it is created;
// applying a move produces a new graph.
class RegionGraph {
   public:
    struct Node {
        NodeId id;
        Color color;
        // Sorted, without duplicates
        std::vector<NodeId> neighbors;

        bool operator==(const Node &other) const = default;
    };

    // Builds the puzzle and merges adjacent regions that share a color. Each merged region keeps
    // the lowest id among its members.
    // Throws MalformedGraphError if an edge references an unknown region, is a self loop or is
    // listed more than once (in either order), if the coloring does not cover every region or
    // holds a negative color index, or if the regions are not connected.
    static RegionGraph create(const PuzzleDescription &description);

    const std::map<NodeId, Node> &nodes() const { return nodes_; }

    // Throws std::out_of_range if the region is not live
    const Node &node(const NodeId id) const { return nodes_.at(id); }
    Color color(const NodeId id) const { return node(id).color; }
    const std::vector<NodeId> &neighbors(const NodeId id) const { return node(id).neighbors; }

    bool contains(const NodeId id) const { return nodes_.contains(id); }
    int num_nodes() const { return static_cast<int>(nodes_.size()); }
    int num_edges() const;

    // The distinct colors of the live regions, in ascending order
    std::vector<Color> colors_present() const;

    bool is_solved() const { return nodes_.size() == 1; }

    // True if no two adjacent regions share a color
    bool is_stable() const;

    // Returns the graph that results from recoloring `move.target` and merging the same colored
    // component that contains it. The recolored region survives the merge.
    // Throws InvalidMoveError if the target is not live or already has the requested color.
    RegionGraph recolored(const Move &move) const;

    // Returns a copy where every same colored connected component has been merged into the member
    // with the lowest id. Collapsing a stable graph returns an identical graph.
    RegionGraph collapsed() const;

    bool operator==(const RegionGraph &other) const = default;

   private:
    RegionGraph() = default;

    // Merge the component of regions reachable from `survivor_id` through regions that share its
    // color into `survivor_id`.
    void collapse(const NodeId survivor_id);

    std::map<NodeId, Node> nodes_;
};

// Equivalent to RegionGraph::create
RegionGraph build_puzzle(const PuzzleDescription &description);

// One line per live region: "Node <id>: Color <COLOR>, Neighbors [a, b, ...]"
std::string describe(const RegionGraph &graph);

}  // namespace kami::domain
