
#include "domain/planarity.hh"

#include <algorithm>
#include <numeric>
#include <utility>

#include "boost/graph/adjacency_list.hpp"
#include "boost/graph/boyer_myrvold_planar_test.hpp"
#include "domain/errors.hh"
#include "fmt/format.h"

namespace kami::domain {
namespace {
using BoostGraph = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS>;

std::vector<std::pair<int, int>> normalized_edges(const int node_count,
                                                  const std::vector<Edge> &edges) {
    std::vector<std::pair<int, int>> out;
    out.reserve(edges.size());
    for (const Edge &edge : edges) {
        if (edge.node_a < 0 || edge.node_a >= node_count || edge.node_b < 0 ||
            edge.node_b >= node_count) {
            throw MalformedGraphError(fmt::format("Edge ({}, {}) references an unknown region",
                                                  edge.node_a, edge.node_b));
        }
        if (edge.node_a == edge.node_b) {
            throw MalformedGraphError(
                fmt::format("Region {} cannot be adjacent to itself", edge.node_a));
        }
        out.emplace_back(std::min(edge.node_a, edge.node_b), std::max(edge.node_a, edge.node_b));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}
}  // namespace

bool is_planar(const int node_count, const std::vector<Edge> &edges) {
    const auto unique_edges = normalized_edges(node_count, edges);
    // Every simple planar graph with at least 3 vertices has at most 3V - 6 edges
    if (node_count >= 3 && static_cast<int>(unique_edges.size()) > 3 * node_count - 6) {
        return false;
    }

    BoostGraph graph(node_count);
    for (const auto &[a, b] : unique_edges) {
        boost::add_edge(a, b, graph);
    }
    return boost::boyer_myrvold_planarity_test(graph);
}

bool is_connected(const int node_count, const std::vector<Edge> &edges) {
    if (node_count <= 0) {
        return false;
    }
    // Union find over the regions
    std::vector<int> parent(node_count);
    std::iota(parent.begin(), parent.end(), 0);
    const auto find_root = [&parent](int idx) {
        while (parent.at(idx) != idx) {
            parent.at(idx) = parent.at(parent.at(idx));
            idx = parent.at(idx);
        }
        return idx;
    };

    int num_components = node_count;
    for (const auto &[a, b] : normalized_edges(node_count, edges)) {
        const int root_a = find_root(a);
        const int root_b = find_root(b);
        if (root_a != root_b) {
            parent.at(root_a) = root_b;
            num_components--;
        }
    }
    return num_components == 1;
}

}  // namespace kami::domain
