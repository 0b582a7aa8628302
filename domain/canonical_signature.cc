
#include "domain/canonical_signature.hh"

#include <algorithm>
#include <functional>
#include <unordered_set>

#include "boost/container_hash/hash.hpp"

namespace kami::domain {
namespace {
std::uint64_t initial_label(const Color color) {
    std::size_t seed = 0;
    boost::hash_combine(seed, color.index);
    return seed;
}

int count_distinct(const std::vector<std::uint64_t> &labels) {
    return std::unordered_set<std::uint64_t>(labels.begin(), labels.end()).size();
}

// Maps each live id to its position in ascending id order
std::unordered_map<NodeId, int> index_from_id(const RegionGraph &graph) {
    std::unordered_map<NodeId, int> out;
    for (const auto &[id, node] : graph.nodes()) {
        out.emplace(id, out.size());
    }
    return out;
}

std::vector<std::uint64_t> refine_once(const RegionGraph &graph,
                                       const std::unordered_map<NodeId, int> &idx_from_id,
                                       const std::vector<std::uint64_t> &labels) {
    std::vector<std::uint64_t> out;
    out.reserve(labels.size());
    std::vector<std::uint64_t> neighbor_labels;
    for (const auto &[id, node] : graph.nodes()) {
        neighbor_labels.clear();
        for (const NodeId neighbor : node.neighbors) {
            neighbor_labels.push_back(labels.at(idx_from_id.at(neighbor)));
        }
        std::sort(neighbor_labels.begin(), neighbor_labels.end());

        std::size_t seed = labels.at(idx_from_id.at(id));
        boost::hash_range(seed, neighbor_labels.begin(), neighbor_labels.end());
        out.push_back(seed);
    }
    return out;
}
}  // namespace

Refinement refine_labels(const RegionGraph &graph, const int max_rounds) {
    const auto idx_from_id = index_from_id(graph);
    std::vector<std::uint64_t> labels;
    labels.reserve(graph.num_nodes());
    for (const auto &[id, node] : graph.nodes()) {
        labels.push_back(initial_label(node.color));
    }

    const int round_limit = std::min(max_rounds, graph.num_nodes());
    int num_classes = count_distinct(labels);
    int num_rounds = 0;
    while (num_rounds < round_limit) {
        std::vector<std::uint64_t> next = refine_once(graph, idx_from_id, labels);
        num_rounds++;
        const int next_num_classes = count_distinct(next);
        labels = std::move(next);
        if (next_num_classes == num_classes) {
            break;
        }
        num_classes = next_num_classes;
    }
    return {.labels = std::move(labels), .num_rounds = num_rounds};
}

std::uint64_t hash_labels(const std::vector<std::uint64_t> &labels) {
    std::vector<std::uint64_t> sorted_labels = labels;
    std::sort(sorted_labels.begin(), sorted_labels.end());
    std::size_t seed = sorted_labels.size();
    boost::hash_range(seed, sorted_labels.begin(), sorted_labels.end());
    return seed;
}

Signature exact_signature(const RegionGraph &graph, SignatureCache &cache) {
    const Refinement refinement = refine_labels(graph, graph.num_nodes());
    const std::uint64_t hash = hash_labels(refinement.labels);
    return {
        .hash = hash,
        .isomorphism_class =
            cache.isomorphism_class(hash, graph, refinement.labels, refinement.num_rounds),
    };
}

Signature fuzzy_signature(const RegionGraph &graph) {
    const auto idx_from_id = index_from_id(graph);
    std::vector<std::uint64_t> colors;
    colors.reserve(graph.num_nodes());
    for (const auto &[id, node] : graph.nodes()) {
        colors.push_back(initial_label(node.color));
    }
    return {.hash = hash_labels(refine_once(graph, idx_from_id, colors)), .isomorphism_class = 0};
}

Signature compute_signature(const RegionGraph &graph, const SignatureMode mode,
                            SignatureCache &cache) {
    switch (mode) {
        case SignatureMode::EXACT:
            return exact_signature(graph, cache);
        case SignatureMode::FUZZY:
            return fuzzy_signature(graph);
    }
    return exact_signature(graph, cache);
}

int SignatureCache::isomorphism_class(const std::uint64_t hash, const RegionGraph &graph,
                                      const std::vector<std::uint64_t> &labels,
                                      const int num_rounds) {
    const auto idx_from_id = index_from_id(graph);
    CanonicalGraph canonical{
        .colors = {}, .neighbors = {}, .labels = labels, .num_rounds = num_rounds};
    for (const auto &[id, node] : graph.nodes()) {
        canonical.colors.push_back(node.color);
        std::vector<int> &neighbors = canonical.neighbors.emplace_back();
        for (const NodeId neighbor : node.neighbors) {
            neighbors.push_back(idx_from_id.at(neighbor));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CanonicalGraph> &bucket = graphs_from_hash_[hash];
    for (int i = 0; i < static_cast<int>(bucket.size()); i++) {
        if (are_isomorphic(bucket.at(i), canonical)) {
            return i;
        }
    }
    bucket.push_back(std::move(canonical));
    size_++;
    return bucket.size() - 1;
}

int SignatureCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

bool SignatureCache::are_isomorphic(const CanonicalGraph &a, const CanonicalGraph &b) {
    const int num_nodes = a.colors.size();
    if (num_nodes != static_cast<int>(b.colors.size()) || a.num_rounds != b.num_rounds) {
        return false;
    }

    std::vector<char> b_adjacent(num_nodes * num_nodes, 0);
    for (int i = 0; i < num_nodes; i++) {
        for (const int j : b.neighbors.at(i)) {
            b_adjacent.at(i * num_nodes + j) = 1;
        }
    }

    // Visit the regions of `a` in breadth first order so that each region after the first has an
    // already mapped neighbor to constrain its candidates.
    std::vector<int> order;
    std::vector<char> is_ordered(num_nodes, 0);
    for (int root = 0; root < num_nodes; root++) {
        if (is_ordered.at(root)) {
            continue;
        }
        is_ordered.at(root) = 1;
        order.push_back(root);
        for (int head = order.size() - 1; head < static_cast<int>(order.size()); head++) {
            for (const int neighbor : a.neighbors.at(order.at(head))) {
                if (!is_ordered.at(neighbor)) {
                    is_ordered.at(neighbor) = 1;
                    order.push_back(neighbor);
                }
            }
        }
    }

    std::vector<int> b_from_a(num_nodes, -1);
    std::vector<char> is_b_used(num_nodes, 0);
    const std::function<bool(int)> extend = [&](const int depth) -> bool {
        if (depth == num_nodes) {
            return true;
        }
        const int a_idx = order.at(depth);
        for (int b_idx = 0; b_idx < num_nodes; b_idx++) {
            const bool is_candidate = !is_b_used.at(b_idx) &&
                                      a.labels.at(a_idx) == b.labels.at(b_idx) &&
                                      a.colors.at(a_idx) == b.colors.at(b_idx) &&
                                      a.neighbors.at(a_idx).size() == b.neighbors.at(b_idx).size();
            if (!is_candidate) {
                continue;
            }

            // Every mapped neighbor of a_idx must map to a neighbor of b_idx, and b_idx must have
            // no other mapped neighbors.
            int num_mapped_a_neighbors = 0;
            bool is_consistent = true;
            for (const int a_neighbor : a.neighbors.at(a_idx)) {
                const int mapped = b_from_a.at(a_neighbor);
                if (mapped < 0) {
                    continue;
                }
                num_mapped_a_neighbors++;
                if (!b_adjacent.at(b_idx * num_nodes + mapped)) {
                    is_consistent = false;
                    break;
                }
            }
            if (!is_consistent) {
                continue;
            }
            int num_mapped_b_neighbors = 0;
            for (const int b_neighbor : b.neighbors.at(b_idx)) {
                num_mapped_b_neighbors += is_b_used.at(b_neighbor);
            }
            if (num_mapped_a_neighbors != num_mapped_b_neighbors) {
                continue;
            }

            b_from_a.at(a_idx) = b_idx;
            is_b_used.at(b_idx) = 1;
            if (extend(depth + 1)) {
                return true;
            }
            b_from_a.at(a_idx) = -1;
            is_b_used.at(b_idx) = 0;
        }
        return false;
    };
    return extend(0);
}

}  // namespace kami::domain
