
#include "generation/enumeration.hh"

#include <algorithm>
#include <stdexcept>

#include "domain/planarity.hh"
#include "fmt/format.h"

namespace kami::generation {
namespace {
constexpr int MAX_NUM_POSSIBLE_EDGES = 62;

std::vector<domain::Edge> edges_in_mask(const std::vector<domain::Edge> &all_edges,
                                        const std::uint64_t mask) {
    std::vector<domain::Edge> out;
    for (int i = 0; i < static_cast<int>(all_edges.size()); i++) {
        if (mask & (std::uint64_t{1} << i)) {
            out.push_back(all_edges.at(i));
        }
    }
    return out;
}

// Fills positions [start, end) with the smallest suffix that brings the number of colors used
// from `num_used` up to `num_colors`
void fill_smallest_suffix(const int start, const int num_used, const int num_colors,
                          std::vector<int> &coloring) {
    const int end = coloring.size();
    const int num_new = num_colors - num_used;
    for (int i = start; i < end; i++) {
        const int idx_from_end = end - i;
        coloring.at(i) = idx_from_end <= num_new ? num_colors - idx_from_end : 0;
    }
}
}  // namespace

TopologyEnumerator::TopologyEnumerator(const int node_count, const int shard_idx,
                                       const int num_shards)
    : node_count_(node_count), shard_idx_(shard_idx), num_shards_(num_shards) {
    if (node_count < 1) {
        throw std::invalid_argument(
            fmt::format("Need at least one region, got {}", node_count));
    }
    if (num_shards < 1 || shard_idx < 0 || shard_idx >= num_shards) {
        throw std::invalid_argument(
            fmt::format("Invalid shard {} of {}", shard_idx, num_shards));
    }
    for (int a = 0; a < node_count; a++) {
        for (int b = a + 1; b < node_count; b++) {
            all_edges_.push_back(domain::Edge{.node_a = a, .node_b = b});
        }
    }
    if (static_cast<int>(all_edges_.size()) > MAX_NUM_POSSIBLE_EDGES) {
        throw std::invalid_argument(
            fmt::format("Cannot enumerate graphs on {} regions", node_count));
    }
    reset();
}

void TopologyEnumerator::reset() {
    next_mask_ = shard_idx_;
    num_consumed_ = 0;
}

std::optional<TopologyEnumerator::Topology> TopologyEnumerator::next() {
    while (next_mask_ < num_masks()) {
        const std::uint64_t mask = next_mask_;
        next_mask_ += num_shards_;
        num_consumed_++;

        std::vector<domain::Edge> edges = edges_in_mask(all_edges_, mask);
        if (!domain::is_connected(node_count_, edges) || !domain::is_planar(node_count_, edges)) {
            continue;
        }
        return Topology{.mask = mask, .edges = std::move(edges)};
    }
    return std::nullopt;
}

ColoringEnumerator::ColoringEnumerator(const int node_count, const int num_colors)
    : node_count_(node_count), num_colors_(num_colors) {
    reset();
}

void ColoringEnumerator::reset() {
    is_started_ = false;
    maybe_current_.reset();
}

std::optional<std::vector<domain::Color>> ColoringEnumerator::next() {
    if (!is_started_) {
        is_started_ = true;
        if (num_colors_ >= 1 && num_colors_ <= node_count_) {
            std::vector<int> first(node_count_, 0);
            fill_smallest_suffix(1, 1, num_colors_, first);
            maybe_current_ = std::move(first);
        }
    } else if (maybe_current_.has_value()) {
        std::vector<int> &coloring = maybe_current_.value();
        // max_before.at(i) is the largest color used by regions 0 ... i - 1
        std::vector<int> max_before(node_count_, 0);
        for (int i = 1; i < node_count_; i++) {
            max_before.at(i) = std::max(max_before.at(i - 1), coloring.at(i - 1));
        }

        bool has_successor = false;
        for (int i = node_count_ - 1; i >= 1 && !has_successor; i--) {
            const int limit = std::min(max_before.at(i) + 1, num_colors_ - 1);
            const int num_remaining = node_count_ - 1 - i;
            for (int candidate = coloring.at(i) + 1; candidate <= limit && !has_successor;
                 candidate++) {
                const int num_used = std::max(max_before.at(i), candidate) + 1;
                if (num_colors_ - num_used > num_remaining) {
                    continue;
                }
                coloring.at(i) = candidate;
                fill_smallest_suffix(i + 1, num_used, num_colors_, coloring);
                has_successor = true;
            }
        }
        if (!has_successor) {
            maybe_current_.reset();
        }
    }

    if (!maybe_current_.has_value()) {
        return std::nullopt;
    }
    std::vector<domain::Color> out;
    out.reserve(node_count_);
    for (const int idx : maybe_current_.value()) {
        out.push_back(domain::color_from_index(idx));
    }
    return out;
}

}  // namespace kami::generation
