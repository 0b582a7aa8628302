
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "domain/color.hh"
#include "domain/region_graph.hh"

namespace kami::generation {

// Lazily enumerates the connected planar simple graphs on regions 0 ... node_count - 1. Each
// graph is identified by a bit mask over the node_count * (node_count - 1) / 2 possible edges,
// taken in lexicographic order (0, 1), (0, 2), ..., (1, 2), .... Masks are visited in increasing
// order. The enumeration can be split into `num_shards` interleaved shards, where shard i visits
// the masks congruent to i.
class TopologyEnumerator {
   public:
    struct Topology {
        std::uint64_t mask;
        std::vector<domain::Edge> edges;
    };

    // Throws std::invalid_argument if there are too many possible edges to enumerate
    explicit TopologyEnumerator(const int node_count, const int shard_idx = 0,
                                const int num_shards = 1);

    // Returns the next connected planar graph in this shard, or std::nullopt when exhausted
    std::optional<Topology> next();

    // Start again from the first mask of the shard
    void reset();

    // The number of masks this shard has stepped past, including rejected ones
    std::uint64_t num_masks_consumed() const { return num_consumed_; }

    // The number of masks over all shards
    std::uint64_t num_masks() const { return std::uint64_t{1} << all_edges_.size(); }

    const std::vector<domain::Edge> &all_edges() const { return all_edges_; }

   private:
    int node_count_;
    int shard_idx_;
    int num_shards_;
    std::vector<domain::Edge> all_edges_;
    std::uint64_t next_mask_;
    std::uint64_t num_consumed_;
};

// Lazily enumerates the colorings of node_count regions that use exactly num_colors colors, up to
// renaming the colors. A coloring is produced as a restricted growth string: region 0 gets the
// first color, and each region either reuses a color seen earlier or takes the lowest color not
// yet used. Colorings are produced in lexicographic order.
class ColoringEnumerator {
   public:
    ColoringEnumerator(const int node_count, const int num_colors);

    // Returns the next coloring, or std::nullopt when exhausted
    std::optional<std::vector<domain::Color>> next();

    void reset();

   private:
    int node_count_;
    int num_colors_;
    std::optional<std::vector<int>> maybe_current_;
    bool is_started_;
};

}  // namespace kami::generation
