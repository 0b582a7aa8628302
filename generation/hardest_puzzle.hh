
#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "domain/move.hh"
#include "domain/region_graph.hh"
#include "planning/puzzle_solver.hh"

namespace kami::generation {

// Where an instance falls in the enumeration order: by topology mask, then by coloring
struct EnumerationPosition {
    std::uint64_t mask;
    std::int64_t coloring_idx;

    auto operator<=>(const EnumerationPosition &other) const = default;
};

struct HardestPuzzleRecord {
    domain::PuzzleDescription description;
    // The puzzle after merging adjacent regions of the same color
    domain::RegionGraph puzzle;
    // One solution with the fewest moves
    std::vector<domain::Move> solution;
    EnumerationPosition position;

    int num_moves() const { return solution.size(); }
};

struct GeneratorOptions {
    // Strategy, heuristics and signature mode used for every instance. The move limit and cache
    // are managed by the generator.
    planning::SolverOptions solver_options = {};
    // The topology enumeration is split into this many interleaved shards. Each shard owns its
    // signature caches; only the best record is shared. The cache of search states is dropped
    // after each topology, so memory is bounded by the states of one topology's colorings plus
    // one entry per distinct instance when skipping equivalent instances.
    int num_threads = 1;
    // Skip an instance if an instance with the same signature was already evaluated by the same
    // shard. With fuzzy signatures this may skip instances that are not equivalent.
    bool skip_equivalent_instances = false;
    // Called with the number of topology masks processed so far and the total number of masks.
    // Calls may come from worker threads but are never concurrent.
    std::function<void(std::uint64_t, std::uint64_t)> progress = [](const auto, const auto) {};
};

// Finds the connected planar puzzle on `node_count` regions, colored with exactly `color_count`
// colors, that needs the most moves to solve. Topologies are visited in increasing edge mask order
// and, for each, every coloring produced by ColoringEnumerator. When several instances need the
// same number of moves the first one in this order is returned, regardless of the number of
// threads. Returns std::nullopt if there are no instances.
std::optional<HardestPuzzleRecord> find_hardest(const int node_count, const int color_count,
                                                const GeneratorOptions &options = {});

}  // namespace kami::generation
