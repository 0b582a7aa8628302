
#include "generation/hardest_puzzle.hh"

#include <algorithm>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "BS_thread_pool.hpp"
#include "domain/canonical_signature.hh"
#include "domain/errors.hh"
#include "fmt/format.h"
#include "generation/enumeration.hh"
#include "planning/heuristics.hh"

namespace kami::generation {
namespace {

// The best record found by any shard
class BestRecord {
   public:
    struct Bound {
        int num_moves;
        EnumerationPosition position;
    };

    std::optional<Bound> bound() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!maybe_record_.has_value()) {
            return std::nullopt;
        }
        return Bound{.num_moves = maybe_record_->num_moves(),
                     .position = maybe_record_->position};
    }

    void offer(HardestPuzzleRecord candidate) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!maybe_record_.has_value() || is_better(candidate, maybe_record_.value())) {
            maybe_record_ = std::move(candidate);
        }
    }

    std::optional<HardestPuzzleRecord> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(maybe_record_);
    }

   private:
    static bool is_better(const HardestPuzzleRecord &a, const HardestPuzzleRecord &b) {
        if (a.num_moves() != b.num_moves()) {
            return a.num_moves() > b.num_moves();
        }
        return a.position < b.position;
    }

    mutable std::mutex mutex_;
    std::optional<HardestPuzzleRecord> maybe_record_;
};

// Moves needed by an instance, if it can beat the current best. An instance beats the best if it
// needs more moves, or as many moves and comes earlier in the enumeration.
std::optional<std::vector<domain::Move>> solve_if_harder(
    const domain::RegionGraph &puzzle, const EnumerationPosition &position,
    const std::optional<BestRecord::Bound> &maybe_bound, planning::SolverOptions solver_options) {
    if (maybe_bound.has_value()) {
        const BestRecord::Bound &bound = maybe_bound.value();
        const int max_uninteresting_moves =
            position < bound.position ? bound.num_moves - 1 : bound.num_moves;
        const int lower_bound = planning::color_count_heuristic(puzzle);
        if (max_uninteresting_moves >= 0 && lower_bound <= max_uninteresting_moves) {
            // Only look as deep as the current best. If a solution is found there, this instance
            // cannot replace it.
            solver_options.max_moves = max_uninteresting_moves;
            if (planning::solve_within(puzzle, solver_options).has_value()) {
                return std::nullopt;
            }
        }
    }

    solver_options.max_moves = std::nullopt;
    auto maybe_solution = planning::solve_within(puzzle, solver_options);
    if (!maybe_solution.has_value()) {
        throw domain::UnsolvableError(fmt::format(
            "Exhausted every state reachable from the instance at mask {} coloring {}",
            position.mask, position.coloring_idx));
    }
    return std::move(maybe_solution->moves);
}

struct ShardContext {
    int node_count;
    int color_count;
    int shard_idx;
    int num_shards;
};

void search_shard(const ShardContext &context, const GeneratorOptions &options,
                  BestRecord &best, const std::function<void(std::uint64_t)> &report_progress) {
    // Holds only the instances themselves, so it grows with the number of distinct instances
    domain::SignatureCache instance_cache;
    std::unordered_set<domain::Signature> evaluated;
    planning::SolverOptions solver_options = options.solver_options;

    TopologyEnumerator topologies(context.node_count, context.shard_idx, context.num_shards);
    std::uint64_t num_masks_reported = 0;
    for (auto maybe_topology = topologies.next(); maybe_topology.has_value();
         maybe_topology = topologies.next()) {
        const auto &topology = maybe_topology.value();
        // Search states are only shared between colorings of the same topology
        domain::SignatureCache search_cache;
        solver_options.cache = &search_cache;
        ColoringEnumerator colorings(context.node_count, context.color_count);
        std::int64_t coloring_idx = 0;
        for (auto maybe_coloring = colorings.next(); maybe_coloring.has_value();
             maybe_coloring = colorings.next(), coloring_idx++) {
            domain::PuzzleDescription description{
                .node_count = context.node_count,
                .edges = topology.edges,
                .coloring = std::move(maybe_coloring.value()),
            };
            const domain::RegionGraph puzzle = domain::build_puzzle(description);

            if (options.skip_equivalent_instances) {
                const domain::Signature signature = domain::compute_signature(
                    puzzle, solver_options.signature_mode, instance_cache);
                if (!evaluated.insert(signature).second) {
                    continue;
                }
            }

            const EnumerationPosition position{.mask = topology.mask,
                                               .coloring_idx = coloring_idx};
            auto maybe_solution = solve_if_harder(puzzle, position, best.bound(), solver_options);
            if (!maybe_solution.has_value()) {
                continue;
            }
            best.offer(HardestPuzzleRecord{
                .description = std::move(description),
                .puzzle = puzzle,
                .solution = std::move(maybe_solution.value()),
                .position = position,
            });
        }
        report_progress(topologies.num_masks_consumed() - num_masks_reported);
        num_masks_reported = topologies.num_masks_consumed();
    }
    report_progress(topologies.num_masks_consumed() - num_masks_reported);
}
}  // namespace

std::optional<HardestPuzzleRecord> find_hardest(const int node_count, const int color_count,
                                                const GeneratorOptions &options) {
    const int num_shards = std::max(options.num_threads, 1);
    const std::uint64_t num_masks = TopologyEnumerator(node_count).num_masks();

    BestRecord best;
    std::mutex progress_mutex;
    std::uint64_t num_masks_done = 0;
    const auto report_progress = [&](const std::uint64_t num_new_masks) {
        if (num_new_masks == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(progress_mutex);
        num_masks_done += num_new_masks;
        options.progress(num_masks_done, num_masks);
    };

    if (num_shards == 1) {
        search_shard({.node_count = node_count,
                      .color_count = color_count,
                      .shard_idx = 0,
                      .num_shards = 1},
                     options, best, report_progress);
        return best.take();
    }

    BS::thread_pool pool(num_shards);
    std::vector<std::future<void>> shard_futures;
    for (int shard_idx = 0; shard_idx < num_shards; shard_idx++) {
        shard_futures.push_back(pool.submit_task([&, shard_idx]() {
            search_shard({.node_count = node_count,
                          .color_count = color_count,
                          .shard_idx = shard_idx,
                          .num_shards = num_shards},
                         options, best, report_progress);
        }));
    }
    // Rethrows the first failure of any shard
    for (auto &shard_future : shard_futures) {
        shard_future.get();
    }
    return best.take();
}

}  // namespace kami::generation
