
#include "generation/hardest_puzzle.hh"

#include "domain/move_applicator.hh"
#include "gtest/gtest.h"

namespace kami::generation {
namespace {
std::vector<int> color_indices(const std::vector<domain::Color> &coloring) {
    std::vector<int> out;
    for (const domain::Color color : coloring) {
        out.push_back(color.index);
    }
    return out;
}

void expect_solution_solves_puzzle(const HardestPuzzleRecord &record) {
    const auto maybe_final = domain::apply_moves(record.puzzle, record.solution);
    ASSERT_TRUE(maybe_final.has_value());
    EXPECT_TRUE(maybe_final->is_solved());
}
}  // namespace

TEST(HardestPuzzleTest, five_regions_four_colors) {
    // Action
    const auto maybe_record = find_hardest(5, 4);

    // Verification
    ASSERT_TRUE(maybe_record.has_value());
    const auto &record = maybe_record.value();
    EXPECT_EQ(record.num_moves(), 3);
    // The star with two regions of the hub color merges into a hub with three leaves
    EXPECT_EQ(record.position, (EnumerationPosition{.mask = 15, .coloring_idx = 0}));
    const std::vector<domain::Edge> expected_edges = {{0, 1}, {0, 2}, {0, 3}, {0, 4}};
    EXPECT_EQ(record.description.edges, expected_edges);
    EXPECT_EQ(color_indices(record.description.coloring), (std::vector<int>{0, 0, 1, 2, 3}));
    EXPECT_EQ(record.puzzle.num_nodes(), 4);
    expect_solution_solves_puzzle(record);
}

TEST(HardestPuzzleTest, every_region_its_own_color) {
    // Action
    const auto maybe_record = find_hardest(5, 5);

    // Verification
    ASSERT_TRUE(maybe_record.has_value());
    EXPECT_EQ(maybe_record->num_moves(), 4);
    EXPECT_EQ(maybe_record->position, (EnumerationPosition{.mask = 15, .coloring_idx = 0}));
    expect_solution_solves_puzzle(maybe_record.value());
}

TEST(HardestPuzzleTest, small_instances) {
    // Action
    const auto maybe_two_regions = find_hardest(2, 1);
    const auto maybe_three_regions = find_hardest(3, 2);
    const auto maybe_four_regions = find_hardest(4, 3);

    // Verification
    ASSERT_TRUE(maybe_two_regions.has_value());
    EXPECT_EQ(maybe_two_regions->num_moves(), 0);
    ASSERT_TRUE(maybe_three_regions.has_value());
    EXPECT_EQ(maybe_three_regions->num_moves(), 1);
    EXPECT_EQ(maybe_three_regions->position, (EnumerationPosition{.mask = 3, .coloring_idx = 0}));
    ASSERT_TRUE(maybe_four_regions.has_value());
    EXPECT_EQ(maybe_four_regions->num_moves(), 2);
    EXPECT_EQ(maybe_four_regions->position, (EnumerationPosition{.mask = 7, .coloring_idx = 0}));
}

TEST(HardestPuzzleTest, more_colors_than_regions_has_no_instances) {
    EXPECT_FALSE(find_hardest(3, 4).has_value());
}

TEST(HardestPuzzleTest, threads_agree_with_single_threaded_search) {
    // Setup
    const GeneratorOptions options = {.num_threads = 3};

    // Action
    const auto maybe_single = find_hardest(5, 4);
    const auto maybe_parallel = find_hardest(5, 4, options);

    // Verification
    ASSERT_TRUE(maybe_single.has_value());
    ASSERT_TRUE(maybe_parallel.has_value());
    EXPECT_EQ(maybe_parallel->position, maybe_single->position);
    EXPECT_EQ(maybe_parallel->solution, maybe_single->solution);
    EXPECT_EQ(maybe_parallel->puzzle, maybe_single->puzzle);
}

TEST(HardestPuzzleTest, skipping_equivalent_instances_finds_same_difficulty) {
    // Setup
    const GeneratorOptions exact = {.skip_equivalent_instances = true};
    const GeneratorOptions fuzzy = {
        .solver_options = {.signature_mode = domain::SignatureMode::FUZZY},
        .skip_equivalent_instances = true,
    };

    // Action
    const auto maybe_exact = find_hardest(5, 4, exact);
    const auto maybe_fuzzy = find_hardest(5, 4, fuzzy);

    // Verification
    ASSERT_TRUE(maybe_exact.has_value());
    ASSERT_TRUE(maybe_fuzzy.has_value());
    EXPECT_EQ(maybe_exact->num_moves(), 3);
    EXPECT_EQ(maybe_exact->position, (EnumerationPosition{.mask = 15, .coloring_idx = 0}));
    EXPECT_EQ(maybe_fuzzy->num_moves(), 3);
    expect_solution_solves_puzzle(maybe_fuzzy.value());
}

TEST(HardestPuzzleTest, best_first_search_finds_same_difficulty) {
    // Setup
    const GeneratorOptions options = {
        .solver_options = {.strategy = planning::SearchStrategy::BEST_FIRST,
                           .heuristics = {planning::Heuristic::COLOR_COUNT}},
    };

    // Action
    const auto maybe_record = find_hardest(5, 4, options);

    // Verification
    ASSERT_TRUE(maybe_record.has_value());
    EXPECT_EQ(maybe_record->num_moves(), 3);
    expect_solution_solves_puzzle(maybe_record.value());
}

TEST(HardestPuzzleTest, generator_manages_its_own_signature_caches) {
    // Setup
    domain::SignatureCache caller_cache;
    const GeneratorOptions options = {
        .solver_options = {.cache = &caller_cache},
        .skip_equivalent_instances = true,
    };

    // Action
    const auto maybe_record = find_hardest(4, 3, options);

    // Verification
    ASSERT_TRUE(maybe_record.has_value());
    EXPECT_EQ(maybe_record->num_moves(), 2);
    EXPECT_EQ(caller_cache.size(), 0);
}

TEST(HardestPuzzleTest, progress_reaches_every_mask) {
    // Setup
    std::uint64_t last_done = 0;
    std::uint64_t last_total = 0;
    int num_calls = 0;
    const GeneratorOptions options = {
        .num_threads = 2,
        .progress =
            [&](const std::uint64_t done, const std::uint64_t total) {
                EXPECT_GT(done, last_done);
                last_done = done;
                last_total = total;
                num_calls++;
            },
    };

    // Action
    find_hardest(4, 2, options);

    // Verification
    EXPECT_GT(num_calls, 0);
    EXPECT_EQ(last_total, 64);
    EXPECT_EQ(last_done, 64);
}

}  // namespace kami::generation
