
#include "domain/puzzle_library.hh"

#include <algorithm>

#include "gtest/gtest.h"

namespace kami::domain {

TEST(PuzzleLibraryTest, puzzle_3_3_is_available) {
    // Action
    const auto names = puzzle_names();
    const auto maybe_description = find_puzzle("3-3");

    // Verification
    EXPECT_NE(std::find(names.begin(), names.end(), "3-3"), names.end());
    ASSERT_TRUE(maybe_description.has_value());
    const RegionGraph puzzle = build_puzzle(maybe_description.value());
    EXPECT_EQ(puzzle.num_nodes(), 11);
    EXPECT_EQ(puzzle.colors_present().size(), 4);
    EXPECT_EQ(puzzle.neighbors(3).size(), 8);
}

TEST(PuzzleLibraryTest, unknown_puzzle_is_not_found) {
    // Action + Verification
    EXPECT_FALSE(find_puzzle("no such puzzle").has_value());
}

}  // namespace kami::domain
