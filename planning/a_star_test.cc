
#include "planning/a_star.hh"

#include <array>
#include <cmath>
#include <tuple>

#include "gtest/gtest.h"

namespace std {
// Add a std::hash specialization for tuple<int, int>
template <>
struct hash<tuple<int, int>> {
    size_t operator()(const tuple<int, int> &item) const {
        hash<int> int_hasher;
        const auto &[a, b] = item;
        return int_hasher(a) ^ (int_hasher(b) << 4);
    }
};

}  // namespace std

namespace kami::planning {
namespace {
const auto identity = [](const auto &state) { return state; };
}

TEST(AStarTest, uninformed_search) {
    // SETUP
    // Reach 10 from 1 where each step either adds one or doubles
    auto successor_func = [](const int &value) -> std::vector<Successor<int>> {
        return {
            {.state = value + 1, .edge_cost = 1.0},
            {.state = 2 * value, .edge_cost = 1.0},
        };
    };
    auto heuristic_func = [](const int &) -> double { return 0; };
    auto termination_check = [](const int &value) { return value == 10; };

    // ACTION
    const auto result = a_star<int>(1, successor_func, heuristic_func, termination_check, identity);

    // VERIFICATION
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states, (std::vector<int>{1, 2, 4, 5, 10}));
    EXPECT_EQ(result->cost, 4);
}

TEST(AStarTest, heuristic_reduces_expansions_around_wall) {
    // SETUP
    using Cell = std::tuple<int, int>;
    constexpr Cell INITIAL_STATE{0, 0};
    constexpr Cell GOAL{6, 0};
    auto successor_func = [](const Cell &cell) -> std::vector<Successor<Cell>> {
        const auto [cell_x, cell_y] = cell;
        std::vector<Successor<Cell>> out;
        for (const auto &[delta_x, delta_y] :
             std::array<Cell, 4>{{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}}) {
            const int next_x = cell_x + delta_x;
            const int next_y = cell_y + delta_y;
            // A wall at x = 3 spanning -2 <= y <= 2
            if (next_x == 3 && std::abs(next_y) <= 2) {
                continue;
            }
            out.push_back({.state = {next_x, next_y}, .edge_cost = 1.0});
        }
        return out;
    };
    auto zero_heuristic = [](const Cell &) -> double { return 0; };
    auto manhattan_heuristic = [GOAL = GOAL](const Cell &cell) -> double {
        return std::abs(std::get<0>(GOAL) - std::get<0>(cell)) +
               std::abs(std::get<1>(GOAL) - std::get<1>(cell));
    };
    auto termination_check = [GOAL = GOAL](const Cell &cell) { return cell == GOAL; };

    // ACTION
    const auto uninformed =
        a_star<Cell>(INITIAL_STATE, successor_func, zero_heuristic, termination_check, identity);
    const auto informed = a_star<Cell>(INITIAL_STATE, successor_func, manhattan_heuristic,
                                       termination_check, identity);

    // VERIFICATION
    ASSERT_TRUE(uninformed.has_value());
    ASSERT_TRUE(informed.has_value());
    // Around the end of the wall and back
    EXPECT_EQ(uninformed->cost, 12);
    EXPECT_EQ(informed->cost, 12);
    EXPECT_EQ(informed->states.size(), 13);
    EXPECT_EQ(informed->states.front(), INITIAL_STATE);
    EXPECT_EQ(informed->states.back(), GOAL);
    EXPECT_LT(informed->num_nodes_expanded, uninformed->num_nodes_expanded);
}

TEST(AStarTest, states_with_equal_keys_are_merged) {
    // SETUP
    // A state is a position on a line together with the number of steps taken to reach it. Keying
    // on the position alone keeps the search finite.
    using Walk = std::tuple<int, int>;
    auto successor_func = [](const Walk &walk) -> std::vector<Successor<Walk>> {
        const auto [position, num_steps] = walk;
        return {
            {.state = {position - 1, num_steps + 1}, .edge_cost = 1.0},
            {.state = {position + 1, num_steps + 1}, .edge_cost = 1.0},
        };
    };
    auto heuristic_func = [](const Walk &walk) -> double {
        return std::abs(4 - std::get<0>(walk));
    };
    auto termination_check = [](const Walk &walk) { return std::get<0>(walk) == 4; };
    auto position_key = [](const Walk &walk) { return std::get<0>(walk); };

    // ACTION
    const auto result =
        a_star<Walk>(Walk{0, 0}, successor_func, heuristic_func, termination_check, position_key);

    // VERIFICATION
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cost, 4);
    EXPECT_EQ(result->states.back(), (Walk{4, 4}));
}

TEST(AStarTest, unreachable_goal_returns_nullopt) {
    // SETUP
    auto successor_func = [](const int &node) -> std::vector<Successor<int>> {
        if (node >= 3) {
            return {};
        }
        return {{.state = node + 1, .edge_cost = 1.0}};
    };
    auto heuristic_func = [](const int &) -> double { return 0; };
    auto termination_check = [](const int &node) { return node == 10; };

    // ACTION
    const auto result = a_star<int>(0, successor_func, heuristic_func, termination_check, identity);

    // VERIFICATION
    EXPECT_FALSE(result.has_value());
}
}  // namespace kami::planning
