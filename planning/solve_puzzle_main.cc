
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "domain/puzzle_library.hh"
#include "domain/region_graph.hh"
#include "fmt/format.h"
#include "planning/puzzle_solver.hh"

namespace kami::planning {
namespace {
template <typename T>
T parse_enum(const std::string &name, const std::string &flag) {
    const auto maybe_value = wise_enum::from_string<T>(name);
    if (!maybe_value) {
        std::cout << "Unknown value for --" << flag << ": " << name << std::endl;
        std::exit(1);
    }
    return *maybe_value;
}
}  // namespace

void solve_named_puzzle(const std::string &name, const SolverOptions &options) {
    const auto maybe_description = domain::find_puzzle(name);
    if (!maybe_description.has_value()) {
        std::cout << "No puzzle named " << name << ". Known puzzles:" << std::endl;
        for (const auto &known_name : domain::puzzle_names()) {
            std::cout << "  " << known_name << std::endl;
        }
        std::exit(1);
    }

    const domain::RegionGraph puzzle = domain::build_puzzle(maybe_description.value());
    std::cout << "Initial puzzle state:" << std::endl << domain::describe(puzzle);
    if (!guarantees_minimal(options)) {
        std::cout << "Warning: these options may produce a solution with more moves than necessary"
                  << std::endl;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto maybe_solution = solve_within(puzzle, options);
    const auto dt = std::chrono::steady_clock::now() - start;

    if (!maybe_solution.has_value()) {
        std::cout << "No solution found." << std::endl;
        return;
    }
    std::cout << fmt::format("Solution found in {:.3f} seconds:",
                             std::chrono::duration<double>(dt).count())
              << std::endl;
    std::cout << domain::render_moves(maybe_solution->moves);
    std::cout << fmt::format("Total moves: {} ({} states expanded, {} visited)",
                             maybe_solution->moves.size(), maybe_solution->num_states_expanded,
                             maybe_solution->num_states_visited)
              << std::endl;
}
}  // namespace kami::planning

int main(const int argc, const char **argv) {
    // clang-format off
    cxxopts::Options options("solve_puzzle", "Find the shortest solution to a transcribed puzzle");
    options.add_options()
        ("puzzle", "Name of the puzzle to solve",
            cxxopts::value<std::string>()->default_value("3-3"))
        ("strategy", "BREADTH_FIRST or BEST_FIRST",
            cxxopts::value<std::string>()->default_value("BREADTH_FIRST"))
        ("heuristic", "COLOR_COUNT or MAX_EDGE_REDUCTION, may be repeated",
            cxxopts::value<std::vector<std::string>>()->default_value("COLOR_COUNT"))
        ("signature", "EXACT or FUZZY", cxxopts::value<std::string>()->default_value("EXACT"))
        ("max_moves", "Give up on solutions longer than this", cxxopts::value<int>())
        ("help", "Print Usage");
    // clang-format on

    auto args = options.parse(argc, argv);
    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    using kami::planning::parse_enum;
    kami::planning::SolverOptions solver_options = {
        .strategy = parse_enum<kami::planning::SearchStrategy>(args["strategy"].as<std::string>(),
                                                               "strategy"),
        .heuristics = {},
        .signature_mode = parse_enum<kami::domain::SignatureMode>(
            args["signature"].as<std::string>(), "signature"),
        .max_moves = std::nullopt,
        .cache = nullptr,
    };
    for (const auto &name : args["heuristic"].as<std::vector<std::string>>()) {
        solver_options.heuristics.push_back(
            parse_enum<kami::planning::Heuristic>(name, "heuristic"));
    }
    if (args.count("max_moves")) {
        solver_options.max_moves = args["max_moves"].as<int>();
    }

    kami::planning::solve_named_puzzle(args["puzzle"].as<std::string>(), solver_options);
}
