
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "cxxopts.hpp"
#include "domain/region_graph.hh"
#include "fmt/format.h"
#include "generation/hardest_puzzle.hh"

namespace kami::generation {
void report_hardest(const int node_count, const int color_count, const GeneratorOptions &options) {
    std::cout << fmt::format("Searching for hardest {}-region puzzle with {} colors...", node_count,
                             color_count)
              << std::endl;
    if (!planning::guarantees_minimal(options.solver_options)) {
        std::cout << "Warning: these options may under count the moves an instance needs"
                  << std::endl;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto maybe_record = find_hardest(node_count, color_count, options);
    const auto dt = std::chrono::steady_clock::now() - start;
    std::cout << std::endl
              << fmt::format("Finished in {:.3f} seconds",
                             std::chrono::duration<double>(dt).count())
              << std::endl;

    if (!maybe_record.has_value()) {
        std::cout << "No connected planar puzzle exists with these parameters." << std::endl;
        return;
    }
    const HardestPuzzleRecord &record = maybe_record.value();
    std::cout << fmt::format("Hardest {}-region puzzle with {} colors uses {} moves", node_count,
                             color_count, record.num_moves())
              << std::endl;
    std::cout << domain::describe(record.puzzle);
    std::cout << domain::render_moves(record.solution);
}
}  // namespace kami::generation

int main(const int argc, const char **argv) {
    // clang-format off
    const char DEFAULT_NUM_THREADS[] = "1";
    cxxopts::Options options("find_hardest",
                             "Search every small planar puzzle for the one needing the most moves");
    options.add_options()
        ("nodes", "Number of regions", cxxopts::value<int>()->default_value("5"))
        ("colors", "Number of colors", cxxopts::value<int>()->default_value("4"))
        ("num_threads", "number of threads to use",
            cxxopts::value<int>()->default_value(DEFAULT_NUM_THREADS))
        ("fuzzy", "Use fuzzy signatures, trading exactness for speed")
        ("skip_equivalent", "Skip instances equivalent to one already evaluated")
        ("help", "Print Usage");
    // clang-format on

    auto args = options.parse(argc, argv);
    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    const int node_count = args["nodes"].as<int>();
    const int color_count = args["colors"].as<int>();
    if (color_count < 1 || color_count > node_count) {
        std::cout << fmt::format("Must have 1 <= colors <= nodes, got colors={} nodes={}",
                                 color_count, node_count)
                  << std::endl;
        std::exit(1);
    }

    const kami::generation::GeneratorOptions generator_options = {
        .solver_options =
            {
                .signature_mode = args["fuzzy"].as<bool>() ? kami::domain::SignatureMode::FUZZY
                                                           : kami::domain::SignatureMode::EXACT,
            },
        .num_threads = args["num_threads"].as<int>(),
        .skip_equivalent_instances = args["skip_equivalent"].as<bool>(),
        .progress =
            [](const std::uint64_t num_done, const std::uint64_t num_total) {
                std::cout << fmt::format("\rGraphs: {}/{}", num_done, num_total) << std::flush;
            },
    };

    kami::generation::report_hardest(node_count, color_count, generator_options);
}
