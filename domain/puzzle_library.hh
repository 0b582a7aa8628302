
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/region_graph.hh"

namespace kami::domain {

// Names of the puzzles that have been transcribed from the game
std::vector<std::string> puzzle_names();

// Returns the description of a transcribed puzzle, or std::nullopt if no puzzle has that name
std::optional<PuzzleDescription> find_puzzle(const std::string &name);

}  // namespace kami::domain
