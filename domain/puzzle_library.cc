
#include "domain/puzzle_library.hh"

#include <unordered_map>

namespace kami::domain {
namespace {

// Chapter 3, puzzle 3. A dark blue center surrounded by a symmetric ring of orange and cream
// regions, capped by turquoise and cream regions at the top and bottom.
PuzzleDescription puzzle_3_3() {
    enum Section {
        TOP_CREAM,
        TOP_TURQUOISE,
        TOP_LEFT_ORANGE,
        MIDDLE_DARK_BLUE,
        TOP_RIGHT_ORANGE,
        MIDDLE_LEFT_CREAM,
        MIDDLE_RIGHT_CREAM,
        BOTTOM_LEFT_ORANGE,
        BOTTOM_RIGHT_ORANGE,
        BOTTOM_TURQUOISE,
        BOTTOM_CREAM,
        NUM_SECTIONS,
    };
    const Color orange = color_from_name(NamedColor::ORANGE);
    const Color dark_blue = color_from_name(NamedColor::DARK_BLUE);
    const Color cream = color_from_name(NamedColor::CREAM);
    const Color turquoise = color_from_name(NamedColor::TURQUOISE);

    return PuzzleDescription{
        .node_count = NUM_SECTIONS,
        .edges =
            {
                {TOP_CREAM, TOP_TURQUOISE},
                {TOP_CREAM, TOP_LEFT_ORANGE},
                {TOP_CREAM, TOP_RIGHT_ORANGE},
                {TOP_TURQUOISE, MIDDLE_DARK_BLUE},
                {TOP_LEFT_ORANGE, MIDDLE_DARK_BLUE},
                {TOP_LEFT_ORANGE, MIDDLE_LEFT_CREAM},
                {TOP_RIGHT_ORANGE, MIDDLE_DARK_BLUE},
                {TOP_RIGHT_ORANGE, MIDDLE_RIGHT_CREAM},
                {MIDDLE_DARK_BLUE, MIDDLE_LEFT_CREAM},
                {MIDDLE_DARK_BLUE, MIDDLE_RIGHT_CREAM},
                {MIDDLE_DARK_BLUE, BOTTOM_LEFT_ORANGE},
                {MIDDLE_DARK_BLUE, BOTTOM_RIGHT_ORANGE},
                {MIDDLE_DARK_BLUE, BOTTOM_TURQUOISE},
                {MIDDLE_LEFT_CREAM, BOTTOM_LEFT_ORANGE},
                {MIDDLE_RIGHT_CREAM, BOTTOM_RIGHT_ORANGE},
                {BOTTOM_LEFT_ORANGE, BOTTOM_CREAM},
                {BOTTOM_RIGHT_ORANGE, BOTTOM_CREAM},
                {BOTTOM_TURQUOISE, BOTTOM_CREAM},
            },
        .coloring =
            {
                cream,      // TOP_CREAM
                turquoise,  // TOP_TURQUOISE
                orange,     // TOP_LEFT_ORANGE
                dark_blue,  // MIDDLE_DARK_BLUE
                orange,     // TOP_RIGHT_ORANGE
                cream,      // MIDDLE_LEFT_CREAM
                cream,      // MIDDLE_RIGHT_CREAM
                orange,     // BOTTOM_LEFT_ORANGE
                orange,     // BOTTOM_RIGHT_ORANGE
                turquoise,  // BOTTOM_TURQUOISE
                cream,      // BOTTOM_CREAM
            },
    };
}

const std::unordered_map<std::string, PuzzleDescription> &puzzles_from_name() {
    static const std::unordered_map<std::string, PuzzleDescription> puzzles = {
        {"3-3", puzzle_3_3()},
    };
    return puzzles;
}
}  // namespace

std::vector<std::string> puzzle_names() {
    std::vector<std::string> out;
    for (const auto &[name, _] : puzzles_from_name()) {
        out.push_back(name);
    }
    return out;
}

std::optional<PuzzleDescription> find_puzzle(const std::string &name) {
    const auto &puzzles = puzzles_from_name();
    const auto iter = puzzles.find(name);
    if (iter == puzzles.end()) {
        return std::nullopt;
    }
    return iter->second;
}

}  // namespace kami::domain
