
#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "wise_enum.h"

namespace kami::domain {

// The colors that have a name in the game. Any index past the end of this list is still a valid
// color and is rendered as "Color_<index>".
WISE_ENUM_CLASS(NamedColor, ORANGE, DARK_BLUE, CREAM, TURQUOISE)

// A region color. Colors form an unbounded, totally ordered domain keyed by index.
struct Color {
    int index;

    auto operator<=>(const Color &other) const = default;
};

Color color_from_index(const int index);
Color color_from_name(const NamedColor name);

// Returns true if the color lies in the named prefix of the domain
bool is_named(const Color color);

// Returns the first `num_colors` colors in order
std::vector<Color> palette(const int num_colors);

std::string to_string(const Color color);
std::ostream &operator<<(std::ostream &out, const Color color);

}  // namespace kami::domain

namespace std {
template <>
struct hash<kami::domain::Color> {
    size_t operator()(const kami::domain::Color &color) const {
        return std::hash<int>{}(color.index);
    }
};
}  // namespace std
