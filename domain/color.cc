
#include "domain/color.hh"

#include <stdexcept>

#include "fmt/format.h"

namespace kami::domain {

Color color_from_index(const int index) {
    if (index < 0) {
        throw std::invalid_argument(fmt::format("Color index must be non-negative, got {}", index));
    }
    return Color{.index = index};
}

Color color_from_name(const NamedColor name) {
    return Color{.index = static_cast<int>(name)};
}

bool is_named(const Color color) {
    return color.index >= 0 && color.index < static_cast<int>(wise_enum::size<NamedColor>);
}

std::vector<Color> palette(const int num_colors) {
    std::vector<Color> out;
    out.reserve(num_colors);
    for (int i = 0; i < num_colors; i++) {
        out.push_back(color_from_index(i));
    }
    return out;
}

std::string to_string(const Color color) {
    if (is_named(color)) {
        return std::string(wise_enum::to_string(static_cast<NamedColor>(color.index)));
    }
    return fmt::format("Color_{}", color.index);
}

std::ostream &operator<<(std::ostream &out, const Color color) { return out << to_string(color); }

}  // namespace kami::domain
