
#include "domain/move.hh"

#include "fmt/format.h"

namespace kami::domain {

std::string to_string(const Move &move) {
    return fmt::format("Set node {} to {}", move.target, to_string(move.color));
}

std::ostream &operator<<(std::ostream &out, const Move &move) { return out << to_string(move); }

std::string render_moves(const std::vector<Move> &moves) {
    std::string out;
    for (int i = 0; i < static_cast<int>(moves.size()); i++) {
        out += fmt::format("{}. {}\n", i + 1, to_string(moves.at(i)));
    }
    return out;
}

}  // namespace kami::domain
