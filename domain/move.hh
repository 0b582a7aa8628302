
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "domain/color.hh"

namespace kami::domain {

using NodeId = int;

// Recolor the region `target` to `color`. The region then merges with every region of that color
// it touches.
struct Move {
    NodeId target;
    Color color;

    bool operator==(const Move &other) const = default;
};

// Renders a move as "Set node <id> to <COLOR>"
std::string to_string(const Move &move);
std::ostream &operator<<(std::ostream &out, const Move &move);

// Renders a numbered move list, one move per line
std::string render_moves(const std::vector<Move> &moves);

}  // namespace kami::domain
