
#pragma once

#include <stdexcept>
#include <string>

namespace kami::domain {

// Thrown when a move recolors an unknown region or recolors a region to its current color.
class InvalidMoveError : public std::runtime_error {
   public:
    explicit InvalidMoveError(const std::string &what) : std::runtime_error(what) {}
};

// Thrown when a puzzle description violates the region graph invariants.
class MalformedGraphError : public std::runtime_error {
   public:
    explicit MalformedGraphError(const std::string &what) : std::runtime_error(what) {}
};

// Thrown when an unbounded search exhausts every reachable state without solving the puzzle.
// Observing this indicates a defect in collapse or move generation.
class UnsolvableError : public std::runtime_error {
   public:
    explicit UnsolvableError(const std::string &what) : std::runtime_error(what) {}
};

}  // namespace kami::domain
