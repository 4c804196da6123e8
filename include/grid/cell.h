#pragma once

#include <compare>

namespace ssg {

// Discrete (x_bin, y_bin) position on the shared grid.
// Ordered so that cell tallies iterate deterministically (x first, then y).
struct Cell {
    int x = 0;
    int y = 0;

    auto operator<=>(Cell const&) const = default;
};

} // namespace ssg
