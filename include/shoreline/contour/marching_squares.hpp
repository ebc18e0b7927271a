#pragma once

#include "shoreline/core/types.hpp"
#include <vector>

namespace shoreline::contour {

// Fractional position in the grid, pixel centres at integer (row, col)
struct PixelPoint {
    double row = 0.0;
    double col = 0.0;
};

using PixelPath = std::vector<PixelPoint>;

// Iso-lines of grid at level. Squares with a NaN corner are skipped, so
// lines end at missing data. Closed lines repeat their first vertex.
// Saddles connect the low-valued corners (the two high corners stay apart).
std::vector<PixelPath> find_contours(const Matrix2Df& grid, double level);

} // namespace shoreline::contour
