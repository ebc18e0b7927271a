#pragma once

#include "shoreline/core/types.hpp"
#include <utility>
#include <vector>

namespace shoreline::masking {

using PixelIndex = std::pair<int, int>; // (row, col)

// Nearest grid cell under each seed coordinate. Seeds off the grid are dropped.
std::vector<PixelIndex> seed_pixels(const std::vector<Coordinate>& seeds,
                                    const GeoTransform& transform, int rows, int cols);

// Water pixels (zero in not_water) connected to at least one seed pixel,
// optionally dilated by a disc of `dilation` pixels. Seeds on land or
// nodata select nothing; no seed on water gives an empty mask.
Matrix2Db ocean_mask(const Matrix2Db& not_water, const std::vector<PixelIndex>& seeds,
                     int connectivity, int dilation = 0);

Matrix2Db ocean_mask(const Matrix2Db& not_water, const std::vector<Coordinate>& seeds,
                     const GeoTransform& transform, int connectivity, int dilation = 0);

} // namespace shoreline::masking
