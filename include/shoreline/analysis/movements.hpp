#pragma once

#include "shoreline/config/configuration.hpp"
#include "shoreline/contour/extraction.hpp"
#include "shoreline/io/raster_stack.hpp"
#include <vector>

namespace shoreline::analysis {

// Signed distances from every reference point (rows) to every contour
// year (columns). Missing distances are NaN.
struct MovementTable {
    std::vector<int> years;
    std::vector<Coordinate> points;
    Matrix2Dd distances;

    int year_column(int year) const;
};

// Bilinear sample between pixel centres. NaN outside the grid or when any
// contributing pixel is missing.
double sample_bilinear(const Matrix2Df& grid, const GeoTransform& transform, const Coordinate& p);

// +1 when the comparison shoreline lies seaward of the reference point,
// -1 otherwise (including when either sample is missing).
int movement_direction(double baseline_at_comparison, double comparison_at_baseline);

// For each point and each contour year, the distance to the nearest point
// of that year's contour. Distances at or beyond max_valid_distance are
// missing; the baseline year is exactly zero. Runs over points on
// `workers` threads, each with its own GEOS context.
MovementTable annual_movements(const std::vector<Coordinate>& points,
                               const contour::ContourSet& contours,
                               const io::RasterStack& annual, int baseline_year,
                               const config::MovementsConfig& cfg, int decimals, int workers);

} // namespace shoreline::analysis
