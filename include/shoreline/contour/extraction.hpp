#pragma once

#include "shoreline/contour/marching_squares.hpp"
#include "shoreline/geometry/geos_context.hpp"
#include <string>
#include <vector>

namespace shoreline::contour {

enum class ErrorPolicy {
    IGNORE,
    RAISE
};

ErrorPolicy parse_error_policy(const std::string& s);

// One multi-line per year (annual mode) or per level (single grid mode)
struct Contour {
    int year = 0;
    double level = 0.0;
    geometry::GeometryPtr geometry;
};

struct ContourSet {
    std::vector<Contour> contours;
    std::vector<int> failed_years;
    std::vector<double> failed_levels;

    const Contour* find_year(int year) const;
    std::vector<int> years() const;
};

// Lines with at least min_vertices vertices, in map coordinates through
// the pixel centres
std::vector<Polyline> contour_lines(const Matrix2Df& grid, double level,
                                    const GeoTransform& transform, int min_vertices);

// Extracts one contour per year. A year without lines is failed; with
// RAISE any failure throws ContourError, and a run where every year fails
// always throws.
ContourSet extract_annual_contours(const geometry::GeosContext& ctx,
                                   const std::vector<int>& years,
                                   const std::vector<Matrix2Df>& grids, double level,
                                   const GeoTransform& transform, int min_vertices,
                                   ErrorPolicy policy);

ContourSet extract_level_contours(const geometry::GeosContext& ctx, const Matrix2Df& grid,
                                  const std::vector<double>& levels,
                                  const GeoTransform& transform, int min_vertices,
                                  ErrorPolicy policy);

} // namespace shoreline::contour
