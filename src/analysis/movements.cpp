#include "shoreline/analysis/movements.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/parallel.hpp"
#include "shoreline/core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

namespace shoreline::analysis {

using namespace shoreline::geometry;

int MovementTable::year_column(int year) const {
    auto it = std::find(years.begin(), years.end(), year);
    return it == years.end() ? -1 : static_cast<int>(it - years.begin());
}

double sample_bilinear(const Matrix2Df& grid, const GeoTransform& transform, const Coordinate& p) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto [row, col] = transform.to_pixel(p);
    const double max_row = static_cast<double>(grid.rows() - 1);
    const double max_col = static_cast<double>(grid.cols() - 1);
    if (!(row >= 0.0 && row <= max_row && col >= 0.0 && col <= max_col)) {
        return nan;
    }

    const long r0 = static_cast<long>(std::floor(row));
    const long c0 = static_cast<long>(std::floor(col));
    const long r1 = std::min<long>(r0 + 1, grid.rows() - 1);
    const long c1 = std::min<long>(c0 + 1, grid.cols() - 1);
    const double fr = row - static_cast<double>(r0);
    const double fc = col - static_cast<double>(c0);

    const double v00 = grid(r0, c0);
    const double v01 = grid(r0, c1);
    const double v10 = grid(r1, c0);
    const double v11 = grid(r1, c1);
    if (std::isnan(v00) || std::isnan(v01) || std::isnan(v10) || std::isnan(v11)) {
        return nan;
    }
    const double top = v00 * (1.0 - fc) + v01 * fc;
    const double bottom = v10 * (1.0 - fc) + v11 * fc;
    return top * (1.0 - fr) + bottom * fr;
}

int movement_direction(double baseline_at_comparison, double comparison_at_baseline) {
    return baseline_at_comparison > comparison_at_baseline ? 1 : -1;
}

MovementTable annual_movements(const std::vector<Coordinate>& points,
                               const contour::ContourSet& contours,
                               const io::RasterStack& annual, int baseline_year,
                               const config::MovementsConfig& cfg, int decimals, int workers) {
    MovementTable table;
    table.years = contours.years();
    std::sort(table.years.begin(), table.years.end());
    table.points = points;
    table.distances = Matrix2Dd::Constant(static_cast<Eigen::Index>(points.size()),
                                          static_cast<Eigen::Index>(table.years.size()),
                                          std::numeric_limits<double>::quiet_NaN());

    const int baseline_band = annual.year_index(baseline_year);
    if (baseline_band < 0) {
        throw NoDataError("baseline year " + std::to_string(baseline_year) + " has no raster");
    }
    const Matrix2Df& baseline_index = annual.index[static_cast<size_t>(baseline_band)];

    // Raster band of each contour year
    std::vector<int> bands;
    for (int year : table.years) {
        const int band = annual.year_index(year);
        if (band < 0) {
            throw NoDataError("contour year " + std::to_string(year) + " has no raster");
        }
        bands.push_back(band);
    }

    if (points.empty()) {
        return table;
    }

    // Each worker reads its own copies of the contour geometries
    const int n_workers = core::resolve_worker_count(workers, points.size());
    std::vector<std::unique_ptr<GeosContext>> contexts;
    std::vector<std::vector<GeometryPtr>> worker_contours(static_cast<size_t>(n_workers));
    for (int w = 0; w < n_workers; ++w) {
        contexts.push_back(std::make_unique<GeosContext>());
        for (int year : table.years) {
            worker_contours[static_cast<size_t>(w)].push_back(
                clone(*contexts.back(), contours.find_year(year)->geometry.get()));
        }
    }

    core::parallel_for(points.size(), n_workers, [&](int w, size_t i) {
        const GeosContext& ctx = *contexts[static_cast<size_t>(w)];
        const auto& lines = worker_contours[static_cast<size_t>(w)];
        const Coordinate& p = points[i];
        for (size_t k = 0; k < table.years.size(); ++k) {
            double value = 0.0;
            if (table.years[k] != baseline_year) {
                const Coordinate nearest = nearest_point_on(ctx, lines[k].get(), p);
                const double d = std::hypot(nearest.x - p.x, nearest.y - p.y);
                if (!(d < cfg.max_valid_distance)) {
                    value = std::numeric_limits<double>::quiet_NaN();
                } else {
                    const Matrix2Df& comp_index = annual.index[static_cast<size_t>(bands[k])];
                    const double comp_at_baseline = sample_bilinear(comp_index, annual.transform, p);
                    const double baseline_at_comp =
                        sample_bilinear(baseline_index, annual.transform, nearest);
                    value = core::round_to(d * movement_direction(baseline_at_comp, comp_at_baseline),
                                           decimals);
                }
            }
            table.distances(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)) = value;
        }
    });

    return table;
}

} // namespace shoreline::analysis
