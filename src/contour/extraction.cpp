#include "shoreline/contour/extraction.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/utils.hpp"

#include <iostream>
#include <sstream>

namespace shoreline::contour {

namespace {

template <typename T>
std::string join_values(const std::vector<T>& values) {
    std::ostringstream ss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) ss << ", ";
        ss << values[i];
    }
    return ss.str();
}

template <typename T>
void apply_policy(const std::vector<T>& failed, size_t total, ErrorPolicy policy) {
    if (failed.empty()) return;
    if (failed.size() == total) {
        throw ContourError("failed to generate any valid contours; check that the "
                           "threshold is present in the data");
    }
    if (policy == ErrorPolicy::RAISE) {
        throw ContourError("failed to generate contours: " + join_values(failed));
    }
    std::cerr << "[CONTOUR] failed to generate contours: " << join_values(failed) << std::endl;
}

} // namespace

ErrorPolicy parse_error_policy(const std::string& s) {
    const std::string v = core::to_lower(s);
    if (v == "ignore") return ErrorPolicy::IGNORE;
    if (v == "raise") return ErrorPolicy::RAISE;
    throw ValidationError("unknown contour error policy: " + s);
}

const Contour* ContourSet::find_year(int year) const {
    for (const auto& c : contours) {
        if (c.year == year) return &c;
    }
    return nullptr;
}

std::vector<int> ContourSet::years() const {
    std::vector<int> out;
    out.reserve(contours.size());
    for (const auto& c : contours) out.push_back(c.year);
    return out;
}

std::vector<Polyline> contour_lines(const Matrix2Df& grid, double level,
                                    const GeoTransform& transform, int min_vertices) {
    std::vector<Polyline> out;
    for (const auto& path : find_contours(grid, level)) {
        if (static_cast<int>(path.size()) < min_vertices || path.size() < 2) continue;
        Polyline line;
        line.reserve(path.size());
        for (const auto& p : path) {
            line.push_back(transform.pixel_center(p.row, p.col));
        }
        out.push_back(std::move(line));
    }
    return out;
}

ContourSet extract_annual_contours(const geometry::GeosContext& ctx,
                                   const std::vector<int>& years,
                                   const std::vector<Matrix2Df>& grids, double level,
                                   const GeoTransform& transform, int min_vertices,
                                   ErrorPolicy policy) {
    if (years.size() != grids.size()) {
        throw ContourError("year labels do not match the number of grids");
    }
    ContourSet set;
    for (size_t i = 0; i < grids.size(); ++i) {
        auto lines = contour_lines(grids[i], level, transform, min_vertices);
        if (lines.empty()) {
            set.failed_years.push_back(years[i]);
            continue;
        }
        Contour c;
        c.year = years[i];
        c.level = level;
        c.geometry = geometry::make_multilinestring(ctx, lines);
        set.contours.push_back(std::move(c));
    }
    apply_policy(set.failed_years, grids.size(), policy);
    return set;
}

ContourSet extract_level_contours(const geometry::GeosContext& ctx, const Matrix2Df& grid,
                                  const std::vector<double>& levels,
                                  const GeoTransform& transform, int min_vertices,
                                  ErrorPolicy policy) {
    ContourSet set;
    for (double level : levels) {
        auto lines = contour_lines(grid, level, transform, min_vertices);
        if (lines.empty()) {
            set.failed_levels.push_back(level);
            continue;
        }
        Contour c;
        c.level = level;
        c.geometry = geometry::make_multilinestring(ctx, lines);
        set.contours.push_back(std::move(c));
    }
    apply_policy(set.failed_levels, levels.size(), policy);
    return set;
}

} // namespace shoreline::contour
