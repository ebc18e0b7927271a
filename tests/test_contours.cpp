#include "shoreline/contour/extraction.hpp"
#include "shoreline/contour/marching_squares.hpp"
#include "shoreline/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace shoreline;
using namespace shoreline::contour;

namespace {

const GeoTransform kTransform{30.0, 0.0, 0.0, 0.0, -30.0, 600.0};

// +1 (water) left of `edge`, -1 elsewhere
Matrix2Df step_grid(int edge, int rows = 20, int cols = 20) {
    Matrix2Df g = Matrix2Df::Constant(rows, cols, -1.0f);
    g.leftCols(edge).setConstant(1.0f);
    return g;
}

} // namespace

TEST_CASE("find_contours_step_edge_is_one_line") {
    const auto paths = find_contours(step_grid(10), 0.0);
    REQUIRE(paths.size() == 1);
    REQUIRE(paths[0].size() == 20);
    for (const auto& p : paths[0]) {
        REQUIRE(p.col == Catch::Approx(9.5));
    }
    REQUIRE(paths[0].front().row == Catch::Approx(0.0));
    REQUIRE(paths[0].back().row == Catch::Approx(19.0));
}

TEST_CASE("find_contours_closed_ring_repeats_first_vertex") {
    Matrix2Df g = Matrix2Df::Zero(5, 5);
    g(2, 2) = 1.0f;
    const auto paths = find_contours(g, 0.5);
    REQUIRE(paths.size() == 1);
    REQUIRE(paths[0].size() == 5);
    REQUIRE(paths[0].front().row == Catch::Approx(paths[0].back().row));
    REQUIRE(paths[0].front().col == Catch::Approx(paths[0].back().col));
}

TEST_CASE("find_contours_saddle_keeps_high_corners_apart") {
    // High diagonal with a high cell mean still isolates each high corner
    Matrix2Df g(2, 2);
    g << 3.0f, -1.0f,
         -1.0f, 3.0f;
    const auto paths = find_contours(g, 0.0);
    REQUIRE(paths.size() == 2);
    for (const auto& path : paths) {
        REQUIRE(path.size() == 2);
        const bool upper_left = std::any_of(path.begin(), path.end(),
                                            [](const PixelPoint& p) { return p.row == 0.0; });
        for (const auto& p : path) {
            if (upper_left) {
                REQUIRE((p.row == 0.0 || p.col == 0.0));
            } else {
                REQUIRE((p.row == 1.0 || p.col == 1.0));
            }
        }
    }
}

TEST_CASE("find_contours_breaks_at_nan") {
    Matrix2Df g = step_grid(10);
    g.row(10).setConstant(std::numeric_limits<float>::quiet_NaN());
    const auto paths = find_contours(g, 0.0);
    REQUIRE(paths.size() == 2);
    const size_t a = paths[0].size();
    const size_t b = paths[1].size();
    REQUIRE(std::min(a, b) == 9);
    REQUIRE(std::max(a, b) == 10);
}

TEST_CASE("contour_lines_land_within_half_a_pixel_of_the_edge") {
    const auto lines = contour_lines(step_grid(10), 0.0, kTransform, 10);
    REQUIRE(lines.size() == 1);
    for (const auto& c : lines[0]) {
        REQUIRE(std::fabs(c.x - 300.0) <= 15.0);
    }
    REQUIRE(lines[0].front().y == Catch::Approx(585.0));
    REQUIRE(lines[0].back().y == Catch::Approx(15.0));
}

TEST_CASE("contour_lines_min_vertices_is_inclusive") {
    REQUIRE(contour_lines(step_grid(10), 0.0, kTransform, 20).size() == 1);
    REQUIRE(contour_lines(step_grid(10), 0.0, kTransform, 21).empty());
}

TEST_CASE("extract_annual_contours_applies_error_policy") {
    geometry::GeosContext ctx;
    const std::vector<int> years = {2019, 2020};
    const std::vector<Matrix2Df> grids = {step_grid(10), Matrix2Df::Constant(20, 20, 1.0f)};

    const ContourSet set =
        extract_annual_contours(ctx, years, grids, 0.0, kTransform, 10, ErrorPolicy::IGNORE);
    REQUIRE(set.years() == std::vector<int>{2019});
    REQUIRE(set.failed_years == std::vector<int>{2020});
    REQUIRE(set.find_year(2020) == nullptr);
    REQUIRE(geometry::length(ctx, set.find_year(2019)->geometry.get()) == Catch::Approx(570.0));

    REQUIRE_THROWS_AS(
        extract_annual_contours(ctx, years, grids, 0.0, kTransform, 10, ErrorPolicy::RAISE),
        ContourError);

    const std::vector<Matrix2Df> blank = {Matrix2Df::Constant(20, 20, 1.0f),
                                          Matrix2Df::Constant(20, 20, -1.0f)};
    REQUIRE_THROWS_AS(
        extract_annual_contours(ctx, years, blank, 0.0, kTransform, 10, ErrorPolicy::IGNORE),
        ContourError);

    REQUIRE_THROWS_AS(extract_annual_contours(ctx, {2019}, grids, 0.0, kTransform, 10,
                                              ErrorPolicy::IGNORE),
                      ContourError);
}

TEST_CASE("extract_level_contours_one_line_per_level") {
    geometry::GeosContext ctx;
    Matrix2Df ramp(20, 20);
    for (int r = 0; r < 20; ++r) {
        for (int c = 0; c < 20; ++c) ramp(r, c) = static_cast<float>(c);
    }

    const ContourSet set = extract_level_contours(ctx, ramp, {5.5, 10.5, 100.0}, kTransform, 10,
                                                  ErrorPolicy::IGNORE);
    REQUIRE(set.contours.size() == 2);
    REQUIRE(set.contours[0].level == Catch::Approx(5.5));
    REQUIRE(set.contours[1].level == Catch::Approx(10.5));
    REQUIRE(set.failed_levels == std::vector<double>{100.0});

    const auto lines = geometry::extract_lines(ctx, set.contours[1].geometry.get());
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].front().x == Catch::Approx(330.0));
}

TEST_CASE("parse_error_policy_names") {
    REQUIRE(parse_error_policy("ignore") == ErrorPolicy::IGNORE);
    REQUIRE(parse_error_policy("RAISE") == ErrorPolicy::RAISE);
    REQUIRE_THROWS_AS(parse_error_policy("skip"), ValidationError);
}
