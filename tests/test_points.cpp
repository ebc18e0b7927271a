#include "shoreline/analysis/points.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace shoreline;
using namespace shoreline::analysis;

namespace {

io::Feature segment(const geometry::GeosContext& ctx, double x0, double x1,
                    const std::string& primary, const std::string& secondary) {
    io::Feature f;
    f.geometry = geometry::make_linestring(ctx, {{x0, 0.0}, {x1, 0.0}});
    f.properties["INTERTD1_V"] = primary;
    f.properties["INTERTD2_V"] = secondary;
    return f;
}

} // namespace

TEST_CASE("points_on_line_uses_fixed_spacing_from_start") {
    geometry::GeosContext ctx;
    auto line = geometry::make_linestring(ctx, {{0.0, 0.0}, {100.0, 0.0}});
    const auto pts = points_on_line(ctx, line.get(), 30.0);
    REQUIRE(pts.size() == 4);
    REQUIRE(pts[0].x == Catch::Approx(0.0));
    REQUIRE(pts[3].x == Catch::Approx(90.0));

    auto exact = geometry::make_linestring(ctx, {{0.0, 0.0}, {90.0, 0.0}});
    REQUIRE(points_on_line(ctx, exact.get(), 30.0).size() == 3);
}

TEST_CASE("points_on_line_merges_touching_parts") {
    geometry::GeosContext ctx;
    auto parts = geometry::make_multilinestring(
        ctx, {{{0.0, 0.0}, {50.0, 0.0}}, {{50.0, 0.0}, {100.0, 0.0}}});
    const auto pts = points_on_line(ctx, parts.get(), 25.0);
    REQUIRE(pts.size() == 4);
    REQUIRE(pts[2].x == Catch::Approx(50.0));

    REQUIRE(points_on_line(ctx, nullptr, 30.0).empty());
    auto empty = geometry::make_empty(ctx, GEOS_MULTILINESTRING);
    REQUIRE(points_on_line(ctx, empty.get(), 30.0).empty());
}

TEST_CASE("is_rocky_segment_needs_rocky_primary") {
    io::json both = {{"INTERTD1_V", "Hard bedrock shore"}, {"INTERTD2_V", "Boulder (rock) beach"}};
    io::json unclassified = {{"INTERTD1_V", "Hard bedrock shore"}, {"INTERTD2_V", "Unclassified"}};
    io::json sandy = {{"INTERTD1_V", "Hard bedrock shore"}, {"INTERTD2_V", "Sandy beach"}};
    io::json missing = io::json::object();

    REQUIRE(is_rocky_segment(both));
    REQUIRE(is_rocky_segment(unclassified));
    REQUIRE_FALSE(is_rocky_segment(sandy));
    REQUIRE_FALSE(is_rocky_segment(missing));
}

TEST_CASE("rocky_shores_clip_drops_points_near_rock_only") {
    geometry::GeosContext ctx;
    io::FeatureCollection classification;
    classification.features.push_back(segment(ctx, 0.0, 100.0, "Hard bedrock shore", "Unclassified"));
    classification.features.push_back(segment(ctx, 300.0, 400.0, "Sandy beach", "Sandy beach"));

    const std::vector<Coordinate> pts = {{50.0, 10.0}, {350.0, 10.0}, {1000.0, 0.0}};
    const auto kept = rocky_shores_clip(ctx, pts, classification, 50.0);
    REQUIRE(kept.has_value());
    REQUIRE(kept->size() == 2);
    REQUIRE((*kept)[0].x == Catch::Approx(350.0));
    REQUIRE((*kept)[1].x == Catch::Approx(1000.0));
}

TEST_CASE("rocky_shores_clip_without_non_rocky_segments_is_empty") {
    geometry::GeosContext ctx;
    io::FeatureCollection rock_only;
    rock_only.features.push_back(segment(ctx, 0.0, 100.0, "Hard rock cliff (>5m)", "Unclassified"));
    REQUIRE_FALSE(rocky_shores_clip(ctx, {{50.0, 0.0}}, rock_only, 50.0).has_value());

    io::FeatureCollection sand_only;
    sand_only.features.push_back(segment(ctx, 0.0, 100.0, "Sandy beach", "Unclassified"));
    const auto kept = rocky_shores_clip(ctx, {{50.0, 0.0}, {900.0, 0.0}}, sand_only, 50.0);
    REQUIRE(kept.has_value());
    REQUIRE(kept->size() == 2);
}

TEST_CASE("clip_points_keeps_points_in_polygon") {
    geometry::GeosContext ctx;
    auto square = geometry::make_polygon(ctx, {{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}});
    const auto kept = clip_points(ctx, {{5.0, 5.0}, {15.0, 5.0}, {10.0, 5.0}}, square.get());
    REQUIRE(kept.size() == 2);
    REQUIRE(kept[0].x == Catch::Approx(5.0));
    REQUIRE(kept[1].x == Catch::Approx(10.0));
}
