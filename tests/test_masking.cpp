#include "shoreline/core/errors.hpp"
#include "shoreline/masking/coastal.hpp"
#include "shoreline/masking/connectivity.hpp"
#include "shoreline/masking/morphology.hpp"
#include "shoreline/masking/temporal.hpp"
#include "shoreline/masking/waterbody.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace shoreline;
using namespace shoreline::masking;

namespace {

io::RasterStack constant_stack(const std::vector<int>& years, int rows, int cols,
                               float index, float count, float stdev) {
    io::RasterStack s;
    s.years = years;
    s.transform = GeoTransform{30.0, 0.0, 0.0, 0.0, -30.0, 30.0 * rows};
    for (size_t i = 0; i < years.size(); ++i) {
        s.index.push_back(Matrix2Df::Constant(rows, cols, index));
        s.tide_m.push_back(Matrix2Df::Zero(rows, cols));
        s.count.push_back(Matrix2Df::Constant(rows, cols, count));
        s.stdev.push_back(Matrix2Df::Constant(rows, cols, stdev));
    }
    return s;
}

// Water left of water_cols[y], land elsewhere
io::TileRasters shifting_coast(const std::vector<int>& water_cols) {
    std::vector<int> years;
    for (size_t i = 0; i < water_cols.size(); ++i) years.push_back(2019 + static_cast<int>(i));
    io::TileRasters rasters;
    rasters.annual = constant_stack(years, 20, 20, -1.0f, 10.0f, 0.1f);
    for (size_t y = 0; y < water_cols.size(); ++y) {
        rasters.annual.index[y].leftCols(water_cols[y]).setConstant(1.0f);
    }
    return rasters;
}

} // namespace

TEST_CASE("ocean_mask_keeps_only_seeded_blob") {
    Matrix2Db not_water = Matrix2Db::Zero(5, 7);
    not_water.middleCols(2, 3).setOnes();

    const Matrix2Db ocean = ocean_mask(not_water, std::vector<PixelIndex>{{2, 0}}, 4);
    REQUIRE(ocean.leftCols(2).minCoeff() == 1);
    REQUIRE(ocean.rightCols(5).maxCoeff() == 0);

    const Matrix2Db dilated = ocean_mask(not_water, std::vector<PixelIndex>{{2, 0}}, 4, 1);
    REQUIRE(dilated.col(2).minCoeff() == 1);
    REQUIRE(dilated.col(3).maxCoeff() == 0);

    const Matrix2Db from_land = ocean_mask(not_water, std::vector<PixelIndex>{{2, 3}}, 4);
    REQUIRE(from_land.maxCoeff() == 0);
}

TEST_CASE("ocean_mask_connectivity_controls_diagonals") {
    Matrix2Db not_water = Matrix2Db::Ones(3, 3);
    not_water(0, 0) = 0;
    not_water(1, 1) = 0;

    const Matrix2Db four = ocean_mask(not_water, std::vector<PixelIndex>{{0, 0}}, 4);
    REQUIRE(four(0, 0) == 1);
    REQUIRE(four(1, 1) == 0);

    const Matrix2Db eight = ocean_mask(not_water, std::vector<PixelIndex>{{0, 0}}, 8);
    REQUIRE(eight(1, 1) == 1);

    REQUIRE_THROWS_AS(label_components(not_water, 6), ValidationError);
}

TEST_CASE("seed_pixels_drop_points_off_grid") {
    const GeoTransform t{30.0, 0.0, 0.0, 0.0, -30.0, 600.0};
    const auto px = seed_pixels({{75.0, 285.0}, {-500.0, 285.0}, {75.0, 900.0}}, t, 20, 20);
    REQUIRE(px.size() == 1);
    REQUIRE(px[0].first == 10);
    REQUIRE(px[0].second == 2);
}

TEST_CASE("temporal_mask_drops_land_seen_in_one_year_only") {
    std::vector<Matrix2Db> land(3, Matrix2Db::Zero(5, 5));
    for (auto& l : land) l(0, 0) = 1;
    land[1](4, 4) = 1;

    const auto temporal = temporal_mask(land, 8);
    REQUIRE(temporal.size() == 3);
    REQUIRE(temporal[1](0, 0) == 1);
    REQUIRE(temporal[1](4, 4) == 0);
    REQUIRE(temporal[0].minCoeff() == 1);
    REQUIRE(temporal[2].minCoeff() == 1);
}

TEST_CASE("apply_gapfill_replaces_low_count_pixels") {
    io::RasterStack annual = constant_stack({2019}, 2, 2, 0.3f, 10.0f, 0.1f);
    annual.count[0](0, 1) = 3.0f;
    annual.count[0](1, 1) = std::numeric_limits<float>::quiet_NaN();
    io::RasterStack gap = constant_stack({2019}, 2, 2, -0.7f, 40.0f, 0.05f);

    const io::RasterStack filled = apply_gapfill(annual, &gap, 5);
    REQUIRE(filled.index[0](0, 0) == Catch::Approx(0.3f));
    REQUIRE(filled.index[0](0, 1) == Catch::Approx(-0.7f));
    REQUIRE(filled.count[0](0, 1) == Catch::Approx(40.0f));
    REQUIRE(filled.index[0](1, 1) == Catch::Approx(-0.7f));

    const io::RasterStack untouched = apply_gapfill(annual, nullptr, 5);
    REQUIRE(untouched.index[0](0, 1) == Catch::Approx(0.3f));

    io::RasterStack other_years = constant_stack({2018}, 2, 2, 0.0f, 1.0f, 0.0f);
    REQUIRE_THROWS_AS(apply_gapfill(annual, &other_years, 5), NoDataError);
}

TEST_CASE("flag_unreliable_marks_persistent_pixels") {
    io::RasterStack annual = constant_stack({2018, 2019, 2020}, 4, 6, 0.2f, 10.0f, 0.1f);
    for (size_t y = 0; y < annual.size(); ++y) {
        annual.stdev[y].leftCols(2).setConstant(0.6f);
    }
    annual.count[0](3, 5) = 1.0f;
    annual.count[1](3, 5) = 1.0f;
    annual.count[0](0, 5) = 1.0f;

    config::MaskingConfig cfg;
    cfg.erosion_radius = 0;
    const ReliabilityFlags flags = flag_unreliable(annual, cfg);
    REQUIRE(flags.persistent_stdev.leftCols(2).minCoeff() == 1);
    REQUIRE(flags.persistent_stdev.rightCols(4).maxCoeff() == 0);
    REQUIRE(flags.persistent_lowobs(3, 5) == 1);
    REQUIRE(flags.persistent_lowobs(0, 5) == 0);
}

TEST_CASE("landcover_water_mask_selects_classes") {
    Matrix2Df lc(1, 4);
    lc << 0.0f, 80.0f, 40.0f, std::numeric_limits<float>::quiet_NaN();
    const Matrix2Db water = landcover_water_mask(lc, {0, 80}, 0);
    REQUIRE(water(0, 0) == 1);
    REQUIRE(water(0, 1) == 1);
    REQUIRE(water(0, 2) == 0);
    REQUIRE(water(0, 3) == 0);
}

TEST_CASE("classify_land_treats_waterbody_and_nan_as_not_water") {
    io::RasterStack filled = constant_stack({2020}, 1, 4, 0.0f, 10.0f, 0.1f);
    filled.index[0] << -0.5f, 0.5f, std::numeric_limits<float>::quiet_NaN(), -0.2f;
    Matrix2Db waterbody = Matrix2Db::Zero(1, 4);
    waterbody(0, 3) = 1;

    const auto classes = classify_land(filled, waterbody, nullptr, 0.0f);
    REQUIRE(classes.land[0](0, 0) == 1);
    REQUIRE(classes.land[0](0, 1) == 0);
    REQUIRE(classes.land[0](0, 2) == 0);
    REQUIRE(classes.land[0](0, 3) == 0);
    REQUIRE(classes.not_water[0](0, 0) == 1);
    REQUIRE(classes.not_water[0](0, 1) == 0);
    REQUIRE(classes.not_water[0](0, 2) == 1);
    REQUIRE(classes.not_water[0](0, 3) == 1);

    Matrix2Db lc_water = Matrix2Db::Zero(1, 4);
    lc_water(0, 0) = 1;
    const auto with_lc = classify_land(filled, waterbody, &lc_water, 0.0f);
    REQUIRE(with_lc.land[0](0, 0) == 0);
    REQUIRE(with_lc.not_water[0](0, 0) == 0);

    REQUIRE_THROWS_AS(classify_land(filled, Matrix2Db::Zero(2, 2), nullptr, 0.0f),
                      ValidationError);
}

TEST_CASE("all_time_land_uses_year_fraction") {
    LandClassification classes;
    Matrix2Db a = Matrix2Db::Zero(1, 3);
    Matrix2Db b = Matrix2Db::Zero(1, 3);
    a(0, 0) = 1;
    b(0, 0) = 1;
    a(0, 1) = 1;
    classes.not_water = {a, b};
    const std::vector<Matrix2Db> temporal(2, Matrix2Db::Ones(1, 3));

    const Matrix2Db half = all_time_land(classes, temporal, 0.5f);
    REQUIRE(half(0, 0) == 1);
    REQUIRE(half(0, 1) == 1);
    REQUIRE(half(0, 2) == 0);

    const Matrix2Db strict = all_time_land(classes, temporal, 0.75f);
    REQUIRE(strict(0, 1) == 0);
}

TEST_CASE("diagnostic_rules_apply_in_order") {
    Matrix2Db coastal = Matrix2Db::Ones(3, 3);
    coastal.col(0).setZero();
    ReliabilityFlags flags{Matrix2Db::Zero(3, 3), Matrix2Db::Zero(3, 3)};
    flags.persistent_stdev(1, 1) = 1;
    flags.persistent_stdev(1, 2) = 1;
    flags.persistent_lowobs(1, 1) = 1;
    flags.persistent_stdev(0, 0) = 1;
    Matrix2Db waterbody = Matrix2Db::Zero(3, 3);
    waterbody(2, 2) = 1;

    const Matrix2Db diag = compose_diagnostic(diagnostic_rules(coastal, flags, waterbody), 3, 3);
    REQUIRE(diag(0, 0) == diagnostic_code(DiagnosticClass::OUTSIDE_BUFFER));
    REQUIRE(diag(1, 2) == diagnostic_code(DiagnosticClass::TIDAL_UNCERTAINTY));
    REQUIRE(diag(1, 1) == diagnostic_code(DiagnosticClass::LOW_OBSERVATIONS));
    REQUIRE(diag(2, 2) == diagnostic_code(DiagnosticClass::WATERBODY));
    REQUIRE(diag(0, 1) == diagnostic_code(DiagnosticClass::RELIABLE));
}

TEST_CASE("select_waterbodies_filters_and_modifies") {
    geometry::GeosContext ctx;
    auto square = [&](double x0) {
        return geometry::make_polygon(ctx, {{x0, 0}, {x0 + 10, 0}, {x0 + 10, 10}, {x0, 10}, {x0, 0}});
    };

    io::FeatureCollection wb;
    wb.features.push_back({square(0), {{"FEATURETYPE", "Lake"}, {"PERENNIALITY", "Perennial"}}});
    wb.features.push_back({square(20), {{"FEATURETYPE", "Lake"}, {"PERENNIALITY", "Non Perennial"}}});
    wb.features.push_back({square(40), {{"FEATURETYPE", "Estuary"}}});

    REQUIRE(is_excluded_waterbody(wb.features[0].properties));
    REQUIRE_FALSE(is_excluded_waterbody(wb.features[1].properties));
    REQUIRE(is_excluded_waterbody(wb.features[2].properties));

    auto point_at = [&](double x) { return geometry::make_point(ctx, {x, 5.0}); };

    auto selected = select_waterbodies(ctx, wb, nullptr);
    REQUIRE(geometry::intersects(ctx, selected.get(), point_at(5).get()));
    REQUIRE_FALSE(geometry::intersects(ctx, selected.get(), point_at(25).get()));
    REQUIRE(geometry::intersects(ctx, selected.get(), point_at(45).get()));

    io::FeatureCollection mods;
    mods.features.push_back({square(40), {{"type", "remove"}}});
    mods.features.push_back({square(60), {{"type", "add"}}});
    auto modified = select_waterbodies(ctx, wb, &mods);
    REQUIRE(geometry::intersects(ctx, modified.get(), point_at(5).get()));
    REQUIRE_FALSE(geometry::intersects(ctx, modified.get(), point_at(45).get()));
    REQUIRE(geometry::intersects(ctx, modified.get(), point_at(65).get()));
}

TEST_CASE("rasterize_polygons_marks_interior_pixels") {
    geometry::GeosContext ctx;
    const GeoTransform t{1.0, 0.0, 0.0, 0.0, -1.0, 10.0};
    auto poly = geometry::make_polygon(ctx, {{2, 5}, {5, 5}, {5, 8}, {2, 8}, {2, 5}});

    const Matrix2Db mask = rasterize_polygons(ctx, poly.get(), t, 10, 10);
    REQUIRE(mask(3, 3) == 1);
    REQUIRE(mask(0, 0) == 0);
    REQUIRE(mask(8, 8) == 0);
    const int n = mask.cast<int>().sum();
    REQUIRE(n >= 9);
    REQUIRE(n <= 25);

    REQUIRE(rasterize_polygons(ctx, nullptr, t, 10, 10).maxCoeff() == 0);
}

TEST_CASE("contours_preprocess_builds_masks_for_shifting_coast") {
    const io::TileRasters rasters = shifting_coast({10, 12});
    const std::vector<Coordinate> seeds = {{75.0, 285.0}};
    config::MaskingConfig cfg;

    const CoastalMasks masks =
        contours_preprocess(rasters, Matrix2Db::Zero(20, 20), nullptr, seeds, cfg);

    REQUIRE(masks.years == std::vector<int>{2019, 2020});
    REQUIRE(masks.temporal[0].minCoeff() == 1);
    REQUIRE(masks.all_time_land.leftCols(10).maxCoeff() == 0);
    REQUIRE(masks.all_time_land.rightCols(10).minCoeff() == 1);
    REQUIRE(masks.coastal.minCoeff() == 1);
    REQUIRE(masks.diagnostic.maxCoeff() == 0);

    REQUIRE(masks.annual_mask[0].leftCols(13).minCoeff() == 1);
    REQUIRE(masks.annual_mask[0].rightCols(7).maxCoeff() == 0);
    REQUIRE(masks.annual_mask[1].leftCols(15).minCoeff() == 1);
    REQUIRE(masks.annual_mask[1].rightCols(5).maxCoeff() == 0);

    REQUIRE(masks.masked_index[0](5, 12) == Catch::Approx(-1.0f));
    REQUIRE(std::isnan(masks.masked_index[0](5, 13)));

    const CoastalMasks again =
        contours_preprocess(rasters, Matrix2Db::Zero(20, 20), nullptr, seeds, cfg);
    REQUIRE((again.diagnostic.array() == masks.diagnostic.array()).all());
    REQUIRE((again.annual_mask[1].array() == masks.annual_mask[1].array()).all());
}

TEST_CASE("contours_preprocess_without_seed_on_grid_masks_everything") {
    const io::TileRasters rasters = shifting_coast({10, 12});
    config::MaskingConfig cfg;
    const CoastalMasks masks = contours_preprocess(rasters, Matrix2Db::Zero(20, 20), nullptr,
                                                   {{-1000.0, -1000.0}}, cfg);
    REQUIRE(masks.annual_mask[0].maxCoeff() == 0);
    REQUIRE(std::isnan(masks.masked_index[0](5, 5)));
}
