#include "shoreline/core/utils.hpp"
#include "shoreline/io/fits_io.hpp"
#include "shoreline/pipeline/tile_pipeline.hpp"

#include <filesystem>
#include <map>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace shoreline;
using json = nlohmann::json;

namespace {

// 20x20 tile of 30 m pixels; the waterline sits at column `water_cols`
// of each year (water to the west).
void write_tile(const fs::path& dir, const std::map<int, int>& water_cols) {
    fs::create_directories(dir);
    io::FitsHeader h;
    io::write_transform(h, GeoTransform{30.0, 0.0, 0.0, 0.0, -30.0, 600.0});
    h.set("CRS", std::string("EPSG:3577"));
    for (const auto& [year, edge] : water_cols) {
        const std::string y = std::to_string(year);
        Matrix2Df index = Matrix2Df::Constant(20, 20, -1.0f);
        index.leftCols(edge).setConstant(1.0f);
        io::write_fits_float(dir / (y + "_mndwi.fits"), index, h);
        io::write_fits_float(dir / (y + "_tide_m.fits"), Matrix2Df::Zero(20, 20), h);
        io::write_fits_float(dir / (y + "_count.fits"), Matrix2Df::Constant(20, 20, 10.0f), h);
        io::write_fits_float(dir / (y + "_stdev.fits"), Matrix2Df::Constant(20, 20, 0.1f), h);
    }
}

void write_seeds(const fs::path& path) {
    const json doc = {
        {"type", "FeatureCollection"},
        {"features",
         {{{"type", "Feature"},
           {"properties", json::object()},
           {"geometry", {{"type", "Point"}, {"coordinates", {75.0, 285.0}}}}}}}};
    core::write_text(path, doc.dump());
}

fs::path fresh_dir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / ("shoreline_pipeline_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

config::Config tile_config(const fs::path& root) {
    config::Config cfg;
    cfg.inputs.raster_dir = (root / "rasters").string();
    cfg.inputs.ocean_seeds_path = (root / "seeds.geojson").string();
    cfg.points.baseline_year = 2020;
    cfg.runtime_limits.parallel_workers = 2;
    return cfg;
}

std::vector<json> read_events(const std::string& log) {
    std::vector<json> events;
    std::istringstream in(log);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(json::parse(line));
    }
    return events;
}

} // namespace

TEST_CASE("output_paths_follow_naming_scheme") {
    config::Config cfg;
    cfg.pipeline.study_area = "4021";
    cfg.masking.index_threshold = -0.05f;
    const auto paths = pipeline::output_paths(cfg, "/out");
    REQUIRE(paths.diagnostic.filename() == "all_time_mask_4021.fits");
    REQUIRE(paths.shorelines.filename() == "annualshorelines_4021_mndwi_-0.05.geojson");
    REQUIRE(paths.rates.filename() == "ratesofchange_4021_mndwi_-0.05.geojson");

    cfg.pipeline.study_area.clear();
    REQUIRE(pipeline::output_paths(cfg, "/out").diagnostic.filename() == "all_time_mask_tile.fits");
}

TEST_CASE("select_study_area_by_id") {
    geometry::GeosContext ctx;
    io::FeatureCollection areas;
    for (int id : {7, 8}) {
        io::Feature f;
        f.geometry = geometry::make_polygon(
            ctx, {{0.0, 0.0}, {10.0 * id, 0.0}, {10.0 * id, 10.0}, {0.0, 10.0}, {0.0, 0.0}});
        f.properties["id"] = id;
        areas.features.push_back(std::move(f));
    }
    auto inside = geometry::make_point(ctx, {75.0, 5.0});

    auto eight = pipeline::select_study_area(ctx, areas, "8");
    REQUIRE(geometry::intersects(ctx, eight.get(), inside.get()));
    auto seven = pipeline::select_study_area(ctx, areas, "7");
    REQUIRE_FALSE(geometry::intersects(ctx, seven.get(), inside.get()));

    REQUIRE_THROWS_AS(pipeline::select_study_area(ctx, areas, "9"), ValidationError);
    REQUIRE_THROWS_AS(pipeline::select_study_area(ctx, areas, ""), ValidationError);
}

TEST_CASE("tile_pipeline_end_to_end_shifting_coast") {
    const fs::path root = fresh_dir("e2e");
    write_tile(root / "rasters", {{2019, 10}, {2020, 12}});
    write_seeds(root / "seeds.geojson");
    const config::Config cfg = tile_config(root);

    std::ostringstream log;
    pipeline::TilePipeline tile(cfg, "test-run", log);
    REQUIRE(tile.run(root / "outputs"));

    const auto paths = pipeline::output_paths(cfg, root / "outputs");
    REQUIRE(fs::exists(paths.diagnostic));
    REQUIRE(fs::exists(paths.shorelines));
    REQUIRE(fs::exists(paths.rates));

    auto [diag, header] = io::read_fits_float(paths.diagnostic);
    REQUIRE(diag.rows() == 20);
    REQUIRE(diag.maxCoeff() == Catch::Approx(0.0f));
    REQUIRE(io::read_crs(header) == "EPSG:3577");

    const json shorelines = json::parse(core::read_text(paths.shorelines));
    REQUIRE(shorelines["features"].size() == 2);
    for (const auto& f : shorelines["features"]) {
        REQUIRE(f["properties"]["certainty"] == "good");
        const int year = f["properties"]["year"].get<int>();
        REQUIRE(f["properties"]["maturity"] == (year == 2020 ? "interim" : "final"));
    }

    const json rates = json::parse(core::read_text(paths.rates));
    REQUIRE(rates["features"].size() == 19);
    for (const auto& f : rates["features"]) {
        const json& p = f["properties"];
        REQUIRE(p["rate_time"].get<double>() == Catch::Approx(-60.0));
        REQUIRE(p["se_time"].get<double>() == Catch::Approx(0.0));
        REQUIRE(p["outl_time"] == "");
        REQUIRE(p["dist_2019"].get<double>() == Catch::Approx(60.0));
        REQUIRE(p["dist_2020"].get<double>() == Catch::Approx(0.0));
        REQUIRE(p["valid_obs"] == 2);
        REQUIRE(p["valid_span"] == 2);
        REQUIRE(p["sce"].get<double>() == Catch::Approx(60.0));
        REQUIRE(p["nsm"].get<double>() == Catch::Approx(-60.0));
        REQUIRE(p["max_year"] == 2019);
        REQUIRE(p["min_year"] == 2020);
        REQUIRE(f["geometry"]["coordinates"][0].get<double>() == Catch::Approx(360.0));
    }

    std::map<std::string, std::string> phase_status;
    for (const auto& e : read_events(log.str())) {
        if (e["type"] == "phase_end") {
            phase_status[e["phase_name"].get<std::string>()] = e["status"].get<std::string>();
        }
    }
    REQUIRE(phase_status["SCAN_INPUT"] == "ok");
    REQUIRE(phase_status["ANNUAL_MOVEMENTS"] == "ok");
    REQUIRE(phase_status["CERTAINTY"] == "ok");
    REQUIRE(phase_status["EXPORT"] == "ok");
    REQUIRE(phase_status["DONE"] == "ok");
}

TEST_CASE("tile_pipeline_without_baseline_contour_skips_points") {
    const fs::path root = fresh_dir("no_baseline");
    write_tile(root / "rasters", {{2018, 10}, {2019, 12}});
    write_seeds(root / "seeds.geojson");
    const config::Config cfg = tile_config(root);

    std::ostringstream log;
    pipeline::TilePipeline tile(cfg, "test-run", log);
    REQUIRE(tile.run(root / "outputs"));

    const auto paths = pipeline::output_paths(cfg, root / "outputs");
    REQUIRE(fs::exists(paths.shorelines));
    REQUIRE_FALSE(fs::exists(paths.rates));

    bool warned = false;
    std::string movements_status;
    for (const auto& e : read_events(log.str())) {
        if (e["type"] == "warning") warned = true;
        if (e["type"] == "phase_end" && e["phase_name"] == "ANNUAL_MOVEMENTS") {
            movements_status = e["status"].get<std::string>();
        }
    }
    REQUIRE(warned);
    REQUIRE(movements_status == "skipped");
}

TEST_CASE("tile_pipeline_reports_missing_inputs") {
    const fs::path root = fresh_dir("missing");
    write_tile(root / "rasters", {{2019, 10}, {2020, 12}});
    config::Config cfg = tile_config(root);

    std::ostringstream log;
    pipeline::TilePipeline tile(cfg, "test-run", log);
    REQUIRE_FALSE(tile.run(root / "outputs"));

    std::string scan_status;
    bool error_event = false;
    for (const auto& e : read_events(log.str())) {
        if (e["type"] == "phase_end" && e["phase_name"] == "SCAN_INPUT") {
            scan_status = e["status"].get<std::string>();
        }
        if (e["type"] == "error") error_event = true;
    }
    REQUIRE(scan_status == "error");
    REQUIRE(error_event);
}

TEST_CASE("rate_features_write_nulls_for_missing_values") {
    geometry::GeosContext ctx;
    pipeline::TileResult result;
    result.crs = "EPSG:3577";

    pipeline::PointResults pr;
    pr.movements.years = {2019, 2020};
    pr.movements.points = {{1.0, 2.0}};
    pr.movements.distances = Matrix2Dd(1, 2);
    pr.movements.distances << std::nan(""), 12.3456;
    analysis::RegressionResult r;
    r.slope = std::nan("");
    r.intercept = std::nan("");
    r.pvalue = std::nan("");
    r.standard_error = std::nan("");
    r.outliers = "2019";
    pr.rates.time = {r};
    pr.stats = {analysis::all_time_stats({2019, 2020}, {std::nan(""), 12.3456}, "2019", 1988)};
    result.points = std::move(pr);

    const config::OutputConfig out;
    const auto fc = pipeline::rate_features(ctx, result, out);
    REQUIRE(fc.features.size() == 1);
    const json doc = json::parse(io::to_geojson(ctx, fc).dump());
    const json& p = doc["features"][0]["properties"];
    REQUIRE(p["rate_time"].is_null());
    REQUIRE(p["dist_2019"].is_null());
    REQUIRE(p["dist_2020"].get<double>() == Catch::Approx(12.35));
    REQUIRE(p["outl_time"] == "2019");
    REQUIRE(p["valid_obs"] == 1);
    REQUIRE(p["max_year"] == 2020);
    REQUIRE(doc["crs"]["properties"]["name"] == "EPSG:3577");
}
