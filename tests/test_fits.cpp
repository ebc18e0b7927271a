#include "shoreline/core/errors.hpp"
#include "shoreline/io/fits_io.hpp"
#include "shoreline/io/raster_stack.hpp"

#include <cmath>
#include <filesystem>
#include <limits>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace shoreline;

static fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("shoreline_fits_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static io::FitsHeader grid_header(double origin_x = 0.0) {
    io::FitsHeader h;
    io::write_transform(h, GeoTransform{30.0, 0.0, origin_x, 0.0, -30.0, 300.0});
    h.set("CRS", std::string("EPSG:3577"));
    return h;
}

static void write_year(const fs::path& dir, int year, const std::string& suffix,
                       const io::FitsHeader& h, long rows = 4, long cols = 5) {
    const std::string y = std::to_string(year);
    Matrix2Df grid = Matrix2Df::Constant(rows, cols, 0.5f);
    io::write_fits_float(dir / (y + "_mndwi" + suffix + ".fits"), grid, h);
    io::write_fits_float(dir / (y + "_tide_m" + suffix + ".fits"), grid, h);
    io::write_fits_float(dir / (y + "_count" + suffix + ".fits"),
                         Matrix2Df::Constant(rows, cols, 10.0f), h);
    io::write_fits_float(dir / (y + "_stdev" + suffix + ".fits"),
                         Matrix2Df::Constant(rows, cols, 0.1f), h);
}

TEST_CASE("fits_float_round_trip_keeps_nan_and_transform") {
    const fs::path dir = fresh_dir("float");
    Matrix2Df grid(2, 3);
    grid << 1.0f, -2.5f, 3.0f,
            std::numeric_limits<float>::quiet_NaN(), 0.0f, 7.25f;

    io::write_fits_float(dir / "grid.fits", grid, grid_header(1500.0));
    auto [back, header] = io::read_fits_float(dir / "grid.fits");

    REQUIRE(back.rows() == 2);
    REQUIRE(back.cols() == 3);
    REQUIRE(back(0, 1) == Catch::Approx(-2.5f));
    REQUIRE(back(1, 2) == Catch::Approx(7.25f));
    REQUIRE(std::isnan(back(1, 0)));
    REQUIRE(header.get_int("NAXIS1") == 3);

    const GeoTransform t = io::read_transform(header);
    REQUIRE(t.a == Catch::Approx(30.0));
    REQUIRE(t.c == Catch::Approx(1500.0));
    REQUIRE(t.e == Catch::Approx(-30.0));
    REQUIRE(io::read_crs(header) == "EPSG:3577");
}

TEST_CASE("fits_byte_image_dimensions") {
    const fs::path dir = fresh_dir("byte");
    Matrix2Db codes = Matrix2Db::Zero(3, 4);
    codes(1, 2) = 5;
    io::write_fits_byte(dir / "codes.fits", codes, grid_header());

    auto [w, h, naxis] = io::get_fits_dimensions(dir / "codes.fits");
    REQUIRE(w == 4);
    REQUIRE(h == 3);
    REQUIRE(naxis == 2);

    auto [back, header] = io::read_fits_float(dir / "codes.fits");
    REQUIRE(back(1, 2) == Catch::Approx(5.0f));
    REQUIRE(back(0, 0) == Catch::Approx(0.0f));
}

TEST_CASE("fits_missing_transform_key_throws") {
    io::FitsHeader h;
    h.set("GT_A", 30.0);
    REQUIRE_THROWS_AS(io::read_transform(h), FitsError);
    REQUIRE(io::read_crs(h).empty());
}

TEST_CASE("fits_open_missing_file_throws") {
    REQUIRE_THROWS_AS(io::read_fits_float("/nonexistent/nothing.fits"), FitsError);
}

TEST_CASE("parse_raster_filename_variants") {
    auto annual = io::parse_raster_filename("2019_mndwi.fits");
    REQUIRE(annual.has_value());
    REQUIRE(annual->year == 2019);
    REQUIRE(annual->layer == "mndwi");
    REQUIRE_FALSE(annual->gapfill);

    auto gap = io::parse_raster_filename("2019_tide_m_gapfill.fits");
    REQUIRE(gap.has_value());
    REQUIRE(gap->layer == "tide_m");
    REQUIRE(gap->gapfill);

    REQUIRE_FALSE(io::parse_raster_filename("mndwi_2019.fits").has_value());
    REQUIRE_FALSE(io::parse_raster_filename("2019_mndwi.tif").has_value());
    REQUIRE_FALSE(io::parse_raster_filename("19x9_mndwi.fits").has_value());
}

TEST_CASE("load_tile_rasters_stacks_years_and_gapfill") {
    const fs::path dir = fresh_dir("stack");
    const auto h = grid_header();
    write_year(dir, 1987, "", h);
    write_year(dir, 2019, "", h);
    write_year(dir, 2020, "", h);
    write_year(dir, 2019, "_gapfill", h);
    write_year(dir, 2020, "_gapfill", h);

    const auto rasters = io::load_tile_rasters(dir, "mndwi", 1988);
    REQUIRE(rasters.annual.years == std::vector<int>{2019, 2020});
    REQUIRE(rasters.annual.rows() == 4);
    REQUIRE(rasters.annual.cols() == 5);
    REQUIRE(rasters.annual.crs == "EPSG:3577");
    REQUIRE(rasters.annual.count[1](0, 0) == Catch::Approx(10.0f));
    REQUIRE(rasters.gapfill.has_value());
    REQUIRE(rasters.gapfill->year_index(2020) == 1);
}

TEST_CASE("load_tile_rasters_reports_inconsistent_tiles") {
    const auto h = grid_header();

    SECTION("missing layer") {
        const fs::path dir = fresh_dir("missing_layer");
        write_year(dir, 2019, "", h);
        fs::remove(dir / "2019_stdev.fits");
        REQUIRE_THROWS_AS(io::load_tile_rasters(dir, "mndwi", 1988), NoDataError);
    }
    SECTION("shape mismatch") {
        const fs::path dir = fresh_dir("shape");
        write_year(dir, 2019, "", h);
        write_year(dir, 2020, "", h, 6, 5);
        REQUIRE_THROWS_AS(io::load_tile_rasters(dir, "mndwi", 1988), ValidationError);
    }
    SECTION("transform mismatch") {
        const fs::path dir = fresh_dir("transform");
        write_year(dir, 2019, "", h);
        write_year(dir, 2020, "", grid_header(30.0));
        REQUIRE_THROWS_AS(io::load_tile_rasters(dir, "mndwi", 1988), ValidationError);
    }
    SECTION("gapfill year missing") {
        const fs::path dir = fresh_dir("gapfill");
        write_year(dir, 2019, "", h);
        write_year(dir, 2020, "", h);
        write_year(dir, 2019, "_gapfill", h);
        REQUIRE_THROWS_AS(io::load_tile_rasters(dir, "mndwi", 1988), NoDataError);
    }
    SECTION("empty directory") {
        const fs::path dir = fresh_dir("empty");
        REQUIRE_THROWS_AS(io::load_tile_rasters(dir, "mndwi", 1988), NoDataError);
    }
}
