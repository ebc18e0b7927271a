#include "shoreline/core/errors.hpp"
#include "shoreline/geometry/projection.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace shoreline;

TEST_CASE("geographic_transform_albers_to_lonlat") {
    const geometry::GeographicTransform albers("EPSG:3577");

    const Coordinate meridian = albers.to_lonlat({0.0, -2478691.60});
    REQUIRE(meridian.x == Catch::Approx(132.0).margin(1e-3));
    REQUIRE(meridian.y == Catch::Approx(-23.0).margin(1e-3));

    // Same parallel, lower northing away from the central meridian
    const Coordinate east = albers.to_lonlat({1821840.06, -2607247.35});
    REQUIRE(east.x == Catch::Approx(150.0).margin(1e-3));
    REQUIRE(east.y == Catch::Approx(-23.0).margin(1e-3));
}

TEST_CASE("geographic_transform_rejects_unknown_crs") {
    REQUIRE_THROWS_AS(geometry::GeographicTransform(""), GeometryError);
    REQUIRE_THROWS_AS(geometry::GeographicTransform("EPSG:999999"), GeometryError);
}
