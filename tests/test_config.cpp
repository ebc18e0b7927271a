#include "shoreline/config/configuration.hpp"
#include "shoreline/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using shoreline::config::Config;

TEST_CASE("config_defaults_validate") {
    Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.inputs.water_index == "mndwi");
    REQUIRE(cfg.masking.buffer_pixels == 25);
    REQUIRE(cfg.contours.min_vertices == 10);
    REQUIRE(cfg.points.baseline_year == 2020);
    REQUIRE(cfg.regression.mad_threshold == Catch::Approx(3.5));
    REQUIRE(cfg.certainty.uncertain_classes == std::vector<int>{4, 5});
    REQUIRE(cfg.masking.landcover_water_classes == std::vector<int>{0, 80});
    REQUIRE(cfg.certainty.artifact_min_lat == Catch::Approx(-23.0));
}

TEST_CASE("config_from_yaml_overrides_sections") {
    const char* text = R"(
pipeline:
  study_area: "1234"
  abort_on_fail: false
inputs:
  raster_dir: /data/tile
  water_index: awei
masking:
  index_threshold: -0.1
  annual_connectivity: 8
  landcover_water_classes: [1, 2, 3]
contours:
  error_policy: raise
certainty:
  artifact_years: [1990]
  artifact_min_lat: -30.5
climate:
  indices:
    - name: soi
      path: /data/soi.long.data
      detrend: false
runtime_limits:
  parallel_workers: 2
)";
    Config cfg = Config::from_yaml(YAML::Load(text));
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.pipeline.study_area == "1234");
    REQUIRE_FALSE(cfg.pipeline.abort_on_fail);
    REQUIRE(cfg.inputs.water_index == "awei");
    REQUIRE(cfg.masking.index_threshold == Catch::Approx(-0.1f));
    REQUIRE(cfg.masking.annual_connectivity == 8);
    REQUIRE(cfg.masking.landcover_water_classes == std::vector<int>{1, 2, 3});
    REQUIRE(cfg.contours.error_policy == "raise");
    REQUIRE(cfg.certainty.artifact_years == std::vector<int>{1990});
    REQUIRE(cfg.certainty.artifact_min_lat == Catch::Approx(-30.5));
    REQUIRE(cfg.climate.indices.size() == 1);
    REQUIRE(cfg.climate.indices[0].name == "soi");
    REQUIRE_FALSE(cfg.climate.indices[0].detrend);
    REQUIRE(cfg.climate.indices[0].footer_lines == 9);
    REQUIRE(cfg.runtime_limits.parallel_workers == 2);
}

TEST_CASE("config_to_yaml_round_trips") {
    Config cfg;
    cfg.inputs.raster_dir = "/tmp/rasters";
    cfg.points.spacing = 45.0;
    cfg.climate.indices.push_back({"soi", "/tmp/soi.data", -99.99, 9, true});

    Config back = Config::from_yaml(cfg.to_yaml());
    REQUIRE(back.inputs.raster_dir == "/tmp/rasters");
    REQUIRE(back.points.spacing == Catch::Approx(45.0));
    REQUIRE(back.climate.indices.size() == 1);
    REQUIRE(back.climate.indices[0].path == "/tmp/soi.data");
}

TEST_CASE("config_validate_rejects_bad_values") {
    Config cfg;
    cfg.masking.coastal_connectivity = 6;
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.contours.error_policy = "maybe";
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.contours.min_vertices = 1;
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.points.spacing = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.certainty.artifact_min_lat = -2500000.0;
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.runtime_limits.parallel_workers = 0;
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);

    cfg = Config();
    cfg.climate.indices.push_back({"soi", "/a", -99.99, 9, true});
    cfg.climate.indices.push_back({"soi", "/b", -99.99, 9, true});
    REQUIRE_THROWS_AS(cfg.validate(), shoreline::ValidationError);
}

TEST_CASE("config_bad_yaml_value_is_config_error") {
    REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("points:\n  spacing: wide\n")),
                      shoreline::ConfigError);
}

TEST_CASE("config_schema_is_json") {
    const auto schema = nlohmann::json::parse(shoreline::config::get_schema_json());
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].contains("masking"));
    REQUIRE(schema["properties"].contains("certainty"));
}
