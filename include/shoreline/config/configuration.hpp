#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace shoreline::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = true;
  std::string study_area;
};

struct InputsConfig {
  std::string raster_dir;
  std::string water_index = "mndwi";
  int start_year = 1988;
  std::string ocean_seeds_path;
  std::string waterbody_path;
  std::string waterbody_modifications_path;
  std::string landcover_path;
  std::string coastal_classification_path;
  std::string study_area_path;
};

struct MaskingConfig {
  float index_threshold = 0.0f;
  float stdev_threshold = 0.25f;
  int low_count_threshold = 5;   // count below this is low-observation
  int gapfill_min_count = 5;     // primary kept only where count exceeds this
  float persistence_fraction = 0.5f;
  int erosion_radius = 2;
  float all_time_land_fraction = 0.2f;
  int closing_radius = 5;
  int buffer_pixels = 25;
  int coastal_connectivity = 4;
  int annual_connectivity = 4;
  int annual_dilation = 3;
  int temporal_connectivity = 8;
  std::vector<int> landcover_water_classes{0, 80};
  int landcover_erosion_radius = 20;
};

struct ContoursConfig {
  int min_vertices = 10;
  std::string error_policy = "ignore"; // ignore | raise
};

struct PointsConfig {
  int baseline_year = 2020;
  double spacing = 30.0;
  double rocky_buffer = 50.0;
};

struct MovementsConfig {
  double max_valid_distance = 1000.0;
};

struct RegressionConfig {
  double mad_threshold = 3.5;
  int decimals = 3;
};

struct StatisticsConfig {
  int initial_year = 1988;
};

struct CertaintyConfig {
  std::vector<int> uncertain_classes{4, 5};
  int sieve_size = 3;
  double simplify_tolerance = 30.0;
  bool artifact_override = true;
  std::vector<int> artifact_years{1991, 1992};
  double artifact_min_lat = -23.0; // degrees, geographic
};

struct ClimateIndexConfig {
  std::string name;
  std::string path;
  double nodata = -99.99;
  int footer_lines = 9;
  bool detrend = true;
};

struct ClimateConfig {
  std::vector<ClimateIndexConfig> indices;
};

struct OutputConfig {
  int distance_decimals = 2;
  int stat_decimals = 3;
  bool write_masked_rasters = false;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
};

struct Config {
  PipelineConfig pipeline;
  InputsConfig inputs;
  MaskingConfig masking;
  ContoursConfig contours;
  PointsConfig points;
  MovementsConfig movements;
  RegressionConfig regression;
  StatisticsConfig statistics;
  CertaintyConfig certainty;
  ClimateConfig climate;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace shoreline::config
