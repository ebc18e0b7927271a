#include "shoreline/config/configuration.hpp"
#include "shoreline/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <set>

namespace shoreline::config {

static void read_int_list(const YAML::Node& n, std::vector<int>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& v : n) {
            out.push_back(v.as<int>());
        }
    }
}

static YAML::Node int_list_node(const std::vector<int>& values) {
    YAML::Node n(YAML::NodeType::Sequence);
    for (int v : values) {
        n.push_back(v);
    }
    return n;
}

static bool is_connectivity(int v) {
    return v == 4 || v == 8;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
            if (p["study_area"]) cfg.pipeline.study_area = p["study_area"].as<std::string>();
        }

        if (node["inputs"]) {
            auto i = node["inputs"];
            if (i["raster_dir"]) cfg.inputs.raster_dir = i["raster_dir"].as<std::string>();
            if (i["water_index"]) cfg.inputs.water_index = i["water_index"].as<std::string>();
            if (i["start_year"]) cfg.inputs.start_year = i["start_year"].as<int>();
            if (i["ocean_seeds_path"]) cfg.inputs.ocean_seeds_path = i["ocean_seeds_path"].as<std::string>();
            if (i["waterbody_path"]) cfg.inputs.waterbody_path = i["waterbody_path"].as<std::string>();
            if (i["waterbody_modifications_path"]) cfg.inputs.waterbody_modifications_path = i["waterbody_modifications_path"].as<std::string>();
            if (i["landcover_path"]) cfg.inputs.landcover_path = i["landcover_path"].as<std::string>();
            if (i["coastal_classification_path"]) cfg.inputs.coastal_classification_path = i["coastal_classification_path"].as<std::string>();
            if (i["study_area_path"]) cfg.inputs.study_area_path = i["study_area_path"].as<std::string>();
        }

        if (node["masking"]) {
            auto m = node["masking"];
            if (m["index_threshold"]) cfg.masking.index_threshold = m["index_threshold"].as<float>();
            if (m["stdev_threshold"]) cfg.masking.stdev_threshold = m["stdev_threshold"].as<float>();
            if (m["low_count_threshold"]) cfg.masking.low_count_threshold = m["low_count_threshold"].as<int>();
            if (m["gapfill_min_count"]) cfg.masking.gapfill_min_count = m["gapfill_min_count"].as<int>();
            if (m["persistence_fraction"]) cfg.masking.persistence_fraction = m["persistence_fraction"].as<float>();
            if (m["erosion_radius"]) cfg.masking.erosion_radius = m["erosion_radius"].as<int>();
            if (m["all_time_land_fraction"]) cfg.masking.all_time_land_fraction = m["all_time_land_fraction"].as<float>();
            if (m["closing_radius"]) cfg.masking.closing_radius = m["closing_radius"].as<int>();
            if (m["buffer_pixels"]) cfg.masking.buffer_pixels = m["buffer_pixels"].as<int>();
            if (m["coastal_connectivity"]) cfg.masking.coastal_connectivity = m["coastal_connectivity"].as<int>();
            if (m["annual_connectivity"]) cfg.masking.annual_connectivity = m["annual_connectivity"].as<int>();
            if (m["annual_dilation"]) cfg.masking.annual_dilation = m["annual_dilation"].as<int>();
            if (m["temporal_connectivity"]) cfg.masking.temporal_connectivity = m["temporal_connectivity"].as<int>();
            read_int_list(m["landcover_water_classes"], cfg.masking.landcover_water_classes);
            if (m["landcover_erosion_radius"]) cfg.masking.landcover_erosion_radius = m["landcover_erosion_radius"].as<int>();
        }

        if (node["contours"]) {
            auto c = node["contours"];
            if (c["min_vertices"]) cfg.contours.min_vertices = c["min_vertices"].as<int>();
            if (c["error_policy"]) cfg.contours.error_policy = c["error_policy"].as<std::string>();
        }

        if (node["points"]) {
            auto p = node["points"];
            if (p["baseline_year"]) cfg.points.baseline_year = p["baseline_year"].as<int>();
            if (p["spacing"]) cfg.points.spacing = p["spacing"].as<double>();
            if (p["rocky_buffer"]) cfg.points.rocky_buffer = p["rocky_buffer"].as<double>();
        }

        if (node["movements"]) {
            auto m = node["movements"];
            if (m["max_valid_distance"]) cfg.movements.max_valid_distance = m["max_valid_distance"].as<double>();
        }

        if (node["regression"]) {
            auto r = node["regression"];
            if (r["mad_threshold"]) cfg.regression.mad_threshold = r["mad_threshold"].as<double>();
            if (r["decimals"]) cfg.regression.decimals = r["decimals"].as<int>();
        }

        if (node["statistics"]) {
            auto s = node["statistics"];
            if (s["initial_year"]) cfg.statistics.initial_year = s["initial_year"].as<int>();
        }

        if (node["certainty"]) {
            auto c = node["certainty"];
            read_int_list(c["uncertain_classes"], cfg.certainty.uncertain_classes);
            if (c["sieve_size"]) cfg.certainty.sieve_size = c["sieve_size"].as<int>();
            if (c["simplify_tolerance"]) cfg.certainty.simplify_tolerance = c["simplify_tolerance"].as<double>();
            if (c["artifact_override"]) cfg.certainty.artifact_override = c["artifact_override"].as<bool>();
            read_int_list(c["artifact_years"], cfg.certainty.artifact_years);
            if (c["artifact_min_lat"]) cfg.certainty.artifact_min_lat = c["artifact_min_lat"].as<double>();
        }

        if (node["climate"] && node["climate"]["indices"]) {
            auto list = node["climate"]["indices"];
            if (!list.IsSequence()) {
                throw ConfigError("climate.indices must be a list");
            }
            for (const auto& item : list) {
                ClimateIndexConfig ci;
                if (item["name"]) ci.name = item["name"].as<std::string>();
                if (item["path"]) ci.path = item["path"].as<std::string>();
                if (item["nodata"]) ci.nodata = item["nodata"].as<double>();
                if (item["footer_lines"]) ci.footer_lines = item["footer_lines"].as<int>();
                if (item["detrend"]) ci.detrend = item["detrend"].as<bool>();
                cfg.climate.indices.push_back(ci);
            }
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["distance_decimals"]) cfg.output.distance_decimals = o["distance_decimals"].as<int>();
            if (o["stat_decimals"]) cfg.output.stat_decimals = o["stat_decimals"].as<int>();
            if (o["write_masked_rasters"]) cfg.output.write_masked_rasters = o["write_masked_rasters"].as<bool>();
        }

        if (node["runtime_limits"]) {
            auto r = node["runtime_limits"];
            if (r["parallel_workers"]) cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;
    node["pipeline"]["study_area"] = pipeline.study_area;

    node["inputs"]["raster_dir"] = inputs.raster_dir;
    node["inputs"]["water_index"] = inputs.water_index;
    node["inputs"]["start_year"] = inputs.start_year;
    node["inputs"]["ocean_seeds_path"] = inputs.ocean_seeds_path;
    node["inputs"]["waterbody_path"] = inputs.waterbody_path;
    node["inputs"]["waterbody_modifications_path"] = inputs.waterbody_modifications_path;
    node["inputs"]["landcover_path"] = inputs.landcover_path;
    node["inputs"]["coastal_classification_path"] = inputs.coastal_classification_path;
    node["inputs"]["study_area_path"] = inputs.study_area_path;

    node["masking"]["index_threshold"] = masking.index_threshold;
    node["masking"]["stdev_threshold"] = masking.stdev_threshold;
    node["masking"]["low_count_threshold"] = masking.low_count_threshold;
    node["masking"]["gapfill_min_count"] = masking.gapfill_min_count;
    node["masking"]["persistence_fraction"] = masking.persistence_fraction;
    node["masking"]["erosion_radius"] = masking.erosion_radius;
    node["masking"]["all_time_land_fraction"] = masking.all_time_land_fraction;
    node["masking"]["closing_radius"] = masking.closing_radius;
    node["masking"]["buffer_pixels"] = masking.buffer_pixels;
    node["masking"]["coastal_connectivity"] = masking.coastal_connectivity;
    node["masking"]["annual_connectivity"] = masking.annual_connectivity;
    node["masking"]["annual_dilation"] = masking.annual_dilation;
    node["masking"]["temporal_connectivity"] = masking.temporal_connectivity;
    node["masking"]["landcover_water_classes"] = int_list_node(masking.landcover_water_classes);
    node["masking"]["landcover_erosion_radius"] = masking.landcover_erosion_radius;

    node["contours"]["min_vertices"] = contours.min_vertices;
    node["contours"]["error_policy"] = contours.error_policy;

    node["points"]["baseline_year"] = points.baseline_year;
    node["points"]["spacing"] = points.spacing;
    node["points"]["rocky_buffer"] = points.rocky_buffer;

    node["movements"]["max_valid_distance"] = movements.max_valid_distance;

    node["regression"]["mad_threshold"] = regression.mad_threshold;
    node["regression"]["decimals"] = regression.decimals;

    node["statistics"]["initial_year"] = statistics.initial_year;

    node["certainty"]["uncertain_classes"] = int_list_node(certainty.uncertain_classes);
    node["certainty"]["sieve_size"] = certainty.sieve_size;
    node["certainty"]["simplify_tolerance"] = certainty.simplify_tolerance;
    node["certainty"]["artifact_override"] = certainty.artifact_override;
    node["certainty"]["artifact_years"] = int_list_node(certainty.artifact_years);
    node["certainty"]["artifact_min_lat"] = certainty.artifact_min_lat;

    YAML::Node indices(YAML::NodeType::Sequence);
    for (const auto& ci : climate.indices) {
        YAML::Node item;
        item["name"] = ci.name;
        item["path"] = ci.path;
        item["nodata"] = ci.nodata;
        item["footer_lines"] = ci.footer_lines;
        item["detrend"] = ci.detrend;
        indices.push_back(item);
    }
    node["climate"]["indices"] = indices;

    node["output"]["distance_decimals"] = output.distance_decimals;
    node["output"]["stat_decimals"] = output.stat_decimals;
    node["output"]["write_masked_rasters"] = output.write_masked_rasters;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;

    return node;
}

void Config::validate() const {
    if (inputs.water_index.empty()) {
        throw ValidationError("inputs.water_index must not be empty");
    }

    if (!std::isfinite(masking.index_threshold)) {
        throw ValidationError("masking.index_threshold must be finite");
    }
    if (masking.stdev_threshold < 0.0f) {
        throw ValidationError("masking.stdev_threshold must be >= 0");
    }
    if (masking.low_count_threshold < 0 || masking.gapfill_min_count < 0) {
        throw ValidationError("masking.low_count_threshold and masking.gapfill_min_count must be >= 0");
    }
    if (masking.persistence_fraction < 0.0f || masking.persistence_fraction > 1.0f) {
        throw ValidationError("masking.persistence_fraction must be in [0,1]");
    }
    if (masking.all_time_land_fraction < 0.0f || masking.all_time_land_fraction > 1.0f) {
        throw ValidationError("masking.all_time_land_fraction must be in [0,1]");
    }
    if (masking.erosion_radius < 0 || masking.closing_radius < 0 ||
        masking.annual_dilation < 0 || masking.landcover_erosion_radius < 0) {
        throw ValidationError("masking radii and dilation must be >= 0");
    }
    if (masking.buffer_pixels < 1) {
        throw ValidationError("masking.buffer_pixels must be >= 1");
    }
    if (!is_connectivity(masking.coastal_connectivity) ||
        !is_connectivity(masking.annual_connectivity) ||
        !is_connectivity(masking.temporal_connectivity)) {
        throw ValidationError("masking connectivity values must be 4 or 8");
    }

    if (contours.min_vertices < 2) {
        throw ValidationError("contours.min_vertices must be >= 2");
    }
    if (contours.error_policy != "ignore" && contours.error_policy != "raise") {
        throw ValidationError("contours.error_policy must be 'ignore' or 'raise'");
    }

    if (!(points.spacing > 0.0)) {
        throw ValidationError("points.spacing must be > 0");
    }
    if (points.rocky_buffer < 0.0) {
        throw ValidationError("points.rocky_buffer must be >= 0");
    }

    if (!(movements.max_valid_distance > 0.0)) {
        throw ValidationError("movements.max_valid_distance must be > 0");
    }

    if (!(regression.mad_threshold > 0.0)) {
        throw ValidationError("regression.mad_threshold must be > 0");
    }
    if (regression.decimals < 0 || regression.decimals > 12) {
        throw ValidationError("regression.decimals must be in [0,12]");
    }

    if (certainty.uncertain_classes.empty()) {
        throw ValidationError("certainty.uncertain_classes must not be empty");
    }
    for (int c : certainty.uncertain_classes) {
        if (c < 1 || c > 255) {
            throw ValidationError("certainty.uncertain_classes entries must be in [1,255]");
        }
    }
    if (certainty.sieve_size < 0) {
        throw ValidationError("certainty.sieve_size must be >= 0");
    }
    if (certainty.simplify_tolerance < 0.0) {
        throw ValidationError("certainty.simplify_tolerance must be >= 0");
    }
    if (certainty.artifact_min_lat < -90.0 || certainty.artifact_min_lat > 90.0) {
        throw ValidationError("certainty.artifact_min_lat must be in [-90,90]");
    }

    std::set<std::string> names;
    for (const auto& ci : climate.indices) {
        if (ci.name.empty()) {
            throw ValidationError("climate.indices[].name must not be empty");
        }
        if (ci.name == "time") {
            throw ValidationError("climate index name 'time' is reserved");
        }
        if (!names.insert(ci.name).second) {
            throw ValidationError("duplicate climate index name: " + ci.name);
        }
        if (ci.path.empty()) {
            throw ValidationError("climate index '" + ci.name + "' requires a path");
        }
        if (ci.footer_lines < 0) {
            throw ValidationError("climate.indices[].footer_lines must be >= 0");
        }
    }

    if (output.distance_decimals < 0 || output.distance_decimals > 12 ||
        output.stat_decimals < 0 || output.stat_decimals > 12) {
        throw ValidationError("output decimals must be in [0,12]");
    }

    if (runtime_limits.parallel_workers < 1 || runtime_limits.parallel_workers > 64) {
        throw ValidationError("runtime_limits.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "pipeline": {
      "type": "object",
      "properties": {
        "abort_on_fail": {"type": "boolean"},
        "study_area": {"type": "string"}
      }
    },
    "inputs": {
      "type": "object",
      "properties": {
        "raster_dir": {"type": "string"},
        "water_index": {"type": "string", "minLength": 1},
        "start_year": {"type": "integer"},
        "ocean_seeds_path": {"type": "string"},
        "waterbody_path": {"type": "string"},
        "waterbody_modifications_path": {"type": "string"},
        "landcover_path": {"type": "string"},
        "coastal_classification_path": {"type": "string"},
        "study_area_path": {"type": "string"}
      }
    },
    "masking": {
      "type": "object",
      "properties": {
        "index_threshold": {"type": "number"},
        "stdev_threshold": {"type": "number", "minimum": 0},
        "low_count_threshold": {"type": "integer", "minimum": 0},
        "gapfill_min_count": {"type": "integer", "minimum": 0},
        "persistence_fraction": {"type": "number", "minimum": 0, "maximum": 1},
        "erosion_radius": {"type": "integer", "minimum": 0},
        "all_time_land_fraction": {"type": "number", "minimum": 0, "maximum": 1},
        "closing_radius": {"type": "integer", "minimum": 0},
        "buffer_pixels": {"type": "integer", "minimum": 1},
        "coastal_connectivity": {"type": "integer", "enum": [4, 8]},
        "annual_connectivity": {"type": "integer", "enum": [4, 8]},
        "annual_dilation": {"type": "integer", "minimum": 0},
        "temporal_connectivity": {"type": "integer", "enum": [4, 8]},
        "landcover_water_classes": {"type": "array", "items": {"type": "integer"}},
        "landcover_erosion_radius": {"type": "integer", "minimum": 0}
      }
    },
    "contours": {
      "type": "object",
      "properties": {
        "min_vertices": {"type": "integer", "minimum": 2},
        "error_policy": {"type": "string", "enum": ["ignore", "raise"]}
      }
    },
    "points": {
      "type": "object",
      "properties": {
        "baseline_year": {"type": "integer"},
        "spacing": {"type": "number", "exclusiveMinimum": 0},
        "rocky_buffer": {"type": "number", "minimum": 0}
      }
    },
    "movements": {
      "type": "object",
      "properties": {
        "max_valid_distance": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "regression": {
      "type": "object",
      "properties": {
        "mad_threshold": {"type": "number", "exclusiveMinimum": 0},
        "decimals": {"type": "integer", "minimum": 0, "maximum": 12}
      }
    },
    "statistics": {
      "type": "object",
      "properties": {
        "initial_year": {"type": "integer"}
      }
    },
    "certainty": {
      "type": "object",
      "properties": {
        "uncertain_classes": {"type": "array", "items": {"type": "integer", "minimum": 1, "maximum": 255}},
        "sieve_size": {"type": "integer", "minimum": 0},
        "simplify_tolerance": {"type": "number", "minimum": 0},
        "artifact_override": {"type": "boolean"},
        "artifact_years": {"type": "array", "items": {"type": "integer"}},
        "artifact_min_lat": {"type": "number", "minimum": -90, "maximum": 90}
      }
    },
    "climate": {
      "type": "object",
      "properties": {
        "indices": {
          "type": "array",
          "items": {
            "type": "object",
            "required": ["name", "path"],
            "properties": {
              "name": {"type": "string", "minLength": 1},
              "path": {"type": "string", "minLength": 1},
              "nodata": {"type": "number"},
              "footer_lines": {"type": "integer", "minimum": 0},
              "detrend": {"type": "boolean"}
            }
          }
        }
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "distance_decimals": {"type": "integer", "minimum": 0, "maximum": 12},
        "stat_decimals": {"type": "integer", "minimum": 0, "maximum": 12},
        "write_masked_rasters": {"type": "boolean"}
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    }
  }
})";
}

} // namespace shoreline::config
