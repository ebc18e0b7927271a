#include "shoreline/config/configuration.hpp"
#include "shoreline/core/types.hpp"
#include "shoreline/core/utils.hpp"
#include "shoreline/io/climate_io.hpp"
#include "shoreline/io/fits_io.hpp"
#include "shoreline/io/raster_stack.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <tuple>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static json error_entry(const std::string& code, const std::string& message) {
    json err;
    err["severity"] = "error";
    err["code"] = code;
    err["message"] = message;
    return err;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << shoreline::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = shoreline::core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        YAML::Node node = YAML::Load(yaml_text);
        shoreline::config::Config cfg = shoreline::config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// scan <raster_dir> [--water-index mndwi] [--start-year Y] [--with-checksums]
// ============================================================================
int cmd_scan(const std::string& raster_dir, const std::string& water_index, int start_year,
             bool with_checksums) {
    json result;
    result["ok"] = false;
    result["raster_dir"] = raster_dir;
    result["files"] = json::array();
    result["years"] = json::array();
    result["layers"] = json::array();
    result["gapfill"] = false;
    result["errors"] = json::array();

    std::vector<shoreline::io::RasterFileEntry> entries;
    try {
        entries = shoreline::io::scan_raster_dir(raster_dir);
    } catch (const std::exception& e) {
        result["errors"].push_back(error_entry("raster_dir_not_found", e.what()));
        print_json(result);
        return 0;
    }

    std::set<int> years;
    std::set<std::string> layers;
    for (const auto& entry : entries) {
        json file;
        file["file_name"] = entry.path.filename().string();
        file["year"] = entry.year;
        file["layer"] = entry.layer;
        file["gapfill"] = entry.gapfill;
        try {
            int width = 0;
            int height = 0;
            int naxis = 0;
            std::tie(width, height, naxis) = shoreline::io::get_fits_dimensions(entry.path);
            file["width"] = width;
            file["height"] = height;
        } catch (const std::exception& e) {
            result["errors"].push_back(error_entry("fits_read_error", e.what()));
            continue;
        }
        if (with_checksums) {
            file["sha256"] = shoreline::core::sha256_file(entry.path);
        }
        if (!entry.gapfill) years.insert(entry.year);
        layers.insert(entry.layer);
        if (entry.gapfill) result["gapfill"] = true;
        result["files"].push_back(file);
    }
    for (int y : years) result["years"].push_back(y);
    for (const auto& l : layers) result["layers"].push_back(l);

    // Full consistency check through the loader
    try {
        const auto rasters = shoreline::io::load_tile_rasters(raster_dir, water_index, start_year);
        result["rows"] = rasters.annual.rows();
        result["cols"] = rasters.annual.cols();
        result["crs"] = rasters.annual.crs;
    } catch (const std::exception& e) {
        result["errors"].push_back(error_entry("tile_inconsistent", e.what()));
    }

    result["ok"] = result["errors"].empty();
    print_json(result);
    return 0;
}

// ============================================================================
// climate <path> [--name soi] [--first Y --last Y] [--no-detrend]
// ============================================================================
int cmd_climate(const std::string& path, const std::string& name, int first, int last,
                double nodata, int footer_lines, bool no_detrend) {
    json result;
    result["ok"] = false;
    result["name"] = name;
    result["path"] = path;
    result["values"] = json::object();
    result["errors"] = json::array();

    try {
        shoreline::config::ClimateIndexConfig cfg;
        cfg.name = name;
        cfg.path = path;
        cfg.nodata = nodata;
        cfg.footer_lines = footer_lines;
        cfg.detrend = !no_detrend;
        const auto series = shoreline::io::load_climate_index(cfg, first, last);
        for (const auto& [year, value] : series.values) {
            result["values"][std::to_string(year)] = value;
        }
        result["detrended"] = cfg.detrend;
        result["ok"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(error_entry("climate_read_error", e.what()));
    }

    print_json(result);
    return result["ok"].get<bool>() ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    CLI::App app{"Shoreline change utility commands (JSON output)"};
    app.require_subcommand(1);

    auto schema_cmd = app.add_subcommand("get-schema", "Print JSON schema for config");

    std::string cfg_path, cfg_yaml;
    bool cfg_stdin = false;
    bool strict = false;
    auto validate_cmd = app.add_subcommand("validate-config", "Validate config");
    validate_cmd->add_option("--path", cfg_path, "Config YAML file");
    validate_cmd->add_option("--yaml", cfg_yaml, "Config YAML text");
    validate_cmd->add_flag("--stdin", cfg_stdin, "Read config YAML from stdin");
    validate_cmd->add_flag("--strict-exit-codes", strict, "Exit 1 when invalid");

    std::string raster_dir;
    std::string water_index = "mndwi";
    int start_year = 0;
    bool with_checksums = false;
    auto scan_cmd = app.add_subcommand("scan", "Scan a tile raster directory");
    scan_cmd->add_option("raster_dir", raster_dir, "Raster directory")->required();
    scan_cmd->add_option("--water-index", water_index, "Water index layer name");
    scan_cmd->add_option("--start-year", start_year, "Drop years before this one");
    scan_cmd->add_flag("--with-checksums", with_checksums, "Add sha256 per file");

    std::string climate_path;
    std::string climate_name = "soi";
    int first = std::numeric_limits<int>::min();
    int last = std::numeric_limits<int>::max();
    double nodata = -99.99;
    int footer_lines = 9;
    bool no_detrend = false;
    auto climate_cmd = app.add_subcommand("climate", "Annual means of a climate index table");
    climate_cmd->add_option("path", climate_path, "Monthly index table")->required();
    climate_cmd->add_option("--name", climate_name, "Index name");
    climate_cmd->add_option("--first", first, "First year kept");
    climate_cmd->add_option("--last", last, "Last year kept");
    climate_cmd->add_option("--nodata", nodata, "Missing value sentinel");
    climate_cmd->add_option("--footer-lines", footer_lines, "Trailing lines to skip");
    climate_cmd->add_flag("--no-detrend", no_detrend, "Keep the linear trend");

    CLI11_PARSE(app, argc, argv);

    if (schema_cmd->parsed()) {
        return cmd_get_schema();
    }
    if (validate_cmd->parsed()) {
        if (cfg_path.empty() && cfg_yaml.empty() && !cfg_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(cfg_path, cfg_yaml, cfg_stdin, strict);
    }
    if (scan_cmd->parsed()) {
        return cmd_scan(raster_dir, water_index, start_year, with_checksums);
    }
    if (climate_cmd->parsed()) {
        return cmd_climate(climate_path, climate_name, first, last, nodata, footer_lines,
                           no_detrend);
    }
    return 1;
}
