#include "shoreline/config/configuration.hpp"
#include "shoreline/core/events.hpp"
#include "shoreline/core/types.hpp"
#include "shoreline/core/utils.hpp"
#include "shoreline/pipeline/tile_pipeline.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

int run_command(const std::string &config_path, const std::string &runs_dir,
                const std::string &raster_dir, const std::string &study_area,
                bool dry_run, bool config_from_stdin) {
  using namespace shoreline;

  fs::path cfg_path(config_path);
  fs::path runs(runs_dir);
  const bool use_stdin_config = config_from_stdin || (config_path == "-");

  config::Config cfg;
  std::string cfg_text;
  try {
    if (use_stdin_config) {
      std::ostringstream ss;
      ss << std::cin.rdbuf();
      cfg_text = ss.str();
      if (cfg_text.empty()) {
        std::cerr << "Error: --stdin provided but no config YAML received"
                  << std::endl;
        return 1;
      }
      cfg = config::Config::from_yaml(YAML::Load(cfg_text));
    } else {
      if (!fs::exists(cfg_path)) {
        std::cerr << "Error: Config file not found: " << config_path
                  << std::endl;
        return 1;
      }
      cfg = config::Config::load(cfg_path);
    }
    if (!raster_dir.empty()) {
      cfg.inputs.raster_dir = raster_dir;
    }
    if (!study_area.empty()) {
      cfg.pipeline.study_area = study_area;
    }
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (cfg.inputs.raster_dir.empty() || !fs::exists(cfg.inputs.raster_dir)) {
    std::cerr << "Error: Raster directory not found: '" << cfg.inputs.raster_dir
              << "'" << std::endl;
    return 1;
  }

  std::string run_id = core::get_run_id();
  fs::path run_dir = runs / run_id;
  fs::create_directories(run_dir / "logs");
  fs::create_directories(run_dir / "outputs");

  // The effective configuration, including command line overrides
  cfg.save(run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", use_stdin_config ? std::string("-") : config_path},
                     {"raster_dir", cfg.inputs.raster_dir},
                     {"study_area", cfg.pipeline.study_area},
                     {"run_dir", run_dir.string()},
                     {"dry_run", dry_run}},
                    log_file);

  std::cerr << "Run ID: " << run_id << std::endl;
  std::cerr << "Output: " << run_dir.string() << std::endl;

  if (dry_run) {
    emitter.phase_start(run_id, Phase::SCAN_INPUT, log_file);
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "skipped",
                      {{"reason", "dry_run"},
                       {"raster_dir", cfg.inputs.raster_dir}},
                      log_file);
    std::cerr << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  pipeline::TilePipeline tile(cfg, run_id, log_file);
  const bool ok = tile.run(run_dir / "outputs");
  emitter.run_end(run_id, ok, ok ? "ok" : "error", log_file);
  return ok ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Shoreline change runner"};

  std::string config_path, runs_dir, raster_dir, study_area;
  bool dry_run = false;
  bool config_from_stdin = false;

  auto run_cmd = app.add_subcommand("run", "Run the pipeline for one tile");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--runs-dir", runs_dir, "Runs directory")->required();
  run_cmd->add_option("--raster-dir", raster_dir,
                      "Raster directory (overrides inputs.raster_dir)");
  run_cmd->add_option("--study-area", study_area,
                      "Study area id (overrides pipeline.study_area)");
  run_cmd->add_flag("--dry-run", dry_run, "Dry run");
  run_cmd->add_flag("--stdin", config_from_stdin,
                    "Read config YAML from stdin (use with --config -)");

  app.require_subcommand(1);
  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, runs_dir, raster_dir, study_area, dry_run,
                       config_from_stdin);
  }
  return 1;
}
