#include "shoreline/pipeline/tile_pipeline.hpp"

#include "shoreline/analysis/points.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/stats.hpp"
#include "shoreline/io/fits_io.hpp"
#include "shoreline/masking/waterbody.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace shoreline::pipeline {

using namespace shoreline::geometry;
using json = nlohmann::json;

namespace {

int64_t count_set(const Matrix2Db& m) {
    return static_cast<int64_t>((m.array() != uint8_t(0)).count());
}

std::string feature_id(const json& properties) {
    auto it = properties.find("id");
    if (it == properties.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return it->dump();
}

// Rounded value, NaN kept so the writer emits null
json rounded(double v, int decimals) {
    return core::round_to(v, decimals);
}

void put_regression(json& props, const std::string& name, const analysis::RegressionResult& r,
                    const config::OutputConfig& out) {
    props["rate_" + name] = rounded(r.slope, out.distance_decimals);
    props["incpt_" + name] = rounded(r.intercept, out.distance_decimals);
    props["sig_" + name] = rounded(r.pvalue, out.stat_decimals);
    props["se_" + name] = rounded(r.standard_error, out.stat_decimals);
    props["outl_" + name] = r.outliers;
}

std::string output_stem(const config::Config& cfg) {
    return cfg.pipeline.study_area.empty() ? std::string("tile") : cfg.pipeline.study_area;
}

} // namespace

GeometryPtr select_study_area(const GeosContext& ctx, const io::FeatureCollection& areas,
                              const std::string& id) {
    if (id.empty()) {
        if (areas.features.size() != 1) {
            throw ValidationError("study area dataset holds " +
                                  std::to_string(areas.features.size()) +
                                  " features; pipeline.study_area must name one");
        }
        return clone(ctx, areas.features.front().geometry.get());
    }
    for (const auto& f : areas.features) {
        if (feature_id(f.properties) == id) {
            return clone(ctx, f.geometry.get());
        }
    }
    throw ValidationError("study area '" + id + "' not found");
}

TileInputs load_tile_inputs(const GeosContext& ctx, const config::Config& cfg) {
    const config::InputsConfig& in = cfg.inputs;
    TileInputs inputs;
    inputs.rasters = io::load_tile_rasters(in.raster_dir, in.water_index, in.start_year);
    const io::RasterStack& annual = inputs.rasters.annual;

    if (in.ocean_seeds_path.empty()) {
        throw NoDataError("no ocean seed dataset configured (inputs.ocean_seeds_path)");
    }
    const io::FeatureCollection seeds = io::read_geojson(ctx, in.ocean_seeds_path);
    for (const auto& f : seeds.features) {
        for (const auto& p : extract_points(ctx, f.geometry.get())) {
            inputs.ocean_seeds.push_back(p);
        }
    }
    if (inputs.ocean_seeds.empty()) {
        throw NoDataError("ocean seed dataset " + in.ocean_seeds_path + " holds no points");
    }

    if (!in.waterbody_path.empty()) {
        const io::FeatureCollection wb = io::read_geojson(ctx, in.waterbody_path);
        std::optional<io::FeatureCollection> mods;
        if (!in.waterbody_modifications_path.empty()) {
            mods = io::read_geojson(ctx, in.waterbody_modifications_path);
        }
        inputs.waterbodies = masking::select_waterbodies(ctx, wb, mods ? &*mods : nullptr);
    }

    if (!in.landcover_path.empty()) {
        inputs.landcover = io::read_fits_float(in.landcover_path).first;
    }

    if (!in.coastal_classification_path.empty()) {
        inputs.coastal_classification = io::read_geojson(ctx, in.coastal_classification_path);
    }

    if (!in.study_area_path.empty()) {
        const io::FeatureCollection areas = io::read_geojson(ctx, in.study_area_path);
        inputs.study_area = select_study_area(ctx, areas, cfg.pipeline.study_area);
    }

    const int first_year = annual.years.front();
    const int last_year = annual.years.back();
    for (const auto& index : cfg.climate.indices) {
        inputs.climate.push_back(io::load_climate_index(index, first_year, last_year));
    }
    return inputs;
}

OutputPaths output_paths(const config::Config& cfg, const fs::path& output_dir) {
    const std::string stem = output_stem(cfg);
    std::ostringstream suffix;
    suffix << stem << "_" << cfg.inputs.water_index << "_" << std::fixed << std::setprecision(2)
           << cfg.masking.index_threshold;

    OutputPaths paths;
    paths.diagnostic = output_dir / ("all_time_mask_" + stem + ".fits");
    paths.shorelines = output_dir / ("annualshorelines_" + suffix.str() + ".geojson");
    paths.rates = output_dir / ("ratesofchange_" + suffix.str() + ".geojson");
    return paths;
}

io::FeatureCollection shoreline_features(const GeosContext& ctx, const TileResult& result) {
    io::FeatureCollection fc;
    fc.crs = result.crs;
    for (const auto& seg : result.segments) {
        io::Feature f;
        f.geometry = clone(ctx, seg.geometry.get());
        f.properties = {{"year", seg.year}, {"certainty", seg.certainty}, {"maturity", seg.maturity}};
        fc.features.push_back(std::move(f));
    }
    return fc;
}

io::FeatureCollection rate_features(const GeosContext& ctx, const TileResult& result,
                                    const config::OutputConfig& out) {
    io::FeatureCollection fc;
    fc.crs = result.crs;
    if (!result.points) return fc;

    const PointResults& pr = *result.points;
    const analysis::MovementTable& mv = pr.movements;
    for (size_t i = 0; i < mv.points.size(); ++i) {
        json props = json::object();
        put_regression(props, "time", pr.rates.time[i], out);
        for (const auto& c : pr.rates.climate) {
            put_regression(props, c.name, c.results[i], out);
        }
        for (size_t k = 0; k < mv.years.size(); ++k) {
            props["dist_" + std::to_string(mv.years[k])] =
                rounded(mv.distances(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)),
                        out.distance_decimals);
        }
        const analysis::SummaryStats& s = pr.stats[i];
        props["valid_obs"] = s.valid_obs;
        props["valid_span"] = s.valid_span;
        props["sce"] = rounded(s.sce, out.distance_decimals);
        props["nsm"] = rounded(s.nsm, out.distance_decimals);
        props["max_year"] = s.max_year ? json(*s.max_year) : json(nullptr);
        props["min_year"] = s.min_year ? json(*s.min_year) : json(nullptr);

        io::Feature f;
        f.geometry = make_point(ctx, mv.points[i]);
        f.properties = std::move(props);
        fc.features.push_back(std::move(f));
    }
    return fc;
}

TilePipeline::TilePipeline(const config::Config& cfg, std::string run_id, std::ostream& log)
    : cfg_(cfg), run_id_(std::move(run_id)), log_(log) {}

template <typename Fn>
void TilePipeline::run_phase(Phase phase, Fn&& fn) {
    emitter_.phase_start(run_id_, phase, log_);
    json extra = json::object();
    try {
        fn(extra);
    } catch (const std::exception& e) {
        emitter_.phase_end(run_id_, phase, "error", {{"error", e.what()}}, log_);
        throw;
    }
    emitter_.phase_end(run_id_, phase, "ok", extra, log_);
}

void TilePipeline::skip_phase(Phase phase, const std::string& reason) {
    emitter_.phase_start(run_id_, phase, log_);
    emitter_.phase_end(run_id_, phase, "skipped", {{"reason", reason}}, log_);
}

PointResults TilePipeline::point_statistics(const TileInputs& inputs,
                                            const contour::ContourSet& contours,
                                            const std::vector<Coordinate>& points) {
    const int workers = cfg_.runtime_limits.parallel_workers;
    PointResults pr;

    run_phase(Phase::ANNUAL_MOVEMENTS, [&](json& extra) {
        pr.movements = analysis::annual_movements(points, contours, inputs.rasters.annual,
                                                  cfg_.points.baseline_year, cfg_.movements,
                                                  cfg_.output.distance_decimals, workers);
        extra["points"] = pr.movements.points.size();
        extra["years"] = pr.movements.years;
    });

    run_phase(Phase::REGRESSION, [&](json& extra) {
        pr.rates = analysis::calculate_regressions(pr.movements, inputs.climate, cfg_.regression,
                                                   workers);
        json regressors = json::array({"time"});
        for (const auto& c : pr.rates.climate) regressors.push_back(c.name);
        extra["regressors"] = regressors;
    });

    run_phase(Phase::STATISTICS, [&](json& extra) {
        const auto n_years = static_cast<Eigen::Index>(pr.movements.years.size());
        pr.stats.reserve(pr.movements.points.size());
        for (size_t i = 0; i < pr.movements.points.size(); ++i) {
            std::vector<double> row(static_cast<size_t>(n_years));
            for (Eigen::Index k = 0; k < n_years; ++k) {
                row[static_cast<size_t>(k)] = pr.movements.distances(static_cast<Eigen::Index>(i), k);
            }
            pr.stats.push_back(analysis::all_time_stats(pr.movements.years, row,
                                                        pr.rates.time[i].outliers,
                                                        cfg_.statistics.initial_year));
        }
        extra["points"] = pr.stats.size();
    });
    return pr;
}

TileResult TilePipeline::process(const TileInputs& inputs) {
    const io::RasterStack& annual = inputs.rasters.annual;
    const int rows = annual.rows();
    const int cols = annual.cols();
    const int baseline_year = cfg_.points.baseline_year;

    TileResult result;
    result.transform = annual.transform;
    result.crs = annual.crs;

    Matrix2Db waterbody;
    std::optional<Matrix2Db> landcover_water;
    run_phase(Phase::WATERBODY_MASK, [&](json& extra) {
        if (inputs.waterbodies) {
            waterbody = masking::rasterize_polygons(ctx_, inputs.waterbodies.get(),
                                                    annual.transform, rows, cols);
        } else {
            waterbody = Matrix2Db::Zero(rows, cols);
        }
        if (inputs.landcover) {
            if (inputs.landcover->rows() != rows || inputs.landcover->cols() != cols) {
                throw ValidationError("land cover grid does not match the tile rasters");
            }
            landcover_water = masking::landcover_water_mask(
                *inputs.landcover, cfg_.masking.landcover_water_classes,
                cfg_.masking.landcover_erosion_radius);
        }
        extra["waterbody_pixels"] = count_set(waterbody);
        extra["landcover"] = landcover_water.has_value();
    });

    run_phase(Phase::COASTAL_MASK, [&](json& extra) {
        result.masks = masking::contours_preprocess(inputs.rasters, waterbody,
                                                    landcover_water ? &*landcover_water : nullptr,
                                                    inputs.ocean_seeds, cfg_.masking);
        extra["years"] = result.masks.years;
        extra["coastal_pixels"] = count_set(result.masks.coastal);
        extra["all_time_land_pixels"] = count_set(result.masks.all_time_land);
    });

    run_phase(Phase::CONTOUR_EXTRACTION, [&](json& extra) {
        result.contours = contour::extract_annual_contours(
            ctx_, result.masks.years, result.masks.masked_index, cfg_.masking.index_threshold,
            result.transform, cfg_.contours.min_vertices,
            contour::parse_error_policy(cfg_.contours.error_policy));
        for (int year : result.contours.failed_years) {
            emitter_.warning(run_id_, "no contour extracted for year " + std::to_string(year), log_);
        }
        extra["contours"] = result.contours.contours.size();
        extra["failed_years"] = result.contours.failed_years;
    });

    std::optional<std::vector<Coordinate>> points;
    run_phase(Phase::POINT_SAMPLING, [&](json& extra) {
        const contour::Contour* baseline = result.contours.find_year(baseline_year);
        if (!baseline) {
            emitter_.warning(run_id_,
                             "baseline year " + std::to_string(baseline_year) +
                                 " has no contour; point statistics skipped",
                             log_);
            extra["points"] = 0;
            return;
        }
        points = analysis::points_on_line(ctx_, baseline->geometry.get(), cfg_.points.spacing);
        extra["sampled"] = points->size();

        if (inputs.coastal_classification) {
            points = analysis::rocky_shores_clip(ctx_, *points, *inputs.coastal_classification,
                                                 cfg_.points.rocky_buffer);
            if (!points) {
                emitter_.warning(run_id_,
                                 "no non-rocky shoreline in the coastal classification; "
                                 "point statistics skipped",
                                 log_);
            }
        }
        if (points && inputs.study_area) {
            points = analysis::clip_points(ctx_, *points, inputs.study_area.get());
        }
        if (points && points->empty()) {
            points.reset();
        }
        extra["points"] = points ? points->size() : 0;
    });

    if (points) {
        try {
            result.points = point_statistics(inputs, result.contours, *points);
        } catch (const std::exception& e) {
            if (cfg_.pipeline.abort_on_fail) throw;
            emitter_.warning(run_id_, std::string("point statistics dropped: ") + e.what(), log_);
        }
    } else {
        skip_phase(Phase::ANNUAL_MOVEMENTS, "no_points");
        skip_phase(Phase::REGRESSION, "no_points");
        skip_phase(Phase::STATISTICS, "no_points");
    }

    run_phase(Phase::CERTAINTY, [&](json& extra) {
        const auto zones = analysis::certainty_zones(ctx_, result.masks.diagnostic,
                                                     result.transform, cfg_.certainty);
        auto segments = analysis::contour_certainty(ctx_, result.contours, zones,
                                                    cfg_.certainty, baseline_year, result.crs);
        if (inputs.study_area) {
            std::vector<analysis::ContourSegment> clipped;
            for (auto& seg : segments) {
                GeometryPtr inside = lineal_part(
                    ctx_, intersection(ctx_, seg.geometry.get(), inputs.study_area.get()).get());
                if (is_empty(ctx_, inside.get())) continue;
                seg.geometry = std::move(inside);
                clipped.push_back(std::move(seg));
            }
            segments = std::move(clipped);
        }
        result.segments = std::move(segments);

        json codes = json::array();
        for (const auto& z : zones) codes.push_back(z.code);
        extra["zones"] = codes;
        extra["segments"] = result.segments.size();
    });

    return result;
}

std::vector<fs::path> TilePipeline::write_outputs(const TileResult& result,
                                                  const fs::path& output_dir) {
    fs::create_directories(output_dir);
    const OutputPaths paths = output_paths(cfg_, output_dir);
    std::vector<fs::path> written;

    io::FitsHeader header;
    io::write_transform(header, result.transform);
    if (!result.crs.empty()) {
        header.set("CRS", result.crs);
    }
    io::write_fits_byte(paths.diagnostic, result.masks.diagnostic, header);
    emitter_.artifact_written(run_id_, Phase::EXPORT, "diagnostic_raster",
                              paths.diagnostic.string(), log_);
    written.push_back(paths.diagnostic);

    io::write_geojson(ctx_, paths.shorelines, shoreline_features(ctx_, result));
    emitter_.artifact_written(run_id_, Phase::EXPORT, "annual_shorelines",
                              paths.shorelines.string(), log_);
    written.push_back(paths.shorelines);

    if (result.points) {
        io::write_geojson(ctx_, paths.rates, rate_features(ctx_, result, cfg_.output));
        emitter_.artifact_written(run_id_, Phase::EXPORT, "rates_of_change",
                                  paths.rates.string(), log_);
        written.push_back(paths.rates);
    }

    if (cfg_.output.write_masked_rasters) {
        for (size_t i = 0; i < result.masks.years.size(); ++i) {
            const fs::path p = output_dir / ("masked_" + std::to_string(result.masks.years[i]) +
                                             "_" + cfg_.inputs.water_index + ".fits");
            io::write_fits_float(p, result.masks.masked_index[i], header);
            emitter_.artifact_written(run_id_, Phase::EXPORT, "masked_index", p.string(), log_);
            written.push_back(p);
        }
    }
    return written;
}

bool TilePipeline::run(const fs::path& output_dir) {
    try {
        TileInputs inputs;
        run_phase(Phase::SCAN_INPUT, [&](json& extra) {
            inputs = load_tile_inputs(ctx_, cfg_);
            const io::RasterStack& annual = inputs.rasters.annual;
            extra["raster_dir"] = cfg_.inputs.raster_dir;
            extra["years"] = annual.years;
            extra["rows"] = annual.rows();
            extra["cols"] = annual.cols();
            extra["gapfill"] = inputs.rasters.gapfill.has_value();
            extra["ocean_seeds"] = inputs.ocean_seeds.size();
            extra["climate_indices"] = inputs.climate.size();
        });

        TileResult result = process(inputs);

        run_phase(Phase::EXPORT, [&](json& extra) {
            json files = json::array();
            for (const auto& p : write_outputs(result, output_dir)) {
                files.push_back(p.filename().string());
            }
            extra["files"] = files;
            extra["points_exported"] = result.points.has_value();
        });

        emitter_.phase_start(run_id_, Phase::DONE, log_);
        emitter_.phase_end(run_id_, Phase::DONE, "ok", json::object(), log_);
    } catch (const std::exception& e) {
        emitter_.error(run_id_, e.what(), log_);
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace shoreline::pipeline
