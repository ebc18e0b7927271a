#pragma once

#include "shoreline/analysis/certainty.hpp"
#include "shoreline/analysis/movements.hpp"
#include "shoreline/analysis/regression.hpp"
#include "shoreline/analysis/statistics.hpp"
#include "shoreline/config/configuration.hpp"
#include "shoreline/contour/extraction.hpp"
#include "shoreline/core/events.hpp"
#include "shoreline/io/climate_io.hpp"
#include "shoreline/io/raster_stack.hpp"
#include "shoreline/io/vector_io.hpp"
#include "shoreline/masking/coastal.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace shoreline::pipeline {

// Everything one tile run reads, loaded up front
struct TileInputs {
    io::TileRasters rasters;
    std::vector<Coordinate> ocean_seeds;
    // Selected and modified waterbody union; null when none configured
    geometry::GeometryPtr waterbodies;
    std::optional<Matrix2Df> landcover;
    std::optional<io::FeatureCollection> coastal_classification;
    // Null when no study area is configured
    geometry::GeometryPtr study_area;
    std::vector<io::ClimateSeries> climate;
};

struct PointResults {
    analysis::MovementTable movements;
    analysis::RateTable rates;
    std::vector<analysis::SummaryStats> stats;
};

struct TileResult {
    GeoTransform transform;
    std::string crs;
    masking::CoastalMasks masks;
    contour::ContourSet contours;
    std::vector<analysis::ContourSegment> segments;
    // Absent when no reference point survived clipping
    std::optional<PointResults> points;
};

struct OutputPaths {
    fs::path diagnostic;
    fs::path shorelines;
    fs::path rates;
};

// The study-area feature whose `id` matches, or the only feature when id
// is empty. Throws ValidationError when nothing matches.
geometry::GeometryPtr select_study_area(const geometry::GeosContext& ctx,
                                        const io::FeatureCollection& areas,
                                        const std::string& id);

TileInputs load_tile_inputs(const geometry::GeosContext& ctx, const config::Config& cfg);

OutputPaths output_paths(const config::Config& cfg, const fs::path& output_dir);

io::FeatureCollection shoreline_features(const geometry::GeosContext& ctx,
                                         const TileResult& result);

// One point feature per reference point with rates, distances and
// summary statistics at output precision
io::FeatureCollection rate_features(const geometry::GeosContext& ctx, const TileResult& result,
                                    const config::OutputConfig& out);

// Runs the phases of one tile and reports them as run events
class TilePipeline {
public:
    TilePipeline(const config::Config& cfg, std::string run_id, std::ostream& log);

    // Loads inputs, processes and writes outputs. Phase failures are
    // reported as events and end in false.
    bool run(const fs::path& output_dir);

    // Processing phases on loaded inputs; throws on failure
    TileResult process(const TileInputs& inputs);

    std::vector<fs::path> write_outputs(const TileResult& result, const fs::path& output_dir);

    const geometry::GeosContext& context() const { return ctx_; }

private:
    template <typename Fn>
    void run_phase(Phase phase, Fn&& fn);

    void skip_phase(Phase phase, const std::string& reason);

    // Movements, regressions and summary statistics of the reference points
    PointResults point_statistics(const TileInputs& inputs, const contour::ContourSet& contours,
                                  const std::vector<Coordinate>& points);

    const config::Config& cfg_;
    std::string run_id_;
    std::ostream& log_;
    core::EventEmitter emitter_;
    geometry::GeosContext ctx_;
};

} // namespace shoreline::pipeline
