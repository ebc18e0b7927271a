#pragma once

#include "shoreline/config/configuration.hpp"
#include "shoreline/io/raster_stack.hpp"
#include <string>
#include <vector>

namespace shoreline::masking {

struct ReliabilityFlags {
    Matrix2Db persistent_stdev;
    Matrix2Db persistent_lowobs;
};

// Per-year land classification of the gap-filled stack. not_water also
// includes nodata pixels.
struct LandClassification {
    std::vector<Matrix2Db> land;
    std::vector<Matrix2Db> not_water;
};

// One write into the diagnostic raster. Rules are applied in order over a
// reliable (0) base, so a later rule overrides an earlier one.
struct DiagnosticRule {
    std::string name;
    DiagnosticClass code;
    Matrix2Db where;
};

struct CoastalMasks {
    std::vector<int> years;
    // Gap-filled index, NaN outside the per-year analysis mask
    std::vector<Matrix2Df> masked_index;
    std::vector<Matrix2Db> annual_mask;
    std::vector<Matrix2Db> temporal;
    Matrix2Db all_time_land;
    Matrix2Db coastal;
    ReliabilityFlags flags;
    Matrix2Db diagnostic;
};

// Missing index value per year
std::vector<Matrix2Db> nodata_masks(const io::RasterStack& stack);

ReliabilityFlags flag_unreliable(const io::RasterStack& annual, const config::MaskingConfig& cfg);

// Keeps annual values only where count > min_count; elsewhere every layer
// takes the gapfill value. A missing gapfill stack leaves annual as-is.
io::RasterStack apply_gapfill(const io::RasterStack& annual, const io::RasterStack* gapfill,
                              int min_count);

// Land-cover water pixels eroded by `radius`; all-false for an empty grid
Matrix2Db landcover_water_mask(const Matrix2Df& landcover, const std::vector<int>& classes,
                               int radius);

LandClassification classify_land(const io::RasterStack& filled, const Matrix2Db& waterbody,
                                 const Matrix2Db* landcover_water, float index_threshold);

// Pixels not classified water (after temporal filtering) in at least
// `fraction` of the years
Matrix2Db all_time_land(const LandClassification& classes,
                        const std::vector<Matrix2Db>& temporal, float fraction);

// Band of `buffer_pixels` on both sides of the seeded ocean edge of the
// all-time land grid, after closing narrow channels
Matrix2Db coastal_buffer(const Matrix2Db& all_time_land, const std::vector<Coordinate>& seeds,
                         const GeoTransform& transform, const config::MaskingConfig& cfg);

std::vector<DiagnosticRule> diagnostic_rules(const Matrix2Db& coastal,
                                             const ReliabilityFlags& flags,
                                             const Matrix2Db& waterbody);

Matrix2Db compose_diagnostic(const std::vector<DiagnosticRule>& rules, int rows, int cols);

CoastalMasks contours_preprocess(const io::TileRasters& rasters, const Matrix2Db& waterbody,
                                 const Matrix2Db* landcover_water,
                                 const std::vector<Coordinate>& seeds,
                                 const config::MaskingConfig& cfg);

} // namespace shoreline::masking
