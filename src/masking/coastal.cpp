#include "shoreline/masking/coastal.hpp"
#include "shoreline/masking/connectivity.hpp"
#include "shoreline/masking/morphology.hpp"
#include "shoreline/masking/temporal.hpp"
#include "shoreline/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace shoreline::masking {

namespace {

void require_shape(const Matrix2Db& m, int rows, int cols, const char* what) {
    if (m.rows() != rows || m.cols() != cols) {
        throw ValidationError(std::string(what) + " does not match the raster grid");
    }
}

// Fraction of valid years where flag(year, i) holds; NaN where no year is valid
template <typename Flag>
Matrix2Dd valid_year_fraction(const io::RasterStack& stack, const std::vector<Matrix2Db>& nodata,
                              Flag&& flag) {
    const int rows = stack.rows();
    const int cols = stack.cols();
    Matrix2Dd hits = Matrix2Dd::Zero(rows, cols);
    Matrix2Dd valid = Matrix2Dd::Zero(rows, cols);
    for (size_t y = 0; y < stack.size(); ++y) {
        for (Eigen::Index i = 0; i < hits.size(); ++i) {
            if (nodata[y].data()[i]) continue;
            valid.data()[i] += 1.0;
            if (flag(y, i)) hits.data()[i] += 1.0;
        }
    }
    Matrix2Dd out(rows, cols);
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        out.data()[i] = valid.data()[i] > 0.0 ? hits.data()[i] / valid.data()[i]
                                               : std::numeric_limits<double>::quiet_NaN();
    }
    return out;
}

Matrix2Db above(const Matrix2Dd& fraction, double threshold) {
    Matrix2Db out(fraction.rows(), fraction.cols());
    for (Eigen::Index i = 0; i < fraction.size(); ++i) {
        const double v = fraction.data()[i];
        out.data()[i] = (!std::isnan(v) && v > threshold) ? 1 : 0;
    }
    return out;
}

} // namespace

std::vector<Matrix2Db> nodata_masks(const io::RasterStack& stack) {
    std::vector<Matrix2Db> out;
    out.reserve(stack.size());
    for (const auto& idx : stack.index) {
        out.push_back(idx.array().isNaN().cast<uint8_t>());
    }
    return out;
}

ReliabilityFlags flag_unreliable(const io::RasterStack& annual, const config::MaskingConfig& cfg) {
    const auto nodata = nodata_masks(annual);
    const Matrix2Dd stdev_frac = valid_year_fraction(annual, nodata, [&](size_t y, Eigen::Index i) {
        return annual.stdev[y].data()[i] > cfg.stdev_threshold;
    });
    const Matrix2Dd lowobs_frac = valid_year_fraction(annual, nodata, [&](size_t y, Eigen::Index i) {
        return annual.count[y].data()[i] < static_cast<float>(cfg.low_count_threshold);
    });

    ReliabilityFlags flags;
    flags.persistent_stdev = erode(above(stdev_frac, cfg.persistence_fraction), cfg.erosion_radius);
    flags.persistent_lowobs = erode(above(lowobs_frac, cfg.persistence_fraction), cfg.erosion_radius);
    return flags;
}

io::RasterStack apply_gapfill(const io::RasterStack& annual, const io::RasterStack* gapfill,
                              int min_count) {
    io::RasterStack out = annual;
    if (!gapfill) {
        return out;
    }
    const float min_count_f = static_cast<float>(min_count);
    for (size_t y = 0; y < annual.size(); ++y) {
        const int g = gapfill->year_index(annual.years[y]);
        if (g < 0) {
            throw NoDataError("gapfill rasters missing for " + std::to_string(annual.years[y]));
        }
        const auto gy = static_cast<size_t>(g);
        const Matrix2Df& count = annual.count[y];
        for (Eigen::Index i = 0; i < count.size(); ++i) {
            // NaN counts fail the comparison and take the gapfill value
            if (count.data()[i] > min_count_f) continue;
            out.index[y].data()[i] = gapfill->index[gy].data()[i];
            out.tide_m[y].data()[i] = gapfill->tide_m[gy].data()[i];
            out.count[y].data()[i] = gapfill->count[gy].data()[i];
            out.stdev[y].data()[i] = gapfill->stdev[gy].data()[i];
        }
    }
    return out;
}

Matrix2Db landcover_water_mask(const Matrix2Df& landcover, const std::vector<int>& classes,
                               int radius) {
    Matrix2Db water = Matrix2Db::Zero(landcover.rows(), landcover.cols());
    for (Eigen::Index i = 0; i < landcover.size(); ++i) {
        const float v = landcover.data()[i];
        if (std::isnan(v)) continue;
        const int code = static_cast<int>(std::lround(v));
        if (std::find(classes.begin(), classes.end(), code) != classes.end()) {
            water.data()[i] = 1;
        }
    }
    return erode(water, radius);
}

LandClassification classify_land(const io::RasterStack& filled, const Matrix2Db& waterbody,
                                 const Matrix2Db* landcover_water, float index_threshold) {
    const int rows = filled.rows();
    const int cols = filled.cols();
    require_shape(waterbody, rows, cols, "waterbody mask");
    if (landcover_water) require_shape(*landcover_water, rows, cols, "land-cover mask");

    LandClassification out;
    for (const auto& idx : filled.index) {
        Matrix2Db land = Matrix2Db::Zero(rows, cols);
        Matrix2Db not_water = Matrix2Db::Zero(rows, cols);
        for (Eigen::Index i = 0; i < idx.size(); ++i) {
            const float v = idx.data()[i];
            const bool nodata = std::isnan(v) || waterbody.data()[i] != 0;
            if (nodata) {
                not_water.data()[i] = 1;
                continue;
            }
            bool is_land = v < index_threshold;
            if (landcover_water && landcover_water->data()[i]) is_land = false;
            land.data()[i] = is_land ? 1 : 0;
            not_water.data()[i] = is_land ? 1 : 0;
        }
        out.land.push_back(std::move(land));
        out.not_water.push_back(std::move(not_water));
    }
    return out;
}

Matrix2Db all_time_land(const LandClassification& classes, const std::vector<Matrix2Db>& temporal,
                        float fraction) {
    if (classes.not_water.empty()) {
        return Matrix2Db();
    }
    const auto rows = classes.not_water.front().rows();
    const auto cols = classes.not_water.front().cols();
    Matrix2Dd freq = Matrix2Dd::Zero(rows, cols);
    for (size_t y = 0; y < classes.not_water.size(); ++y) {
        freq += logical_and(classes.not_water[y], temporal[y]).cast<double>();
    }
    freq /= static_cast<double>(classes.not_water.size());
    return (freq.array() >= static_cast<double>(fraction)).cast<uint8_t>();
}

Matrix2Db coastal_buffer(const Matrix2Db& all_time, const std::vector<Coordinate>& seeds,
                         const GeoTransform& transform, const config::MaskingConfig& cfg) {
    const Matrix2Db closed = close(all_time, cfg.closing_radius);
    const Matrix2Db ocean = ocean_mask(closed, seeds, transform, cfg.coastal_connectivity);
    const Matrix2Db seaward = dilate(ocean, cfg.buffer_pixels);
    const Matrix2Db landward = dilate(logical_not(ocean), cfg.buffer_pixels);
    return logical_and(seaward, landward);
}

std::vector<DiagnosticRule> diagnostic_rules(const Matrix2Db& coastal,
                                             const ReliabilityFlags& flags,
                                             const Matrix2Db& waterbody) {
    return {
        {"outside_buffer", DiagnosticClass::OUTSIDE_BUFFER, logical_not(coastal)},
        {"tidal_uncertainty", DiagnosticClass::TIDAL_UNCERTAINTY,
         logical_and(flags.persistent_stdev, coastal)},
        {"low_observations", DiagnosticClass::LOW_OBSERVATIONS,
         logical_and(flags.persistent_lowobs, coastal)},
        {"waterbody", DiagnosticClass::WATERBODY, logical_and(waterbody, coastal)},
    };
}

Matrix2Db compose_diagnostic(const std::vector<DiagnosticRule>& rules, int rows, int cols) {
    Matrix2Db out = Matrix2Db::Constant(rows, cols, diagnostic_code(DiagnosticClass::RELIABLE));
    for (const auto& rule : rules) {
        require_shape(rule.where, rows, cols, rule.name.c_str());
        out = (rule.where.array() != uint8_t(0))
                  .select(Matrix2Db::Constant(rows, cols, diagnostic_code(rule.code)), out);
    }
    return out;
}

CoastalMasks contours_preprocess(const io::TileRasters& rasters, const Matrix2Db& waterbody,
                                 const Matrix2Db* landcover_water,
                                 const std::vector<Coordinate>& seeds,
                                 const config::MaskingConfig& cfg) {
    const io::RasterStack& annual = rasters.annual;
    const int rows = annual.rows();
    const int cols = annual.cols();

    CoastalMasks out;
    out.years = annual.years;
    out.flags = flag_unreliable(annual, cfg);

    const io::RasterStack filled =
        apply_gapfill(annual, rasters.gapfill ? &*rasters.gapfill : nullptr, cfg.gapfill_min_count);

    const LandClassification classes =
        classify_land(filled, waterbody, landcover_water, cfg.index_threshold);

    out.temporal = temporal_mask(classes.land, cfg.temporal_connectivity);
    out.all_time_land = all_time_land(classes, out.temporal, cfg.all_time_land_fraction);
    out.coastal = coastal_buffer(out.all_time_land, seeds, annual.transform, cfg);

    const auto seed_px = seed_pixels(seeds, annual.transform, rows, cols);
    if (seed_px.empty()) {
        std::cerr << "[MASK] no ocean seed falls on the raster grid" << std::endl;
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    for (size_t y = 0; y < filled.size(); ++y) {
        Matrix2Db annual_mask = ocean_mask(classes.not_water[y], seed_px,
                                           cfg.annual_connectivity, cfg.annual_dilation);
        const Matrix2Db keep =
            logical_and(logical_and(annual_mask, out.coastal), out.temporal[y]);
        Matrix2Df masked = (keep.array() != uint8_t(0))
                               .select(filled.index[y], Matrix2Df::Constant(rows, cols, nan));
        out.masked_index.push_back(std::move(masked));
        out.annual_mask.push_back(std::move(annual_mask));
    }

    out.diagnostic = compose_diagnostic(diagnostic_rules(out.coastal, out.flags, waterbody), rows, cols);
    return out;
}

} // namespace shoreline::masking
