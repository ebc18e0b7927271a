#include "shoreline/geometry/projection.hpp"
#include "shoreline/core/errors.hpp"

#include <cmath>

namespace shoreline::geometry {

namespace {

std::string proj_error(PJ_CONTEXT* ctx) {
    const int err = proj_context_errno(ctx);
    return err ? std::string(proj_errno_string(err)) : std::string("unknown PROJ error");
}

} // namespace

GeographicTransform::GeographicTransform(const std::string& source_crs)
    : source_crs_(source_crs) {
    if (source_crs_.empty()) {
        throw GeometryError("no source CRS for the geographic transform");
    }
    ctx_ = proj_context_create();
    if (!ctx_) {
        throw GeometryError("cannot create PROJ context");
    }

    PJ* op = proj_create_crs_to_crs(ctx_, source_crs_.c_str(), "EPSG:4326", nullptr);
    if (!op) {
        const std::string msg = proj_error(ctx_);
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
        throw GeometryError("cannot transform " + source_crs_ + " to EPSG:4326: " + msg);
    }

    // Longitude first regardless of the authority axis order
    transform_ = proj_normalize_for_visualization(ctx_, op);
    proj_destroy(op);
    if (!transform_) {
        const std::string msg = proj_error(ctx_);
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
        throw GeometryError("cannot normalise axis order for " + source_crs_ + ": " + msg);
    }
}

GeographicTransform::~GeographicTransform() {
    if (transform_) proj_destroy(transform_);
    if (ctx_) proj_context_destroy(ctx_);
}

Coordinate GeographicTransform::to_lonlat(const Coordinate& p) const {
    PJ_COORD in = proj_coord(p.x, p.y, 0.0, 0.0);
    proj_errno_reset(transform_);
    PJ_COORD out = proj_trans(transform_, PJ_FWD, in);
    const int err = proj_errno(transform_);
    if (err || !std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
        throw GeometryError("cannot transform (" + std::to_string(p.x) + ", " +
                            std::to_string(p.y) + ") from " + source_crs_ + ": " +
                            (err ? proj_errno_string(err) : "non-finite result"));
    }
    // Geographic output stays in degrees
    return {out.xy.x, out.xy.y};
}

} // namespace shoreline::geometry
