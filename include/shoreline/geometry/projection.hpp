#pragma once

#include "shoreline/core/types.hpp"

#include <proj.h>

#include <string>

namespace shoreline::geometry {

// Transform from an analysis CRS to geographic longitude/latitude
// (EPSG:4326 in lon, lat order). Owns its own PROJ context, so one
// instance must not be shared between threads.
class GeographicTransform {
public:
    // Throws GeometryError when PROJ cannot build the operation
    explicit GeographicTransform(const std::string& source_crs);
    ~GeographicTransform();

    GeographicTransform(const GeographicTransform&) = delete;
    GeographicTransform& operator=(const GeographicTransform&) = delete;

    // (longitude, latitude) in degrees; throws GeometryError on failure
    Coordinate to_lonlat(const Coordinate& p) const;

    const std::string& source_crs() const { return source_crs_; }

private:
    std::string source_crs_;
    PJ_CONTEXT* ctx_ = nullptr;
    PJ* transform_ = nullptr;
};

} // namespace shoreline::geometry
