#pragma once

#include "shoreline/config/configuration.hpp"
#include "shoreline/contour/extraction.hpp"
#include <string>
#include <vector>

namespace shoreline::analysis {

// Dissolved polygon of one uncertain diagnostic class
struct CertaintyZone {
    int code = 0;
    geometry::GeometryPtr polygon;
};

struct ContourSegment {
    int year = 0;
    std::string certainty;
    std::string maturity;
    geometry::GeometryPtr geometry;
};

std::string certainty_label(int code);

// Diagnostic codes outside `uncertain` become 0
Matrix2Di restrict_classes(const Matrix2Db& diagnostic, const std::vector<int>& uncertain);

// Merges 4-connected regions smaller than min_size pixels into their
// largest neighbouring region.
Matrix2Di sieve(const Matrix2Di& classes, int min_size);

// Pixel-edge outline of every region with the given value, in map units
geometry::GeometryPtr trace_class(const geometry::GeosContext& ctx, const Matrix2Di& classes,
                                  int value, const GeoTransform& transform);

// Vectorised, simplified and dissolved uncertain classes, ascending by code
std::vector<CertaintyZone> certainty_zones(const geometry::GeosContext& ctx,
                                           const Matrix2Db& diagnostic,
                                           const GeoTransform& transform,
                                           const config::CertaintyConfig& cfg);

// Splits every contour into a good part and one part per uncertain zone.
// Where zones overlap the higher code wins. Segments of artifact years
// whose centroid, transformed from `crs` to geographic coordinates, lies
// north of artifact_min_lat become aerosol issues. An artifact year with
// an empty `crs` throws ValidationError.
std::vector<ContourSegment> contour_certainty(const geometry::GeosContext& ctx,
                                              const contour::ContourSet& contours,
                                              const std::vector<CertaintyZone>& zones,
                                              const config::CertaintyConfig& cfg,
                                              int baseline_year, const std::string& crs);

} // namespace shoreline::analysis
