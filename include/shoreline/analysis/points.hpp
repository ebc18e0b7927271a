#pragma once

#include "shoreline/io/vector_io.hpp"
#include <optional>
#include <vector>

namespace shoreline::analysis {

// Points every `spacing` units along the merged line, starting at its
// start. Empty or missing geometry gives no points.
std::vector<Coordinate> points_on_line(const geometry::GeosContext& ctx, const GEOSGeometry* line,
                                       double spacing);

// Rock-type labels of the coastal classification dataset
const std::vector<std::string>& rocky_vocabulary();

bool is_rocky_segment(const io::json& properties);

// Drops points inside the rocky-shore buffer that are not also near a
// non-rocky segment. Returns nullopt when the classification holds no
// non-rocky segment at all, so there is nothing to report statistics for.
std::optional<std::vector<Coordinate>> rocky_shores_clip(const geometry::GeosContext& ctx,
                                                         const std::vector<Coordinate>& points,
                                                         const io::FeatureCollection& classification,
                                                         double buffer_distance);

// Points intersecting the polygon
std::vector<Coordinate> clip_points(const geometry::GeosContext& ctx,
                                    const std::vector<Coordinate>& points,
                                    const GEOSGeometry* polygon);

} // namespace shoreline::analysis
