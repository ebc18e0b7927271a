#pragma once

#include "shoreline/io/vector_io.hpp"

namespace shoreline::masking {

// Perennial lakes plus estuarine and artificial coastal water features
bool is_excluded_waterbody(const io::json& properties);

// Union of the selected waterbody polygons, with `remove` modifications
// subtracted and `add` modifications unioned. Empty when nothing applies.
geometry::GeometryPtr select_waterbodies(const geometry::GeosContext& ctx,
                                         const io::FeatureCollection& waterbodies,
                                         const io::FeatureCollection* modifications);

// Marks every pixel touched by the polygonal parts of g.
Matrix2Db rasterize_polygons(const geometry::GeosContext& ctx, const GEOSGeometry* g,
                             const GeoTransform& transform, int rows, int cols);

} // namespace shoreline::masking
