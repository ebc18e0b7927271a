#pragma once

#include "shoreline/core/types.hpp"

#define GEOS_USE_ONLY_R_API
#include <geos_c.h>

#include <memory>
#include <string>
#include <vector>

namespace shoreline::geometry {

struct GeometryDeleter {
    GEOSContextHandle_t ctx = nullptr;
    void operator()(GEOSGeometry* g) const {
        if (g && ctx) GEOSGeom_destroy_r(ctx, g);
    }
};

using GeometryPtr = std::unique_ptr<GEOSGeometry, GeometryDeleter>;

// Owns one reentrant GEOS handle. A context must not be shared between
// threads; geometries may be read from several contexts concurrently.
class GeosContext {
public:
    GeosContext();
    ~GeosContext();

    GeosContext(const GeosContext&) = delete;
    GeosContext& operator=(const GeosContext&) = delete;

    GEOSContextHandle_t handle() const { return handle_; }
    const std::string& last_error() const { return last_error_; }

    // Takes ownership of a GEOS result; throws GeometryError when GEOS
    // signalled failure with a null pointer.
    GeometryPtr wrap(GEOSGeometry* g, const char* operation) const;

private:
    static void on_error(const char* message, void* userdata);

    GEOSContextHandle_t handle_ = nullptr;
    std::string last_error_;
};

// Construction
GeometryPtr make_point(const GeosContext& ctx, const Coordinate& p);
GeometryPtr make_linestring(const GeosContext& ctx, const Polyline& line);
GeometryPtr make_multilinestring(const GeosContext& ctx, const std::vector<Polyline>& lines);
GeometryPtr make_polygon(const GeosContext& ctx, const Polyline& shell,
                         const std::vector<Polyline>& holes = {});
GeometryPtr make_collection(const GeosContext& ctx, int type, std::vector<GeometryPtr> parts);
GeometryPtr make_empty(const GeosContext& ctx, int type);
GeometryPtr clone(const GeosContext& ctx, const GEOSGeometry* g);

// Overlay and constructive operations
GeometryPtr unary_union(const GeosContext& ctx, const GEOSGeometry* g);
GeometryPtr union_all(const GeosContext& ctx, const std::vector<const GEOSGeometry*>& geoms);
GeometryPtr line_merge(const GeosContext& ctx, const GEOSGeometry* g);
GeometryPtr buffer(const GeosContext& ctx, const GEOSGeometry* g, double distance);
GeometryPtr buffer_square(const GeosContext& ctx, const GEOSGeometry* g, double distance);
GeometryPtr difference(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b);
GeometryPtr intersection(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b);
GeometryPtr simplify_preserve_topology(const GeosContext& ctx, const GEOSGeometry* g, double tolerance);
GeometryPtr make_valid(const GeosContext& ctx, const GEOSGeometry* g);

// Predicates and measures
bool is_empty(const GeosContext& ctx, const GEOSGeometry* g);
bool is_valid(const GeosContext& ctx, const GEOSGeometry* g);
bool intersects(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b);
double length(const GeosContext& ctx, const GEOSGeometry* g);
double distance(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b);

// Point access
Coordinate point_coordinate(const GeosContext& ctx, const GEOSGeometry* point);
Coordinate interpolate(const GeosContext& ctx, const GEOSGeometry* line, double distance_along);
Coordinate nearest_point_on(const GeosContext& ctx, const GEOSGeometry* target, const Coordinate& from);
Coordinate centroid(const GeosContext& ctx, const GEOSGeometry* g);

// Decomposition into plain coordinate lists
std::vector<Polyline> extract_lines(const GeosContext& ctx, const GEOSGeometry* g);
std::vector<Coordinate> extract_points(const GeosContext& ctx, const GEOSGeometry* g);
std::vector<std::vector<Polyline>> extract_polygons(const GeosContext& ctx, const GEOSGeometry* g);

// Only the lineal parts of g (drops points left over by clipping)
GeometryPtr lineal_part(const GeosContext& ctx, const GEOSGeometry* g);

} // namespace shoreline::geometry
