#include "shoreline/geometry/geos_context.hpp"
#include "shoreline/core/errors.hpp"


namespace shoreline::geometry {

namespace {

GEOSCoordSequence* make_sequence(const GeosContext& ctx, const Polyline& pts) {
    GEOSContextHandle_t h = ctx.handle();
    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(h, static_cast<unsigned int>(pts.size()), 2);
    if (!seq) {
        throw GeometryError("cannot allocate coordinate sequence: " + ctx.last_error());
    }
    for (size_t i = 0; i < pts.size(); ++i) {
        if (!GEOSCoordSeq_setXY_r(h, seq, static_cast<unsigned int>(i), pts[i].x, pts[i].y)) {
            GEOSCoordSeq_destroy_r(h, seq);
            throw GeometryError("cannot set coordinate: " + ctx.last_error());
        }
    }
    return seq;
}

Polyline read_sequence(const GeosContext& ctx, const GEOSCoordSequence* seq) {
    GEOSContextHandle_t h = ctx.handle();
    Polyline out;
    unsigned int size = 0;
    if (!seq || !GEOSCoordSeq_getSize_r(h, seq, &size)) {
        return out;
    }
    out.reserve(size);
    for (unsigned int i = 0; i < size; ++i) {
        double x = 0.0;
        double y = 0.0;
        GEOSCoordSeq_getXY_r(h, seq, i, &x, &y);
        out.push_back({x, y});
    }
    return out;
}

Polyline closed_ring(const Polyline& ring) {
    Polyline out = ring;
    if (!out.empty() &&
        (out.front().x != out.back().x || out.front().y != out.back().y)) {
        out.push_back(out.front());
    }
    return out;
}

GeometryPtr make_ring(const GeosContext& ctx, const Polyline& ring) {
    Polyline closed = closed_ring(ring);
    if (closed.size() < 4) {
        throw GeometryError("polygon ring needs at least 3 distinct vertices");
    }
    GEOSCoordSequence* seq = make_sequence(ctx, closed);
    return ctx.wrap(GEOSGeom_createLinearRing_r(ctx.handle(), seq), "createLinearRing");
}

bool check_predicate(const GeosContext& ctx, char result, const char* operation) {
    if (result == 2) {
        throw GeometryError(std::string(operation) + " failed: " + ctx.last_error());
    }
    return result == 1;
}

void collect_lines(const GeosContext& ctx, const GEOSGeometry* g, std::vector<Polyline>& out) {
    GEOSContextHandle_t h = ctx.handle();
    const int type = GEOSGeomTypeId_r(h, g);
    switch (type) {
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            if (GEOSisEmpty_r(h, g) != 0) return;
            Polyline line = read_sequence(ctx, GEOSGeom_getCoordSeq_r(h, g));
            if (line.size() >= 2) out.push_back(std::move(line));
            break;
        }
        case GEOS_MULTILINESTRING:
        case GEOS_GEOMETRYCOLLECTION: {
            const int n = GEOSGetNumGeometries_r(h, g);
            for (int i = 0; i < n; ++i) {
                collect_lines(ctx, GEOSGetGeometryN_r(h, g, i), out);
            }
            break;
        }
        default:
            break;
    }
}

void collect_points(const GeosContext& ctx, const GEOSGeometry* g, std::vector<Coordinate>& out) {
    GEOSContextHandle_t h = ctx.handle();
    const int type = GEOSGeomTypeId_r(h, g);
    if (type == GEOS_POINT) {
        if (GEOSisEmpty_r(h, g) == 0) out.push_back(point_coordinate(ctx, g));
    } else if (type == GEOS_MULTIPOINT || type == GEOS_GEOMETRYCOLLECTION) {
        const int n = GEOSGetNumGeometries_r(h, g);
        for (int i = 0; i < n; ++i) {
            collect_points(ctx, GEOSGetGeometryN_r(h, g, i), out);
        }
    }
}

void collect_polygons(const GeosContext& ctx, const GEOSGeometry* g,
                      std::vector<std::vector<Polyline>>& out) {
    GEOSContextHandle_t h = ctx.handle();
    const int type = GEOSGeomTypeId_r(h, g);
    if (type == GEOS_POLYGON) {
        if (GEOSisEmpty_r(h, g) != 0) return;
        std::vector<Polyline> rings;
        rings.push_back(read_sequence(ctx, GEOSGeom_getCoordSeq_r(h, GEOSGetExteriorRing_r(h, g))));
        const int n_holes = GEOSGetNumInteriorRings_r(h, g);
        for (int i = 0; i < n_holes; ++i) {
            rings.push_back(read_sequence(ctx, GEOSGeom_getCoordSeq_r(h, GEOSGetInteriorRingN_r(h, g, i))));
        }
        out.push_back(std::move(rings));
    } else if (type == GEOS_MULTIPOLYGON || type == GEOS_GEOMETRYCOLLECTION) {
        const int n = GEOSGetNumGeometries_r(h, g);
        for (int i = 0; i < n; ++i) {
            collect_polygons(ctx, GEOSGetGeometryN_r(h, g, i), out);
        }
    }
}

} // namespace

GeosContext::GeosContext() {
    handle_ = GEOS_init_r();
    if (!handle_) {
        throw GeometryError("GEOS_init_r failed");
    }
    GEOSContext_setErrorMessageHandler_r(handle_, &GeosContext::on_error, this);
}

GeosContext::~GeosContext() {
    if (handle_) {
        GEOS_finish_r(handle_);
    }
}

void GeosContext::on_error(const char* message, void* userdata) {
    auto* self = static_cast<GeosContext*>(userdata);
    if (self && message) {
        self->last_error_ = message;
    }
}

GeometryPtr GeosContext::wrap(GEOSGeometry* g, const char* operation) const {
    if (!g) {
        throw GeometryError(std::string(operation) + " failed: " + last_error_);
    }
    return GeometryPtr(g, GeometryDeleter{handle_});
}

GeometryPtr make_point(const GeosContext& ctx, const Coordinate& p) {
    return ctx.wrap(GEOSGeom_createPointFromXY_r(ctx.handle(), p.x, p.y), "createPoint");
}

GeometryPtr make_linestring(const GeosContext& ctx, const Polyline& line) {
    if (line.size() < 2) {
        throw GeometryError("linestring needs at least 2 vertices");
    }
    GEOSCoordSequence* seq = make_sequence(ctx, line);
    return ctx.wrap(GEOSGeom_createLineString_r(ctx.handle(), seq), "createLineString");
}

GeometryPtr make_multilinestring(const GeosContext& ctx, const std::vector<Polyline>& lines) {
    std::vector<GeometryPtr> parts;
    parts.reserve(lines.size());
    for (const auto& line : lines) {
        parts.push_back(make_linestring(ctx, line));
    }
    return make_collection(ctx, GEOS_MULTILINESTRING, std::move(parts));
}

GeometryPtr make_polygon(const GeosContext& ctx, const Polyline& shell,
                         const std::vector<Polyline>& holes) {
    GeometryPtr shell_ring = make_ring(ctx, shell);
    std::vector<GeometryPtr> hole_rings;
    for (const auto& hole : holes) {
        hole_rings.push_back(make_ring(ctx, hole));
    }

    std::vector<GEOSGeometry*> raw_holes;
    raw_holes.reserve(hole_rings.size());
    for (auto& r : hole_rings) {
        raw_holes.push_back(r.release());
    }
    GEOSGeometry* poly = GEOSGeom_createPolygon_r(ctx.handle(), shell_ring.release(),
                                                  raw_holes.empty() ? nullptr : raw_holes.data(),
                                                  static_cast<unsigned int>(raw_holes.size()));
    return ctx.wrap(poly, "createPolygon");
}

GeometryPtr make_collection(const GeosContext& ctx, int type, std::vector<GeometryPtr> parts) {
    if (parts.empty()) {
        return make_empty(ctx, type);
    }
    std::vector<GEOSGeometry*> raw;
    raw.reserve(parts.size());
    for (auto& p : parts) {
        raw.push_back(p.release());
    }
    return ctx.wrap(GEOSGeom_createCollection_r(ctx.handle(), type, raw.data(),
                                                static_cast<unsigned int>(raw.size())),
                    "createCollection");
}

GeometryPtr make_empty(const GeosContext& ctx, int type) {
    return ctx.wrap(GEOSGeom_createEmptyCollection_r(ctx.handle(), type), "createEmptyCollection");
}

GeometryPtr clone(const GeosContext& ctx, const GEOSGeometry* g) {
    return ctx.wrap(GEOSGeom_clone_r(ctx.handle(), g), "clone");
}

GeometryPtr unary_union(const GeosContext& ctx, const GEOSGeometry* g) {
    return ctx.wrap(GEOSUnaryUnion_r(ctx.handle(), g), "unaryUnion");
}

GeometryPtr union_all(const GeosContext& ctx, const std::vector<const GEOSGeometry*>& geoms) {
    std::vector<GeometryPtr> parts;
    parts.reserve(geoms.size());
    for (const GEOSGeometry* g : geoms) {
        parts.push_back(clone(ctx, g));
    }
    GeometryPtr collection = make_collection(ctx, GEOS_GEOMETRYCOLLECTION, std::move(parts));
    return unary_union(ctx, collection.get());
}

GeometryPtr line_merge(const GeosContext& ctx, const GEOSGeometry* g) {
    return ctx.wrap(GEOSLineMerge_r(ctx.handle(), g), "lineMerge");
}

GeometryPtr buffer(const GeosContext& ctx, const GEOSGeometry* g, double distance) {
    return ctx.wrap(GEOSBuffer_r(ctx.handle(), g, distance, 16), "buffer");
}

GeometryPtr buffer_square(const GeosContext& ctx, const GEOSGeometry* g, double distance) {
    return ctx.wrap(GEOSBufferWithStyle_r(ctx.handle(), g, distance, 1, GEOSBUF_CAP_SQUARE,
                                          GEOSBUF_JOIN_MITRE, 2.0),
                    "bufferWithStyle");
}

GeometryPtr difference(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b) {
    return ctx.wrap(GEOSDifference_r(ctx.handle(), a, b), "difference");
}

GeometryPtr intersection(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b) {
    return ctx.wrap(GEOSIntersection_r(ctx.handle(), a, b), "intersection");
}

GeometryPtr simplify_preserve_topology(const GeosContext& ctx, const GEOSGeometry* g,
                                       double tolerance) {
    return ctx.wrap(GEOSTopologyPreserveSimplify_r(ctx.handle(), g, tolerance),
                    "topologyPreserveSimplify");
}

GeometryPtr make_valid(const GeosContext& ctx, const GEOSGeometry* g) {
    return ctx.wrap(GEOSMakeValid_r(ctx.handle(), g), "makeValid");
}

bool is_empty(const GeosContext& ctx, const GEOSGeometry* g) {
    return check_predicate(ctx, GEOSisEmpty_r(ctx.handle(), g), "isEmpty");
}

bool is_valid(const GeosContext& ctx, const GEOSGeometry* g) {
    return check_predicate(ctx, GEOSisValid_r(ctx.handle(), g), "isValid");
}

bool intersects(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b) {
    return check_predicate(ctx, GEOSIntersects_r(ctx.handle(), a, b), "intersects");
}

double length(const GeosContext& ctx, const GEOSGeometry* g) {
    double len = 0.0;
    if (!GEOSLength_r(ctx.handle(), g, &len)) {
        throw GeometryError("length failed: " + ctx.last_error());
    }
    return len;
}

double distance(const GeosContext& ctx, const GEOSGeometry* a, const GEOSGeometry* b) {
    double d = 0.0;
    if (!GEOSDistance_r(ctx.handle(), a, b, &d)) {
        throw GeometryError("distance failed: " + ctx.last_error());
    }
    return d;
}

Coordinate point_coordinate(const GeosContext& ctx, const GEOSGeometry* point) {
    Coordinate c;
    if (!GEOSGeomGetX_r(ctx.handle(), point, &c.x) || !GEOSGeomGetY_r(ctx.handle(), point, &c.y)) {
        throw GeometryError("point coordinate access failed: " + ctx.last_error());
    }
    return c;
}

Coordinate interpolate(const GeosContext& ctx, const GEOSGeometry* line, double distance_along) {
    GeometryPtr p = ctx.wrap(GEOSInterpolate_r(ctx.handle(), line, distance_along), "interpolate");
    return point_coordinate(ctx, p.get());
}

Coordinate nearest_point_on(const GeosContext& ctx, const GEOSGeometry* target,
                            const Coordinate& from) {
    GEOSContextHandle_t h = ctx.handle();
    GeometryPtr origin = make_point(ctx, from);
    GEOSCoordSequence* seq = GEOSNearestPoints_r(h, target, origin.get());
    if (!seq) {
        throw GeometryError("nearestPoints failed: " + ctx.last_error());
    }
    Coordinate c;
    const int ok = GEOSCoordSeq_getXY_r(h, seq, 0, &c.x, &c.y);
    GEOSCoordSeq_destroy_r(h, seq);
    if (!ok) {
        throw GeometryError("nearestPoints returned no coordinate");
    }
    return c;
}

Coordinate centroid(const GeosContext& ctx, const GEOSGeometry* g) {
    GeometryPtr c = ctx.wrap(GEOSGetCentroid_r(ctx.handle(), g), "centroid");
    return point_coordinate(ctx, c.get());
}

std::vector<Polyline> extract_lines(const GeosContext& ctx, const GEOSGeometry* g) {
    std::vector<Polyline> out;
    if (g) collect_lines(ctx, g, out);
    return out;
}

std::vector<Coordinate> extract_points(const GeosContext& ctx, const GEOSGeometry* g) {
    std::vector<Coordinate> out;
    if (g) collect_points(ctx, g, out);
    return out;
}

std::vector<std::vector<Polyline>> extract_polygons(const GeosContext& ctx, const GEOSGeometry* g) {
    std::vector<std::vector<Polyline>> out;
    if (g) collect_polygons(ctx, g, out);
    return out;
}

GeometryPtr lineal_part(const GeosContext& ctx, const GEOSGeometry* g) {
    return make_multilinestring(ctx, extract_lines(ctx, g));
}

} // namespace shoreline::geometry
