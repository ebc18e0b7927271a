#include "shoreline/io/vector_io.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/utils.hpp"

namespace shoreline::io {

using namespace shoreline::geometry;

namespace {

Coordinate parse_position(const json& p) {
    if (!p.is_array() || p.size() < 2) {
        throw ValidationError("GeoJSON position must have at least two numbers");
    }
    return {p.at(0).get<double>(), p.at(1).get<double>()};
}

Polyline parse_positions(const json& arr) {
    Polyline out;
    if (!arr.is_array()) {
        throw ValidationError("GeoJSON coordinates must be an array");
    }
    out.reserve(arr.size());
    for (const auto& p : arr) {
        out.push_back(parse_position(p));
    }
    return out;
}

GeometryPtr parse_polygon(const GeosContext& ctx, const json& rings) {
    if (!rings.is_array() || rings.empty()) {
        return make_empty(ctx, GEOS_POLYGON);
    }
    Polyline shell = parse_positions(rings.at(0));
    std::vector<Polyline> holes;
    for (size_t i = 1; i < rings.size(); ++i) {
        holes.push_back(parse_positions(rings.at(i)));
    }
    return make_polygon(ctx, shell, holes);
}

json positions_to_json(const Polyline& line) {
    json arr = json::array();
    for (const auto& c : line) {
        arr.push_back({c.x, c.y});
    }
    return arr;
}

json polygon_to_json(const std::vector<Polyline>& rings) {
    json arr = json::array();
    for (const auto& r : rings) {
        arr.push_back(positions_to_json(r));
    }
    return arr;
}

} // namespace

GeometryPtr geometry_from_json(const GeosContext& ctx, const json& g) {
    if (!g.is_object() || !g.contains("type")) {
        throw ValidationError("GeoJSON geometry without type");
    }
    const std::string type = g.at("type").get<std::string>();

    if (type == "GeometryCollection") {
        std::vector<GeometryPtr> parts;
        for (const auto& child : g.at("geometries")) {
            parts.push_back(geometry_from_json(ctx, child));
        }
        return make_collection(ctx, GEOS_GEOMETRYCOLLECTION, std::move(parts));
    }

    const json& coords = g.at("coordinates");
    if (type == "Point") {
        return make_point(ctx, parse_position(coords));
    }
    if (type == "MultiPoint") {
        std::vector<GeometryPtr> parts;
        for (const auto& p : coords) {
            parts.push_back(make_point(ctx, parse_position(p)));
        }
        return make_collection(ctx, GEOS_MULTIPOINT, std::move(parts));
    }
    if (type == "LineString") {
        return make_linestring(ctx, parse_positions(coords));
    }
    if (type == "MultiLineString") {
        std::vector<Polyline> lines;
        for (const auto& l : coords) {
            lines.push_back(parse_positions(l));
        }
        return make_multilinestring(ctx, lines);
    }
    if (type == "Polygon") {
        return parse_polygon(ctx, coords);
    }
    if (type == "MultiPolygon") {
        std::vector<GeometryPtr> parts;
        for (const auto& poly : coords) {
            parts.push_back(parse_polygon(ctx, poly));
        }
        return make_collection(ctx, GEOS_MULTIPOLYGON, std::move(parts));
    }
    throw ValidationError("unsupported GeoJSON geometry type: " + type);
}

json geometry_to_json(const GeosContext& ctx, const GEOSGeometry* g) {
    GEOSContextHandle_t h = ctx.handle();
    const int type = GEOSGeomTypeId_r(h, g);
    json out;
    switch (type) {
        case GEOS_POINT:
            out["type"] = "Point";
            if (is_empty(ctx, g)) {
                out["coordinates"] = json::array();
            } else {
                const Coordinate c = point_coordinate(ctx, g);
                out["coordinates"] = {c.x, c.y};
            }
            break;
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            out["type"] = "LineString";
            auto lines = extract_lines(ctx, g);
            out["coordinates"] = lines.empty() ? json::array() : positions_to_json(lines.front());
            break;
        }
        case GEOS_POLYGON: {
            out["type"] = "Polygon";
            auto polys = extract_polygons(ctx, g);
            out["coordinates"] = polys.empty() ? json::array() : polygon_to_json(polys.front());
            break;
        }
        case GEOS_MULTIPOINT:
            out["type"] = "MultiPoint";
            out["coordinates"] = positions_to_json(extract_points(ctx, g));
            break;
        case GEOS_MULTILINESTRING: {
            out["type"] = "MultiLineString";
            json arr = json::array();
            for (const auto& l : extract_lines(ctx, g)) {
                arr.push_back(positions_to_json(l));
            }
            out["coordinates"] = arr;
            break;
        }
        case GEOS_MULTIPOLYGON: {
            out["type"] = "MultiPolygon";
            json arr = json::array();
            for (const auto& p : extract_polygons(ctx, g)) {
                arr.push_back(polygon_to_json(p));
            }
            out["coordinates"] = arr;
            break;
        }
        case GEOS_GEOMETRYCOLLECTION: {
            out["type"] = "GeometryCollection";
            json arr = json::array();
            const int n = GEOSGetNumGeometries_r(h, g);
            for (int i = 0; i < n; ++i) {
                arr.push_back(geometry_to_json(ctx, GEOSGetGeometryN_r(h, g, i)));
            }
            out["geometries"] = arr;
            break;
        }
        default:
            throw GeometryError("cannot encode geometry type " + std::to_string(type));
    }
    return out;
}

FeatureCollection parse_geojson(const GeosContext& ctx, const json& doc) {
    FeatureCollection fc;
    if (!doc.is_object() || doc.value("type", "") != "FeatureCollection") {
        throw ValidationError("expected a GeoJSON FeatureCollection");
    }
    if (doc.contains("crs") && doc["crs"].is_object()) {
        const json& props = doc["crs"].value("properties", json::object());
        fc.crs = props.value("name", "");
    }
    for (const auto& f : doc.value("features", json::array())) {
        if (!f.contains("geometry") || f["geometry"].is_null()) {
            continue;
        }
        Feature feature;
        feature.geometry = geometry_from_json(ctx, f["geometry"]);
        if (f.contains("properties") && f["properties"].is_object()) {
            feature.properties = f["properties"];
        }
        fc.features.push_back(std::move(feature));
    }
    return fc;
}

FeatureCollection read_geojson(const GeosContext& ctx, const fs::path& path) {
    if (!fs::exists(path)) {
        throw NoDataError("vector file not found: " + path.string());
    }
    json doc;
    try {
        doc = json::parse(core::read_text(path));
    } catch (const json::exception& e) {
        throw IOError("Cannot parse GeoJSON " + path.string() + ": " + e.what());
    }
    try {
        return parse_geojson(ctx, doc);
    } catch (const json::exception& e) {
        throw ValidationError("malformed GeoJSON " + path.string() + ": " + e.what());
    }
}

json to_geojson(const GeosContext& ctx, const FeatureCollection& fc) {
    json doc;
    doc["type"] = "FeatureCollection";
    if (!fc.crs.empty()) {
        doc["crs"] = {{"type", "name"}, {"properties", {{"name", fc.crs}}}};
    }
    json features = json::array();
    for (const auto& f : fc.features) {
        json feature;
        feature["type"] = "Feature";
        feature["properties"] = f.properties;
        feature["geometry"] = f.geometry ? geometry_to_json(ctx, f.geometry.get()) : json(nullptr);
        features.push_back(std::move(feature));
    }
    doc["features"] = std::move(features);
    return doc;
}

void write_geojson(const GeosContext& ctx, const fs::path& path, const FeatureCollection& fc) {
    core::write_text(path, to_geojson(ctx, fc).dump());
}

std::string property_string(const json& properties, const std::string& key) {
    auto it = properties.find(key);
    if (it == properties.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace shoreline::io
