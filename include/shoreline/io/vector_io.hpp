#pragma once

#include "shoreline/geometry/geos_context.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace shoreline::io {

using json = nlohmann::json;

struct Feature {
    geometry::GeometryPtr geometry;
    json properties = json::object();
};

struct FeatureCollection {
    std::vector<Feature> features;
    std::string crs;
};

geometry::GeometryPtr geometry_from_json(const geometry::GeosContext& ctx, const json& g);
json geometry_to_json(const geometry::GeosContext& ctx, const GEOSGeometry* g);

// Features with a null geometry are skipped
FeatureCollection read_geojson(const geometry::GeosContext& ctx, const fs::path& path);
FeatureCollection parse_geojson(const geometry::GeosContext& ctx, const json& doc);

json to_geojson(const geometry::GeosContext& ctx, const FeatureCollection& fc);
void write_geojson(const geometry::GeosContext& ctx, const fs::path& path,
                   const FeatureCollection& fc);

// String property or "" when absent or not a string
std::string property_string(const json& properties, const std::string& key);

} // namespace shoreline::io
