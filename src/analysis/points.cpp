#include "shoreline/analysis/points.hpp"

#include <algorithm>
#include <cmath>

namespace shoreline::analysis {

using namespace shoreline::geometry;

std::vector<Coordinate> points_on_line(const GeosContext& ctx, const GEOSGeometry* line,
                                       double spacing) {
    std::vector<Coordinate> out;
    if (!line || is_empty(ctx, line) || !(spacing > 0.0)) {
        return out;
    }
    GeometryPtr merged = line_merge(ctx, unary_union(ctx, line).get());
    const double total = std::floor(length(ctx, merged.get()));
    for (long k = 0;; ++k) {
        const double d = static_cast<double>(k) * spacing;
        if (d >= total) break;
        out.push_back(interpolate(ctx, merged.get(), d));
    }
    return out;
}

const std::vector<std::string>& rocky_vocabulary() {
    static const std::vector<std::string> rocky = {
        "Bedrock breakdown debris (cobbles/boulders)",
        "Boulder (rock) beach",
        "Cliff (>5m) (undiff)",
        "Colluvium (talus) undiff",
        "Flat boulder deposit (rock) undiff",
        "Hard bedrock shore",
        "Hard bedrock shore inferred",
        "Hard rock cliff (>5m)",
        "Hard rocky shore platform",
        "Rocky shore (undiff)",
        "Rocky shore platform (undiff)",
        "Sloping hard rock shore",
        "Sloping rocky shore (undiff)",
        "Soft `bedrock¿ cliff (>5m)",
        "Steep boulder talus",
    };
    return rocky;
}

bool is_rocky_segment(const io::json& properties) {
    const auto& rocky = rocky_vocabulary();
    auto in_vocab = [&](const std::string& v) {
        return std::find(rocky.begin(), rocky.end(), v) != rocky.end();
    };
    const std::string primary = io::property_string(properties, "INTERTD1_V");
    const std::string secondary = io::property_string(properties, "INTERTD2_V");
    return in_vocab(primary) && (in_vocab(secondary) || secondary == "Unclassified");
}

std::optional<std::vector<Coordinate>> rocky_shores_clip(const GeosContext& ctx,
                                                         const std::vector<Coordinate>& points,
                                                         const io::FeatureCollection& classification,
                                                         double buffer_distance) {
    std::vector<const GEOSGeometry*> rocky;
    std::vector<const GEOSGeometry*> nonrocky;
    for (const auto& f : classification.features) {
        (is_rocky_segment(f.properties) ? rocky : nonrocky).push_back(f.geometry.get());
    }
    if (nonrocky.empty()) {
        return std::nullopt;
    }
    if (rocky.empty()) {
        return points;
    }

    GeometryPtr rocky_zone = buffer(ctx, union_all(ctx, rocky).get(), buffer_distance);
    GeometryPtr nonrocky_zone = buffer(ctx, union_all(ctx, nonrocky).get(), buffer_distance);
    GeometryPtr rocky_only = difference(ctx, rocky_zone.get(), nonrocky_zone.get());

    std::vector<Coordinate> kept;
    kept.reserve(points.size());
    for (const auto& p : points) {
        GeometryPtr pt = make_point(ctx, p);
        if (!intersects(ctx, pt.get(), rocky_only.get())) {
            kept.push_back(p);
        }
    }
    return kept;
}

std::vector<Coordinate> clip_points(const GeosContext& ctx, const std::vector<Coordinate>& points,
                                    const GEOSGeometry* polygon) {
    std::vector<Coordinate> kept;
    for (const auto& p : points) {
        GeometryPtr pt = make_point(ctx, p);
        if (intersects(ctx, pt.get(), polygon)) {
            kept.push_back(p);
        }
    }
    return kept;
}

} // namespace shoreline::analysis
