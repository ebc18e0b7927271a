#include "shoreline/masking/waterbody.hpp"

#include <opencv2/opencv.hpp>
#include <array>
#include <cmath>
#include <cstring>

namespace shoreline::masking {

using namespace shoreline::geometry;

namespace {

constexpr int kShift = 8;

const std::array<const char*, 5> kCoastalFeatureTypes = {
    "Aquaculture Area", "Estuary", "Watercourse Area", "Salt Evaporator", "Settling Pond"};

cv::Point to_fixed_point(const GeoTransform& t, const Coordinate& c) {
    const auto [row, col] = t.to_pixel(c);
    const double scale = static_cast<double>(1 << kShift);
    return cv::Point(static_cast<int>(std::lround(col * scale)),
                     static_cast<int>(std::lround(row * scale)));
}

GeometryPtr union_of(const GeosContext& ctx, const std::vector<const GEOSGeometry*>& parts) {
    if (parts.empty()) {
        return make_empty(ctx, GEOS_MULTIPOLYGON);
    }
    return union_all(ctx, parts);
}

} // namespace

bool is_excluded_waterbody(const io::json& properties) {
    const std::string type = io::property_string(properties, "FEATURETYPE");
    if (type == "Lake") {
        return io::property_string(properties, "PERENNIALITY") == "Perennial";
    }
    for (const char* t : kCoastalFeatureTypes) {
        if (type == t) return true;
    }
    return false;
}

GeometryPtr select_waterbodies(const GeosContext& ctx, const io::FeatureCollection& waterbodies,
                               const io::FeatureCollection* modifications) {
    std::vector<const GEOSGeometry*> selected;
    for (const auto& f : waterbodies.features) {
        if (is_excluded_waterbody(f.properties)) {
            selected.push_back(f.geometry.get());
        }
    }
    GeometryPtr mask = union_of(ctx, selected);

    if (modifications) {
        std::vector<const GEOSGeometry*> to_remove;
        std::vector<const GEOSGeometry*> to_add;
        for (const auto& f : modifications->features) {
            const std::string type = io::property_string(f.properties, "type");
            if (type == "remove") to_remove.push_back(f.geometry.get());
            if (type == "add") to_add.push_back(f.geometry.get());
        }
        if (!to_remove.empty() && !is_empty(ctx, mask.get())) {
            GeometryPtr removed = union_of(ctx, to_remove);
            mask = difference(ctx, mask.get(), removed.get());
        }
        if (!to_add.empty()) {
            to_add.push_back(mask.get());
            mask = union_of(ctx, to_add);
        }
    }
    return mask;
}

Matrix2Db rasterize_polygons(const GeosContext& ctx, const GEOSGeometry* g,
                             const GeoTransform& transform, int rows, int cols) {
    Matrix2Db out = Matrix2Db::Zero(rows, cols);
    if (!g || rows == 0 || cols == 0) {
        return out;
    }

    cv::Mat canvas = cv::Mat::zeros(rows, cols, CV_8U);
    for (const auto& rings : extract_polygons(ctx, g)) {
        std::vector<std::vector<cv::Point>> contours;
        for (const auto& ring : rings) {
            std::vector<cv::Point> pts;
            pts.reserve(ring.size());
            for (const auto& c : ring) {
                pts.push_back(to_fixed_point(transform, c));
            }
            if (pts.size() >= 3) contours.push_back(std::move(pts));
        }
        if (contours.empty()) continue;
        // Interior by even-odd fill, touched boundary pixels by the outline
        cv::fillPoly(canvas, contours, cv::Scalar(1), cv::LINE_8, kShift);
        cv::polylines(canvas, contours, true, cv::Scalar(1), 1, cv::LINE_8, kShift);
    }

    std::memcpy(out.data(), canvas.data, out.size() * sizeof(uint8_t));
    return out;
}

} // namespace shoreline::masking
