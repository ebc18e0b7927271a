#include "shoreline/analysis/certainty.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/geometry/projection.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <map>
#include <memory>
#include <set>

namespace shoreline::analysis {

using namespace shoreline::geometry;

namespace {

Polyline to_map(const std::vector<cv::Point>& contour, const GeoTransform& transform) {
    Polyline out;
    out.reserve(contour.size());
    for (const auto& p : contour) {
        const Coordinate c = transform.pixel_center(p.y, p.x);
        if (out.empty() || out.back().x != c.x || out.back().y != c.y) {
            out.push_back(c);
        }
    }
    return out;
}

size_t distinct_count(const Polyline& ring) {
    std::set<std::pair<double, double>> seen;
    for (const auto& c : ring) seen.insert({c.x, c.y});
    return seen.size();
}

// Geometry through the centres of a traced region. Thin or single-pixel
// regions degrade to lines or points.
GeometryPtr region_core(const GeosContext& ctx, const Polyline& shell,
                        const std::vector<Polyline>& holes) {
    const size_t distinct = distinct_count(shell);
    if (distinct == 1) {
        return make_point(ctx, shell.front());
    }
    if (distinct == 2) {
        return make_linestring(ctx, shell);
    }
    std::vector<Polyline> valid_holes;
    for (const auto& h : holes) {
        if (distinct_count(h) >= 3) valid_holes.push_back(h);
    }
    GeometryPtr poly = make_polygon(ctx, shell, valid_holes);
    if (!is_valid(ctx, poly.get())) {
        poly = make_valid(ctx, poly.get());
    }
    return poly;
}

const char* kArtifactLabel = "aerosol issues";

} // namespace

std::string certainty_label(int code) {
    switch (code) {
        case 0: return certainty_to_string(CertaintyClass::GOOD);
        case 4: return certainty_to_string(CertaintyClass::TIDAL_ISSUES);
        case 5: return certainty_to_string(CertaintyClass::INSUFFICIENT_DATA);
        default: return "class " + std::to_string(code);
    }
}

Matrix2Di restrict_classes(const Matrix2Db& diagnostic, const std::vector<int>& uncertain) {
    Matrix2Di out = Matrix2Di::Zero(diagnostic.rows(), diagnostic.cols());
    for (Eigen::Index i = 0; i < diagnostic.size(); ++i) {
        const int v = diagnostic.data()[i];
        if (std::find(uncertain.begin(), uncertain.end(), v) != uncertain.end()) {
            out.data()[i] = v;
        }
    }
    return out;
}

Matrix2Di sieve(const Matrix2Di& classes, int min_size) {
    if (min_size <= 1 || classes.size() == 0) {
        return classes;
    }
    const int rows = static_cast<int>(classes.rows());
    const int cols = static_cast<int>(classes.cols());

    // Region id per pixel over all values
    Matrix2Di region = Matrix2Di::Zero(rows, cols);
    std::vector<int> region_value{0};
    std::vector<int> region_area{0};
    std::set<int> values(classes.data(), classes.data() + classes.size());
    for (int v : values) {
        cv::Mat mask(rows, cols, CV_8U);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                mask.at<uint8_t>(r, c) = classes(r, c) == v ? 1 : 0;
            }
        }
        cv::Mat labels;
        cv::Mat stats;
        cv::Mat centroids;
        const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 4, CV_32S);
        const int offset = static_cast<int>(region_value.size()) - 1;
        for (int l = 1; l < n; ++l) {
            region_value.push_back(v);
            region_area.push_back(stats.at<int>(l, cv::CC_STAT_AREA));
        }
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                const int l = labels.at<int>(r, c);
                if (l > 0) region(r, c) = l + offset;
            }
        }
    }

    std::map<int, std::set<int>> neighbours;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const int a = region(r, c);
            if (region_area[static_cast<size_t>(a)] >= min_size) continue;
            const int dr[4] = {-1, 1, 0, 0};
            const int dc[4] = {0, 0, -1, 1};
            for (int k = 0; k < 4; ++k) {
                const int rr = r + dr[k];
                const int cc = c + dc[k];
                if (rr < 0 || rr >= rows || cc < 0 || cc >= cols) continue;
                const int b = region(rr, cc);
                if (b != a) neighbours[a].insert(b);
            }
        }
    }

    std::vector<int> new_value = region_value;
    for (const auto& [a, adj] : neighbours) {
        int best = -1;
        for (int b : adj) {
            if (best < 0 || region_area[static_cast<size_t>(b)] > region_area[static_cast<size_t>(best)]) {
                best = b;
            }
        }
        if (best >= 0) new_value[static_cast<size_t>(a)] = region_value[static_cast<size_t>(best)];
    }

    Matrix2Di out(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out(r, c) = new_value[static_cast<size_t>(region(r, c))];
        }
    }
    return out;
}

GeometryPtr trace_class(const GeosContext& ctx, const Matrix2Di& classes, int value,
                        const GeoTransform& transform) {
    const int rows = static_cast<int>(classes.rows());
    const int cols = static_cast<int>(classes.cols());
    cv::Mat mask = cv::Mat::zeros(rows, cols, CV_8U);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (classes(r, c) == value) mask.at<uint8_t>(r, c) = 1;
        }
    }

    std::vector<std::vector<cv::Point>> contours;
    std::vector<cv::Vec4i> hierarchy;
    cv::findContours(mask, contours, hierarchy, cv::RETR_CCOMP, cv::CHAIN_APPROX_SIMPLE);

    const double half_pixel = 0.5 * transform.pixel_size();
    std::vector<GeometryPtr> pieces;
    for (size_t i = 0; i < contours.size(); ++i) {
        if (hierarchy[i][3] >= 0) continue; // holes are handled with their shell
        const Polyline shell = to_map(contours[i], transform);
        if (shell.empty()) continue;
        std::vector<Polyline> holes;
        for (int j = hierarchy[i][2]; j >= 0; j = hierarchy[static_cast<size_t>(j)][0]) {
            holes.push_back(to_map(contours[static_cast<size_t>(j)], transform));
        }
        GeometryPtr core = region_core(ctx, shell, holes);
        pieces.push_back(buffer_square(ctx, core.get(), half_pixel));
    }

    std::vector<const GEOSGeometry*> raw;
    for (const auto& p : pieces) raw.push_back(p.get());
    if (raw.empty()) {
        return make_empty(ctx, GEOS_MULTIPOLYGON);
    }
    return union_all(ctx, raw);
}

std::vector<CertaintyZone> certainty_zones(const GeosContext& ctx, const Matrix2Db& diagnostic,
                                           const GeoTransform& transform,
                                           const config::CertaintyConfig& cfg) {
    const Matrix2Di classes = sieve(restrict_classes(diagnostic, cfg.uncertain_classes),
                                    cfg.sieve_size);

    std::set<int> present(classes.data(), classes.data() + classes.size());
    std::vector<CertaintyZone> zones;
    for (int code : present) {
        if (code == 0) continue;
        GeometryPtr traced = trace_class(ctx, classes, code, transform);
        if (is_empty(ctx, traced.get())) continue;
        GeometryPtr simplified = simplify_preserve_topology(ctx, traced.get(), cfg.simplify_tolerance);
        CertaintyZone zone;
        zone.code = code;
        zone.polygon = buffer(ctx, simplified.get(), 0.0);
        zones.push_back(std::move(zone));
    }
    return zones;
}

std::vector<ContourSegment> contour_certainty(const GeosContext& ctx,
                                              const contour::ContourSet& contours,
                                              const std::vector<CertaintyZone>& zones,
                                              const config::CertaintyConfig& cfg,
                                              int baseline_year, const std::string& crs) {
    // Effective zone of each class after removing higher codes
    std::vector<std::pair<int, GeometryPtr>> effective;
    GeometryPtr higher = make_empty(ctx, GEOS_MULTIPOLYGON);
    std::vector<const CertaintyZone*> ordered;
    for (const auto& z : zones) ordered.push_back(&z);
    std::sort(ordered.begin(), ordered.end(),
              [](const CertaintyZone* a, const CertaintyZone* b) { return a->code > b->code; });
    for (const CertaintyZone* z : ordered) {
        effective.emplace_back(z->code, difference(ctx, z->polygon.get(), higher.get()));
        higher = union_all(ctx, {higher.get(), z->polygon.get()});
    }

    // Built on the first artifact-year segment
    std::unique_ptr<GeographicTransform> to_geographic;
    auto label_for = [&](int year, const GEOSGeometry* g, const std::string& base) {
        if (!cfg.artifact_override) return base;
        if (std::find(cfg.artifact_years.begin(), cfg.artifact_years.end(), year) ==
            cfg.artifact_years.end()) {
            return base;
        }
        if (!to_geographic) {
            if (crs.empty()) {
                throw ValidationError("artifact year " + std::to_string(year) +
                                      " needs the analysis CRS to locate its latitude");
            }
            to_geographic = std::make_unique<GeographicTransform>(crs);
        }
        const Coordinate lonlat = to_geographic->to_lonlat(centroid(ctx, g));
        return lonlat.y > cfg.artifact_min_lat ? std::string(kArtifactLabel) : base;
    };

    std::vector<ContourSegment> out;
    for (const auto& c : contours.contours) {
        const std::string maturity = c.year == baseline_year ? "interim" : "final";
        std::vector<std::pair<std::string, GeometryPtr>> parts;
        parts.emplace_back(certainty_label(0),
                           lineal_part(ctx, difference(ctx, c.geometry.get(), higher.get()).get()));
        for (auto it = effective.rbegin(); it != effective.rend(); ++it) {
            parts.emplace_back(certainty_label(it->first),
                               lineal_part(ctx, intersection(ctx, c.geometry.get(), it->second.get()).get()));
        }
        for (auto& [label, geom] : parts) {
            if (is_empty(ctx, geom.get())) continue;
            ContourSegment seg;
            seg.year = c.year;
            seg.certainty = label_for(c.year, geom.get(), label);
            seg.maturity = maturity;
            seg.geometry = std::move(geom);
            out.push_back(std::move(seg));
        }
    }
    return out;
}

} // namespace shoreline::analysis
