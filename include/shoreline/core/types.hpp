#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace shoreline {

namespace fs = std::filesystem;

// Raster grid types, row-major so rows map directly onto image rows
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Db = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Map coordinate in the analysis CRS
struct Coordinate {
    double x = 0.0;
    double y = 0.0;
};

using Polyline = std::vector<Coordinate>;

// Affine pixel-to-map transform referenced to pixel corners:
//   x = a*col + b*row + c
//   y = d*col + e*row + f
struct GeoTransform {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = -1.0;
    double f = 0.0;

    // Map coordinate of a (fractional) pixel position, measured so that
    // integer positions fall on pixel centres.
    Coordinate pixel_center(double row, double col) const {
        const double cc = col + 0.5;
        const double rr = row + 0.5;
        return {a * cc + b * rr + c, d * cc + e * rr + f};
    }

    // Inverse of pixel_center: fractional (row, col) with pixel centres at
    // integer positions.
    std::pair<double, double> to_pixel(const Coordinate& p) const {
        const double det = a * e - b * d;
        const double dx = p.x - c;
        const double dy = p.y - f;
        const double col = (e * dx - b * dy) / det;
        const double row = (-d * dx + a * dy) / det;
        return {row - 0.5, col - 0.5};
    }

    double pixel_size() const {
        return std::sqrt(std::abs(a * e - b * d));
    }

    bool operator==(const GeoTransform& o) const {
        return a == o.a && b == o.b && c == o.c && d == o.d && e == o.e && f == o.f;
    }
    bool operator!=(const GeoTransform& o) const { return !(*this == o); }
};

// Codes of the all-time diagnostic raster
enum class DiagnosticClass : uint8_t {
    RELIABLE = 0,
    OUTSIDE_BUFFER = 1,
    WATERBODY = 3,
    TIDAL_UNCERTAINTY = 4,
    LOW_OBSERVATIONS = 5
};

inline uint8_t diagnostic_code(DiagnosticClass c) {
    return static_cast<uint8_t>(c);
}

enum class CertaintyClass {
    GOOD,
    TIDAL_ISSUES,
    INSUFFICIENT_DATA,
    AEROSOL_ISSUES
};

inline std::string certainty_to_string(CertaintyClass c) {
    switch (c) {
        case CertaintyClass::GOOD: return "good";
        case CertaintyClass::TIDAL_ISSUES: return "tidal issues";
        case CertaintyClass::INSUFFICIENT_DATA: return "insufficient data";
        case CertaintyClass::AEROSOL_ISSUES: return "aerosol issues";
        default: return "unknown";
    }
}

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    WATERBODY_MASK = 1,
    COASTAL_MASK = 2,
    CONTOUR_EXTRACTION = 3,
    POINT_SAMPLING = 4,
    ANNUAL_MOVEMENTS = 5,
    REGRESSION = 6,
    STATISTICS = 7,
    CERTAINTY = 8,
    EXPORT = 9,
    DONE = 10
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::WATERBODY_MASK: return "WATERBODY_MASK";
        case Phase::COASTAL_MASK: return "COASTAL_MASK";
        case Phase::CONTOUR_EXTRACTION: return "CONTOUR_EXTRACTION";
        case Phase::POINT_SAMPLING: return "POINT_SAMPLING";
        case Phase::ANNUAL_MOVEMENTS: return "ANNUAL_MOVEMENTS";
        case Phase::REGRESSION: return "REGRESSION";
        case Phase::STATISTICS: return "STATISTICS";
        case Phase::CERTAINTY: return "CERTAINTY";
        case Phase::EXPORT: return "EXPORT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace shoreline
