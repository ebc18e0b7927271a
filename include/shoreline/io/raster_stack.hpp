#pragma once

#include "shoreline/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shoreline::io {

// Per-year grids of one tile. All layers share shape, transform and CRS.
struct RasterStack {
    std::vector<int> years;
    std::vector<Matrix2Df> index;
    std::vector<Matrix2Df> tide_m;
    std::vector<Matrix2Df> count;
    std::vector<Matrix2Df> stdev;
    GeoTransform transform;
    std::string crs;

    size_t size() const { return years.size(); }
    int rows() const { return index.empty() ? 0 : static_cast<int>(index.front().rows()); }
    int cols() const { return index.empty() ? 0 : static_cast<int>(index.front().cols()); }

    // Position of year in years, or -1
    int year_index(int year) const;
};

struct TileRasters {
    RasterStack annual;
    std::optional<RasterStack> gapfill;
};

struct RasterFileEntry {
    int year = 0;
    std::string layer;
    bool gapfill = false;
    fs::path path;
};

// Parses <year>_<layer>.fits and <year>_<layer>_gapfill.fits names
std::optional<RasterFileEntry> parse_raster_filename(const fs::path& path);

std::vector<RasterFileEntry> scan_raster_dir(const fs::path& dir);

// Loads the annual stack and, when companions exist, the gapfill stack.
// Throws NoDataError when nothing matches or a layer is missing and
// ValidationError when layers disagree on shape or transform.
TileRasters load_tile_rasters(const fs::path& dir, const std::string& water_index, int start_year);

} // namespace shoreline::io
