#include "shoreline/io/raster_stack.hpp"
#include "shoreline/io/fits_io.hpp"
#include "shoreline/core/errors.hpp"
#include "shoreline/core/utils.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

namespace shoreline::io {

namespace {

const char* kGapfillSuffix = "_gapfill";

struct LayerSet {
    std::map<std::string, std::map<int, fs::path>> by_layer;
};

// First grid fixes the reference shape, transform and CRS
void check_grid(const Matrix2Df& grid, const FitsHeader& header, RasterStack& stack,
                long& ref_rows, long& ref_cols, const fs::path& path) {
    const GeoTransform t = read_transform(header);
    if (ref_rows < 0) {
        ref_rows = grid.rows();
        ref_cols = grid.cols();
        stack.transform = t;
        stack.crs = read_crs(header);
        return;
    }
    if (grid.rows() != ref_rows || grid.cols() != ref_cols) {
        throw ValidationError("raster shape mismatch: " + path.string());
    }
    if (t != stack.transform) {
        throw ValidationError("raster transform mismatch: " + path.string());
    }
}

RasterStack load_stack(const LayerSet& files, const std::vector<std::string>& layers,
                       int start_year, const std::string& label) {
    std::set<int> years;
    for (const auto& layer : layers) {
        auto it = files.by_layer.find(layer);
        if (it == files.by_layer.end() || it->second.empty()) {
            throw NoDataError("no " + label + " rasters found for layer '" + layer + "'");
        }
        for (const auto& kv : it->second) {
            if (kv.first >= start_year) years.insert(kv.first);
        }
    }
    if (years.empty()) {
        throw NoDataError("no " + label + " rasters at or after " + std::to_string(start_year));
    }

    RasterStack stack;
    long ref_rows = -1;
    long ref_cols = -1;
    for (int year : years) {
        std::vector<Matrix2Df> grids;
        for (const auto& layer : layers) {
            const auto& per_year = files.by_layer.at(layer);
            auto it = per_year.find(year);
            if (it == per_year.end()) {
                throw NoDataError(label + " layer '" + layer + "' missing for " +
                                  std::to_string(year));
            }
            auto [grid, header] = read_fits_float(it->second);
            check_grid(grid, header, stack, ref_rows, ref_cols, it->second);
            grids.push_back(std::move(grid));
        }
        stack.years.push_back(year);
        stack.index.push_back(std::move(grids[0]));
        stack.tide_m.push_back(std::move(grids[1]));
        stack.count.push_back(std::move(grids[2]));
        stack.stdev.push_back(std::move(grids[3]));
    }
    return stack;
}

} // namespace

int RasterStack::year_index(int year) const {
    auto it = std::find(years.begin(), years.end(), year);
    return it == years.end() ? -1 : static_cast<int>(it - years.begin());
}

std::optional<RasterFileEntry> parse_raster_filename(const fs::path& path) {
    if (!is_fits_image_path(path)) return std::nullopt;
    std::string stem = path.stem().string();
    const size_t sep = stem.find('_');
    if (sep != 4) return std::nullopt;
    const std::string year_str = stem.substr(0, 4);
    if (!std::all_of(year_str.begin(), year_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    RasterFileEntry entry;
    entry.year = std::stoi(year_str);
    entry.layer = stem.substr(sep + 1);
    entry.path = path;
    if (core::ends_with(entry.layer, kGapfillSuffix)) {
        entry.gapfill = true;
        entry.layer.erase(entry.layer.size() - std::string(kGapfillSuffix).size());
    }
    if (entry.layer.empty()) return std::nullopt;
    return entry;
}

std::vector<RasterFileEntry> scan_raster_dir(const fs::path& dir) {
    std::vector<RasterFileEntry> out;
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw NoDataError("raster directory not found: " + dir.string());
    }
    for (const auto& p : core::discover_files(dir, "*.fits")) {
        if (auto entry = parse_raster_filename(p)) {
            out.push_back(*entry);
        }
    }
    std::sort(out.begin(), out.end(), [](const RasterFileEntry& a, const RasterFileEntry& b) {
        if (a.year != b.year) return a.year < b.year;
        if (a.gapfill != b.gapfill) return !a.gapfill;
        return a.layer < b.layer;
    });
    return out;
}

TileRasters load_tile_rasters(const fs::path& dir, const std::string& water_index, int start_year) {
    const std::vector<std::string> layers = {water_index, "tide_m", "count", "stdev"};

    LayerSet annual_files;
    LayerSet gapfill_files;
    for (const auto& entry : scan_raster_dir(dir)) {
        if (std::find(layers.begin(), layers.end(), entry.layer) == layers.end()) continue;
        LayerSet& target = entry.gapfill ? gapfill_files : annual_files;
        target.by_layer[entry.layer][entry.year] = entry.path;
    }
    if (annual_files.by_layer.empty()) {
        throw NoDataError("no rasters found for this tile in " + dir.string());
    }

    TileRasters out;
    out.annual = load_stack(annual_files, layers, start_year, "annual");

    if (!gapfill_files.by_layer.empty()) {
        RasterStack gapfill = load_stack(gapfill_files, layers, start_year, "gapfill");
        if (gapfill.rows() != out.annual.rows() || gapfill.cols() != out.annual.cols() ||
            gapfill.transform != out.annual.transform) {
            throw ValidationError("gapfill grid does not match annual grid");
        }
        for (int year : out.annual.years) {
            if (gapfill.year_index(year) < 0) {
                throw NoDataError("gapfill rasters missing for " + std::to_string(year));
            }
        }
        out.gapfill = std::move(gapfill);
    } else {
        std::cerr << "[SCAN] no gapfill companions in " << dir.string()
                  << "; annual values used as-is" << std::endl;
    }

    return out;
}

} // namespace shoreline::io
