#pragma once

#include "shoreline/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace shoreline::io {

// Header cards by value type; logical cards read back as strings
struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// 8-bit unsigned image, used for categorical rasters
void write_fits_byte(const fs::path& path, const Matrix2Db& data, const FitsHeader& header);

// (width, height, naxis)
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

// Affine transform in GT_A..GT_F; throws FitsError when any key is absent
GeoTransform read_transform(const FitsHeader& header);
void write_transform(FitsHeader& header, const GeoTransform& transform);

// CRS string or "" when absent
std::string read_crs(const FitsHeader& header);

} // namespace shoreline::io
