#include "shoreline/masking/connectivity.hpp"
#include "shoreline/masking/morphology.hpp"

#include <cmath>
#include <set>

namespace shoreline::masking {

std::vector<PixelIndex> seed_pixels(const std::vector<Coordinate>& seeds,
                                    const GeoTransform& transform, int rows, int cols) {
    std::vector<PixelIndex> out;
    out.reserve(seeds.size());
    for (const auto& s : seeds) {
        const auto [fr, fc] = transform.to_pixel(s);
        if (!std::isfinite(fr) || !std::isfinite(fc)) continue;
        const int r = static_cast<int>(std::lround(fr));
        const int c = static_cast<int>(std::lround(fc));
        if (r < 0 || r >= rows || c < 0 || c >= cols) continue;
        out.emplace_back(r, c);
    }
    return out;
}

Matrix2Db ocean_mask(const Matrix2Db& not_water, const std::vector<PixelIndex>& seeds,
                     int connectivity, int dilation) {
    const Matrix2Db water = logical_not(not_water);
    const Matrix2Di blobs = label_components(water, connectivity);

    std::set<int32_t> ocean_labels;
    for (const auto& [r, c] : seeds) {
        if (r < 0 || r >= blobs.rows() || c < 0 || c >= blobs.cols()) continue;
        const int32_t label = blobs(r, c);
        if (label != 0) ocean_labels.insert(label);
    }

    Matrix2Db mask = Matrix2Db::Zero(not_water.rows(), not_water.cols());
    if (ocean_labels.empty()) {
        return mask;
    }
    for (Eigen::Index r = 0; r < blobs.rows(); ++r) {
        for (Eigen::Index c = 0; c < blobs.cols(); ++c) {
            const int32_t label = blobs(r, c);
            if (label != 0 && ocean_labels.count(label)) {
                mask(r, c) = 1;
            }
        }
    }
    return dilation > 0 ? dilate(mask, dilation) : mask;
}

Matrix2Db ocean_mask(const Matrix2Db& not_water, const std::vector<Coordinate>& seeds,
                     const GeoTransform& transform, int connectivity, int dilation) {
    const auto pixels = seed_pixels(seeds, transform, static_cast<int>(not_water.rows()),
                                    static_cast<int>(not_water.cols()));
    return ocean_mask(not_water, pixels, connectivity, dilation);
}

} // namespace shoreline::masking
