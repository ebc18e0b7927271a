#include "shoreline/masking/temporal.hpp"
#include "shoreline/masking/morphology.hpp"

namespace shoreline::masking {

std::vector<Matrix2Di> label_land_blobs(const std::vector<Matrix2Db>& land, int connectivity) {
    std::vector<Matrix2Di> out;
    out.reserve(land.size());
    for (const auto& year : land) {
        out.push_back(label_components(year, connectivity));
    }
    return out;
}

std::vector<Matrix2Db> neighbour_land(const std::vector<Matrix2Db>& land) {
    std::vector<Matrix2Db> out;
    out.reserve(land.size());
    for (size_t i = 0; i < land.size(); ++i) {
        Matrix2Db n = Matrix2Db::Zero(land[i].rows(), land[i].cols());
        if (i > 0) n = logical_or(n, land[i - 1]);
        if (i + 1 < land.size()) n = logical_or(n, land[i + 1]);
        out.push_back(std::move(n));
    }
    return out;
}

Matrix2Db contiguous_blobs(const Matrix2Di& labels, const Matrix2Db& neighbours) {
    const int32_t max_label = labels.size() > 0 ? labels.maxCoeff() : 0;
    std::vector<uint8_t> touches(static_cast<size_t>(max_label) + 1, 0);
    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        const int32_t l = labels.data()[i];
        if (l > 0 && neighbours.data()[i] != 0) {
            touches[static_cast<size_t>(l)] = 1;
        }
    }

    Matrix2Db keep = Matrix2Db::Ones(labels.rows(), labels.cols());
    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        const int32_t l = labels.data()[i];
        if (l > 0 && !touches[static_cast<size_t>(l)]) {
            keep.data()[i] = 0;
        }
    }
    return keep;
}

std::vector<Matrix2Db> temporal_mask(const std::vector<Matrix2Db>& land, int connectivity) {
    const auto labels = label_land_blobs(land, connectivity);
    const auto neighbours = neighbour_land(land);
    std::vector<Matrix2Db> out;
    out.reserve(land.size());
    for (size_t i = 0; i < land.size(); ++i) {
        out.push_back(contiguous_blobs(labels[i], neighbours[i]));
    }
    return out;
}

} // namespace shoreline::masking
