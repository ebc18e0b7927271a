#include "shoreline/masking/morphology.hpp"
#include "shoreline/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <cstring>

namespace shoreline::masking {

namespace {

cv::Mat disk_kernel(int radius) {
    const int size = 2 * radius + 1;
    cv::Mat k = cv::Mat::zeros(size, size, CV_8U);
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius * radius) {
                k.at<uint8_t>(dy + radius, dx + radius) = 1;
            }
        }
    }
    return k;
}

cv::Mat as_mat(const Matrix2Db& m) {
    return cv::Mat(static_cast<int>(m.rows()), static_cast<int>(m.cols()), CV_8U,
                   const_cast<uint8_t*>(m.data()));
}

Matrix2Db from_mat(const cv::Mat& m) {
    Matrix2Db out(m.rows, m.cols);
    cv::Mat c = m.isContinuous() ? m : m.clone();
    std::memcpy(out.data(), c.data, out.size() * sizeof(uint8_t));
    return out;
}

Matrix2Db morph(const Matrix2Db& mask, int radius, int op) {
    if (radius <= 0 || mask.size() == 0) {
        return mask;
    }
    cv::Mat out;
    cv::morphologyEx(as_mat(mask), out, op, disk_kernel(radius));
    return from_mat(out);
}

} // namespace

Matrix2Db erode(const Matrix2Db& mask, int radius) {
    return morph(mask, radius, cv::MORPH_ERODE);
}

Matrix2Db dilate(const Matrix2Db& mask, int radius) {
    return morph(mask, radius, cv::MORPH_DILATE);
}

Matrix2Db close(const Matrix2Db& mask, int radius) {
    return morph(mask, radius, cv::MORPH_CLOSE);
}

Matrix2Di label_components(const Matrix2Db& mask, int connectivity, int* n_labels) {
    if (connectivity != 4 && connectivity != 8) {
        throw ValidationError("connectivity must be 4 or 8");
    }
    Matrix2Di out = Matrix2Di::Zero(mask.rows(), mask.cols());
    if (mask.size() == 0) {
        if (n_labels) *n_labels = 0;
        return out;
    }
    cv::Mat labels;
    const int n = cv::connectedComponents(as_mat(mask), labels, connectivity, CV_32S);
    std::memcpy(out.data(), labels.data, out.size() * sizeof(int32_t));
    if (n_labels) *n_labels = n - 1;
    return out;
}

Matrix2Db logical_and(const Matrix2Db& a, const Matrix2Db& b) {
    return ((a.array() != uint8_t(0)) && (b.array() != uint8_t(0))).cast<uint8_t>();
}

Matrix2Db logical_or(const Matrix2Db& a, const Matrix2Db& b) {
    return ((a.array() != uint8_t(0)) || (b.array() != uint8_t(0))).cast<uint8_t>();
}

Matrix2Db logical_not(const Matrix2Db& a) {
    return (a.array() == uint8_t(0)).cast<uint8_t>();
}

} // namespace shoreline::masking
