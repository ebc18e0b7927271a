#pragma once

#include "shoreline/core/types.hpp"
#include <vector>

namespace shoreline::masking {

// Connected land blobs of every year, labelled independently per year.
std::vector<Matrix2Di> label_land_blobs(const std::vector<Matrix2Db>& land, int connectivity);

// Land in the previous or next year (missing neighbours count as no land).
std::vector<Matrix2Db> neighbour_land(const std::vector<Matrix2Db>& land);

// 1 everywhere except pixels of blobs that touch no neighbour-year land.
Matrix2Db contiguous_blobs(const Matrix2Di& labels, const Matrix2Db& neighbours);

// Per-year mask removing land blobs with no land presence in an adjacent year.
std::vector<Matrix2Db> temporal_mask(const std::vector<Matrix2Db>& land, int connectivity);

} // namespace shoreline::masking
