#pragma once

#include "shoreline/core/types.hpp"

namespace shoreline::masking {

// Binary masks hold 0 or 1. Structuring elements are discs of the given
// radius (dx*dx + dy*dy <= r*r). Pixels beyond the grid edge neither
// erode nor dilate the mask.

Matrix2Db erode(const Matrix2Db& mask, int radius);
Matrix2Db dilate(const Matrix2Db& mask, int radius);
Matrix2Db close(const Matrix2Db& mask, int radius);

// Connected components of the non-zero pixels; 0 is background.
// connectivity is 4 or 8.
Matrix2Di label_components(const Matrix2Db& mask, int connectivity, int* n_labels = nullptr);

Matrix2Db logical_and(const Matrix2Db& a, const Matrix2Db& b);
Matrix2Db logical_or(const Matrix2Db& a, const Matrix2Db& b);
Matrix2Db logical_not(const Matrix2Db& a);

} // namespace shoreline::masking
