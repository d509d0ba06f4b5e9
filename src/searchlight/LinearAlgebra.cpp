/**
 * @file LinearAlgebra.cpp
 * @brief Pseudo-inverse, stacking and correlation helpers
 */

#include "LinearAlgebra.h"
#include "../core/NeuroDecodeExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>

#include "vnl/algo/vnl_svd.h"

namespace neurodecode {
namespace searchlight {

Matrix PseudoInverse(const Matrix &matrix) {
  const unsigned rows = matrix.rows();
  const unsigned cols = matrix.cols();

  if (rows == 0 || cols == 0) {
    return Matrix(cols, rows, 0.0);
  }

  // The SVD is taken on the tall orientation
  if (rows < cols) {
    return PseudoInverse(matrix.transpose()).transpose();
  }

  const double relative_tolerance =
      std::max(rows, cols) * std::numeric_limits<double>::epsilon();

  // A negative tolerance makes vnl_svd zero singular values relative to the
  // largest one
  vnl_svd<double> svd(matrix, -relative_tolerance);
  if (!svd.valid()) {
    throw NumericalException("PseudoInverse",
                             "singular value decomposition did not converge",
                             static_cast<double>(rows));
  }

  return svd.pinverse();
}

Matrix StackRows(const std::vector<const Matrix *> &blocks) {
  unsigned total_rows = 0;
  unsigned cols = 0;
  bool first = true;

  for (const Matrix *block : blocks) {
    if (first) {
      cols = block->cols();
      first = false;
    } else if (block->cols() != cols) {
      throw ShapeMismatchException("LinearAlgebra", "stacked column count",
                                   cols, block->cols());
    }
    total_rows += block->rows();
  }

  Matrix stacked(total_rows, cols);
  unsigned offset = 0;
  for (const Matrix *block : blocks) {
    if (block->rows() > 0 && cols > 0) {
      stacked.update(*block, offset, 0);
    }
    offset += block->rows();
  }
  return stacked;
}

Matrix AppendInterceptColumn(const Matrix &matrix) {
  Matrix design(matrix.rows(), matrix.cols() + 1, 1.0);
  if (matrix.rows() > 0 && matrix.cols() > 0) {
    design.update(matrix, 0, 0);
  }
  return design;
}

Matrix SelectColumns(const Matrix &matrix,
                     const std::vector<unsigned> &columns) {
  Matrix selected(matrix.rows(), static_cast<unsigned>(columns.size()));
  for (unsigned c = 0; c < columns.size(); ++c) {
    if (columns[c] >= matrix.cols()) {
      throw ShapeMismatchException("LinearAlgebra", "selected column",
                                   matrix.cols(), columns[c]);
    }
    for (unsigned r = 0; r < matrix.rows(); ++r) {
      selected(r, c) = matrix(r, columns[c]);
    }
  }
  return selected;
}

Matrix SelectRows(const Matrix &matrix, const std::vector<unsigned> &rows) {
  Matrix selected(static_cast<unsigned>(rows.size()), matrix.cols());
  for (unsigned r = 0; r < rows.size(); ++r) {
    if (rows[r] >= matrix.rows()) {
      throw ShapeMismatchException("LinearAlgebra", "selected row",
                                   matrix.rows(), rows[r]);
    }
    selected.set_row(r, matrix.get_row(rows[r]));
  }
  return selected;
}

std::optional<double> PearsonCorrelation(const Vector &a, const Vector &b) {
  if (a.size() != b.size()) {
    throw ShapeMismatchException("LinearAlgebra", "correlated vector length",
                                 a.size(), b.size());
  }
  if (a.size() < 2) {
    return std::nullopt;
  }

  const double mean_a = a.mean();
  const double mean_b = b.mean();

  double cross = 0.0;
  double ss_a = 0.0;
  double ss_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double da = a[i] - mean_a;
    const double db = b[i] - mean_b;
    cross += da * db;
    ss_a += da * da;
    ss_b += db * db;
  }

  if (ss_a <= 0.0 || ss_b <= 0.0) {
    return std::nullopt;
  }

  return cross / std::sqrt(ss_a * ss_b);
}

} // namespace searchlight
} // namespace neurodecode
