/**
 * @file LinearAlgebra.h
 * @brief Dense helpers shared by the conditioning and regression stages
 */

#ifndef NEURODECODE_LINEAR_ALGEBRA_H
#define NEURODECODE_LINEAR_ALGEBRA_H

#include <optional>
#include <vector>

#include "vnl/vnl_matrix.h"
#include "vnl/vnl_vector.h"

namespace neurodecode {
namespace searchlight {

using Matrix = vnl_matrix<double>;
using Vector = vnl_vector<double>;

/// One matrix per scan run, trials as rows.
using RunBlocks = std::vector<Matrix>;

/**
 * @brief Moore-Penrose pseudo-inverse through the SVD
 *
 * Singular values below max(rows, cols) * eps * largest singular value are
 * treated as zero, so rank-deficient inputs are handled without error.
 * Throws NumericalException if the decomposition fails to converge.
 */
Matrix PseudoInverse(const Matrix &matrix);

/// Concatenate blocks vertically. All blocks must share a column count.
Matrix StackRows(const std::vector<const Matrix *> &blocks);

/// Copy of matrix with a trailing column of ones.
Matrix AppendInterceptColumn(const Matrix &matrix);

Matrix SelectColumns(const Matrix &matrix, const std::vector<unsigned> &columns);
Matrix SelectRows(const Matrix &matrix, const std::vector<unsigned> &rows);

/**
 * @brief Pearson correlation of two equally long vectors
 * @return std::nullopt when either vector has zero variance
 */
std::optional<double> PearsonCorrelation(const Vector &a, const Vector &b);

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_LINEAR_ALGEBRA_H
