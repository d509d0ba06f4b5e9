/**
 * @file TrialConditioner.cpp
 * @brief Implementation of run splitting and within-run normalization
 */

#include "TrialConditioner.h"
#include <algorithm>
#include <cmath>

namespace neurodecode {
namespace searchlight {

namespace {

// Standard deviations below this fraction of the column magnitude are
// rounding noise left over from centering a constant column
constexpr double kRelativeVarianceTolerance = 1e-10;

} // namespace

TrialConditioner::TrialConditioner(const RunLayout &layout)
    : m_layout(layout) {}

RunBlocks TrialConditioner::Condition(const Matrix &activity) const {
  RunBlocks blocks = m_layout.SplitRuns(activity, "activity");
  for (auto &block : blocks) {
    NormalizeColumns(block);
  }
  return blocks;
}

void TrialConditioner::NormalizeColumns(Matrix &block) {
  const int rows = static_cast<int>(block.rows());
  const int cols = static_cast<int>(block.cols());
  if (rows == 0) {
    return;
  }

#pragma omp parallel for
  for (int c = 0; c < cols; ++c) {
    const unsigned col = static_cast<unsigned>(c);

    double sum = 0.0;
    double magnitude = 0.0;
    for (int r = 0; r < rows; ++r) {
      const double value = block(static_cast<unsigned>(r), col);
      sum += value;
      magnitude = std::max(magnitude, std::abs(value));
    }
    const double mean = sum / rows;

    double sum_squares = 0.0;
    for (int r = 0; r < rows; ++r) {
      double &value = block(static_cast<unsigned>(r), col);
      value -= mean;
      sum_squares += value * value;
    }

    const double sd = rows > 1 ? std::sqrt(sum_squares / (rows - 1)) : 0.0;
    if (sd > kRelativeVarianceTolerance * magnitude && sd > 0.0) {
      for (int r = 0; r < rows; ++r) {
        block(static_cast<unsigned>(r), col) /= sd;
      }
    }
  }
}

} // namespace searchlight
} // namespace neurodecode
