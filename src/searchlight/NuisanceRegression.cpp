/**
 * @file NuisanceRegression.cpp
 * @brief Implementation of per-run nuisance projection
 */

#include "NuisanceRegression.h"
#include "../core/NeuroDecodeExceptions.h"

namespace neurodecode {
namespace searchlight {

NuisanceRegression::NuisanceRegression(const RunLayout &layout,
                                       const Matrix &nuisance)
    : m_nuisance(layout.SplitRuns(nuisance, "nuisance regressors")) {
  m_projectors.reserve(m_nuisance.size());
  for (const auto &block : m_nuisance) {
    m_projectors.push_back(PseudoInverse(block));
  }
}

void NuisanceRegression::Apply(RunBlocks &blocks) const {
  if (blocks.size() != m_nuisance.size()) {
    throw ShapeMismatchException("NuisanceRegression", "run count",
                                 m_nuisance.size(), blocks.size());
  }

  for (size_t run = 0; run < blocks.size(); ++run) {
    Matrix &block = blocks[run];
    if (block.rows() != m_nuisance[run].rows()) {
      throw ShapeMismatchException("NuisanceRegression",
                                   "retained trials of run " +
                                       std::to_string(run + 1),
                                   m_nuisance[run].rows(), block.rows());
    }
    if (block.rows() == 0 || block.cols() == 0) {
      continue;
    }
    block -= m_nuisance[run] * (m_projectors[run] * block);
  }
}

} // namespace searchlight
} // namespace neurodecode
