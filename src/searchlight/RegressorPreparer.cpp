/**
 * @file RegressorPreparer.cpp
 * @brief Implementation of regressor preparation
 */

#include "RegressorPreparer.h"
#include "../core/NeuroDecodeExceptions.h"

namespace neurodecode {
namespace searchlight {

RegressorPreparer::RegressorPreparer(const RunLayout &layout)
    : m_layout(layout) {}

void RegressorPreparer::SetNuisanceRegressors(const Matrix &nuisance) {
  if (nuisance.cols() == 0) {
    throw ConfigurationException("nuisance regressors", "0 columns",
                                 "at least one nuisance variable");
  }
  m_nuisance = std::make_unique<NuisanceRegression>(m_layout, nuisance);
}

RunBlocks RegressorPreparer::Split(const Matrix &regressors) const {
  if (regressors.cols() == 0) {
    throw ConfigurationException("regressors", "0 columns",
                                 "at least one variable to decode");
  }
  return m_layout.SplitRuns(regressors, "regressors");
}

RunBlocks RegressorPreparer::Prepare(const Matrix &regressors,
                                     RunBlocks &activity) const {
  RunBlocks blocks = Split(regressors);

  if (activity.size() != blocks.size()) {
    throw ShapeMismatchException("RegressorPreparer", "activity run count",
                                 blocks.size(), activity.size());
  }

  if (m_nuisance) {
    m_nuisance->Apply(blocks);
    m_nuisance->Apply(activity);
  }

  return blocks;
}

} // namespace searchlight
} // namespace neurodecode
