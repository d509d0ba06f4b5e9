/**
 * @file NuisanceRegression.h
 * @brief Optional removal of nuisance-explained variance, run by run
 */

#ifndef NEURODECODE_NUISANCE_REGRESSION_H
#define NEURODECODE_NUISANCE_REGRESSION_H

#include "LinearAlgebra.h"
#include "RunLayout.h"

namespace neurodecode {
namespace searchlight {

/**
 * @brief Orthogonal projection away from per-run nuisance regressors
 *
 * For run r with nuisance block N_r and projector P_r = pinv(N_r), Apply
 * replaces every column y of a run block by y - N_r (P_r y).
 */
class NuisanceRegression {
private:
  RunBlocks m_nuisance;
  RunBlocks m_projectors;

public:
  /// nuisance is trials x nuisance variables, split with the given layout.
  NuisanceRegression(const RunLayout &layout, const Matrix &nuisance);

  /// Residualize blocks in place; blocks must follow the same layout.
  void Apply(RunBlocks &blocks) const;

  size_t GetNumberOfRuns() const { return m_nuisance.size(); }
  const Matrix &GetNuisance(size_t run) const { return m_nuisance.at(run); }
  const Matrix &GetProjector(size_t run) const {
    return m_projectors.at(run);
  }
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_NUISANCE_REGRESSION_H
