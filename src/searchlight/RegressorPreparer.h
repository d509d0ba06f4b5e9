/**
 * @file RegressorPreparer.h
 * @brief Run splitting of the decoded variables and optional nuisance removal
 */

#ifndef NEURODECODE_REGRESSOR_PREPARER_H
#define NEURODECODE_REGRESSOR_PREPARER_H

#include <memory>

#include "LinearAlgebra.h"
#include "NuisanceRegression.h"
#include "RunLayout.h"

namespace neurodecode {
namespace searchlight {

class RegressorPreparer {
private:
  RunLayout m_layout;
  std::unique_ptr<NuisanceRegression> m_nuisance;

public:
  explicit RegressorPreparer(const RunLayout &layout);

  /// Enable nuisance removal; nuisance is trials x nuisance variables.
  void SetNuisanceRegressors(const Matrix &nuisance);
  bool HasNuisanceRegressors() const { return m_nuisance != nullptr; }
  const NuisanceRegression *GetNuisanceRegression() const {
    return m_nuisance.get();
  }

  /**
   * @brief Split regressors (trials x variables) into masked run blocks
   *
   * With nuisance regressors set, the nuisance-explained part is removed
   * from the returned blocks and from the conditioned activity blocks. Without
   * them activity is not touched.
   */
  RunBlocks Prepare(const Matrix &regressors, RunBlocks &activity) const;

  /// Split and mask only.
  RunBlocks Split(const Matrix &regressors) const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_REGRESSOR_PREPARER_H
