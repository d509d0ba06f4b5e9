/**
 * @file TrialConditioner.h
 * @brief Per-run trial selection and z-scoring of the activity matrix
 */

#ifndef NEURODECODE_TRIAL_CONDITIONER_H
#define NEURODECODE_TRIAL_CONDITIONER_H

#include "LinearAlgebra.h"
#include "RunLayout.h"

namespace neurodecode {
namespace searchlight {

class TrialConditioner {
private:
  RunLayout m_layout;

public:
  explicit TrialConditioner(const RunLayout &layout);

  /**
   * @brief Split activity (trials x locations) into normalized run blocks
   *
   * Every run keeps its non-excluded trials; each location is centred on its
   * run mean and, when it varies within the run, scaled to unit sample
   * standard deviation. The input is left untouched.
   */
  RunBlocks Condition(const Matrix &activity) const;

  /**
   * @brief Centre every column and scale the non-constant ones
   *
   * A column counts as constant when its standard deviation is negligible
   * against its magnitude; such columns end up (numerically) zero.
   */
  static void NormalizeColumns(Matrix &block);

  const RunLayout &GetLayout() const { return m_layout; }
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_TRIAL_CONDITIONER_H
