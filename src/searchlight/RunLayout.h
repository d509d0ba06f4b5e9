/**
 * @file RunLayout.h
 * @brief Partitioning of trial-wise data into scan runs with trial exclusion
 */

#ifndef NEURODECODE_RUN_LAYOUT_H
#define NEURODECODE_RUN_LAYOUT_H

#include <string>
#include <vector>

#include "LinearAlgebra.h"

namespace neurodecode {
namespace searchlight {

/**
 * @brief Fixed-length runs plus the per-trial exclusion mask
 *
 * Trial t of run r lives at row r * run_length + t of every trial-wise
 * matrix. The same layout is applied to activity, regressors and nuisance
 * regressors, so all of them keep exactly the same trials.
 */
class RunLayout {
private:
  size_t m_run_length = 0;
  size_t m_run_count = 0;
  std::vector<bool> m_excluded; // run-major, true = excluded

public:
  RunLayout(size_t run_length, size_t run_count);

  /// excluded must hold run_length * run_count flags in trial order.
  RunLayout(size_t run_length, size_t run_count, std::vector<bool> excluded);

  /**
   * @brief Layout for a matrix with total_trials rows
   *
   * Throws ConfigurationException when total_trials is not a positive
   * multiple of run_length.
   */
  static RunLayout FromTrialCount(size_t total_trials, size_t run_length);

  /**
   * @brief Build the exclusion flags from a mask matrix
   *
   * A run_length x run_count matrix is read column by column (one column per
   * run); a single row or column is read in trial order. Nonzero entries mark
   * excluded trials. Any other shape throws ShapeMismatchException.
   */
  static std::vector<bool> ExclusionFromMatrix(const Matrix &mask,
                                               size_t run_length,
                                               size_t run_count);

  size_t GetRunLength() const { return m_run_length; }
  size_t GetRunCount() const { return m_run_count; }
  size_t GetTotalTrials() const { return m_run_length * m_run_count; }

  bool IsExcluded(size_t run, size_t trial) const;
  size_t GetRetainedCount(size_t run) const;
  size_t GetExcludedCount(size_t run) const;

  /// Row indices, relative to the run, of the trials that are kept.
  std::vector<unsigned> RetainedTrials(size_t run) const;

  /**
   * @brief Split a trial-wise matrix into per-run blocks of kept trials
   * @param what names the input in the ShapeMismatchException raised when
   *        its row count differs from the layout's trial count
   */
  RunBlocks SplitRuns(const Matrix &trialwise, const std::string &what) const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_RUN_LAYOUT_H
