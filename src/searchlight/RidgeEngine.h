/**
 * @file RidgeEngine.h
 * @brief Cross-validated ridge regression with empirical shrinkage
 *
 * For every fold the engine fits ordinary least squares on the training runs,
 * derives one shrinkage factor per decoded variable following Xue et al.
 * (2010), refits with that factor, predicts the test runs and scores the
 * prediction by its Fisher-transformed correlation with the truth.
 */

#ifndef NEURODECODE_RIDGE_ENGINE_H
#define NEURODECODE_RIDGE_ENGINE_H

#include <optional>
#include <string>

#include "FoldDefinition.h"
#include "LinearAlgebra.h"

namespace neurodecode {
namespace searchlight {

/**
 * @brief What to do with a correlation of magnitude one
 */
enum class CorrelationPolicy {
  Clamp, // Pull r into [-1 + eps, 1 - eps]
  Throw  // Raise NumericalException
};

std::string CorrelationPolicyToString(CorrelationPolicy policy);

/// Accepts "clamp" or "throw" in any case; throws ConfigurationException.
CorrelationPolicy ParseCorrelationPolicy(const std::string &name);

struct RidgeOptions {
  CorrelationPolicy correlation_policy = CorrelationPolicy::Clamp;
  double clamp_epsilon = 1e-7;

  // Same factor for every variable instead of the empirical estimate;
  // 0 gives the plain least-squares fit
  std::optional<double> shrinkage_override;
};

/**
 * @brief Everything computed for one fold of one searchlight
 */
struct FoldFit {
  Matrix ols_betas;    // (features + intercept) x variables
  Matrix ridge_betas;  // (features + intercept) x variables
  Vector shrinkage;    // one factor per variable
  Matrix predictions;  // test trials x variables
  Matrix test_targets; // test trials x variables
  Vector correlations; // 0 where a side has no variance
  Vector z_scores;
};

class RidgeEngine {
private:
  RunBlocks m_regressors;
  FoldDefinition m_folds;
  RidgeOptions m_options;
  unsigned m_num_variables = 0;

public:
  /**
   * @param regressors conditioned per-run targets (trials x variables)
   * @param folds validated against the number of regressor runs; every fold
   *        needs at least 2 training trials and 3 test trials
   */
  RidgeEngine(RunBlocks regressors, FoldDefinition folds,
              RidgeOptions options = RidgeOptions());

  /**
   * @brief Mean Fisher z over folds, one entry per variable
   * @param features per-run searchlight features, same runs and retained
   *        trials as the regressors, at least one column
   */
  Vector Evaluate(const RunBlocks &features) const;

  FoldFit FitFold(const RunBlocks &features, size_t fold) const;

  /// pinv(design) * targets
  static Matrix FitLeastSquares(const Matrix &design, const Matrix &targets);

  /**
   * @brief Xue et al. (2010) shrinkage factor per variable
   *
   * k = p * (SSE / (n - 1)) / sum(beta^2), with p the number of design
   * columns and n the number of training trials. A zero coefficient vector
   * gives k = 0.
   */
  static Vector EstimateShrinkage(const Matrix &design, const Matrix &targets,
                                  const Matrix &betas);

  /// Column j is pinv(X'X + k_j I) X'y_j.
  static Matrix FitRidge(const Matrix &design, const Matrix &targets,
                         const Vector &shrinkage);

  /**
   * @brief z = 0.5 ln((1 + r) / (1 - r)) sqrt(n - 3)
   *
   * Throws NumericalException for n < 3, for a non-finite r, and for
   * |r| >= 1 under the Throw policy.
   */
  static double FisherZ(double r, size_t n, CorrelationPolicy policy,
                        double clamp_epsilon = 1e-7);

  unsigned GetNumberOfVariables() const { return m_num_variables; }
  const FoldDefinition &GetFolds() const { return m_folds; }
  const RidgeOptions &GetOptions() const { return m_options; }
  const RunBlocks &GetRegressors() const { return m_regressors; }

private:
  size_t CountTrials(const FoldDefinition::RunGroup &runs) const;
  void CheckFeatures(const RunBlocks &features) const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_RIDGE_ENGINE_H
