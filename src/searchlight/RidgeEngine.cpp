/**
 * @file RidgeEngine.cpp
 * @brief Implementation of the per-searchlight cross-validated ridge fit
 */

#include "RidgeEngine.h"
#include "../core/NeuroDecodeExceptions.h"
#include "../io/CompatUtils.h"
#include <algorithm>
#include <cmath>

namespace neurodecode {
namespace searchlight {

std::string CorrelationPolicyToString(CorrelationPolicy policy) {
  switch (policy) {
  case CorrelationPolicy::Clamp:
    return "clamp";
  case CorrelationPolicy::Throw:
    return "throw";
  default:
    return "unknown";
  }
}

CorrelationPolicy ParseCorrelationPolicy(const std::string &name) {
  const std::string lower_name = io::compat::to_lower(name);
  if (lower_name == "clamp") {
    return CorrelationPolicy::Clamp;
  }
  if (lower_name == "throw") {
    return CorrelationPolicy::Throw;
  }
  throw ConfigurationException("correlation_policy", name, "clamp or throw");
}

// ===== RidgeEngine Implementation =====

RidgeEngine::RidgeEngine(RunBlocks regressors, FoldDefinition folds,
                         RidgeOptions options)
    : m_regressors(std::move(regressors)), m_folds(std::move(folds)),
      m_options(options) {
  if (m_regressors.empty()) {
    throw ConfigurationException("regressors", "0 runs", "at least one run");
  }

  m_num_variables = m_regressors.front().cols();
  if (m_num_variables == 0) {
    throw ConfigurationException("regressors", "0 columns",
                                 "at least one variable to decode");
  }
  for (const auto &block : m_regressors) {
    if (block.cols() != m_num_variables) {
      throw ShapeMismatchException("RidgeEngine", "regressor column count",
                                   m_num_variables, block.cols());
    }
  }

  if (!(m_options.clamp_epsilon > 0.0 && m_options.clamp_epsilon < 1.0)) {
    throw ConfigurationException("clamp_epsilon",
                                 std::to_string(m_options.clamp_epsilon),
                                 "value in (0, 1)");
  }
  if (m_options.shrinkage_override && *m_options.shrinkage_override < 0.0) {
    throw ConfigurationException("shrinkage_override",
                                 std::to_string(*m_options.shrinkage_override),
                                 "non-negative value");
  }

  m_folds.Validate(m_regressors.size());

  for (size_t f = 0; f < m_folds.GetNumberOfFolds(); ++f) {
    const size_t training_trials = CountTrials(m_folds.GetTrainingRuns(f));
    const size_t test_trials = CountTrials(m_folds.GetTestRuns(f));
    if (training_trials < 2) {
      throw ConfigurationException(
          "folds", "fold " + std::to_string(f + 1) + " with " +
                       std::to_string(training_trials) + " training trials",
          "at least 2 retained training trials");
    }
    if (test_trials < 3) {
      throw ConfigurationException(
          "folds", "fold " + std::to_string(f + 1) + " with " +
                       std::to_string(test_trials) + " test trials",
          "at least 3 retained test trials");
    }
  }
}

size_t RidgeEngine::CountTrials(const FoldDefinition::RunGroup &runs) const {
  size_t count = 0;
  for (size_t run : runs) {
    count += m_regressors[run].rows();
  }
  return count;
}

void RidgeEngine::CheckFeatures(const RunBlocks &features) const {
  if (features.size() != m_regressors.size()) {
    throw ShapeMismatchException("RidgeEngine", "feature run count",
                                 m_regressors.size(), features.size());
  }
  for (size_t run = 0; run < features.size(); ++run) {
    if (features[run].rows() != m_regressors[run].rows()) {
      throw ShapeMismatchException("RidgeEngine",
                                   "feature trials of run " +
                                       std::to_string(run + 1),
                                   m_regressors[run].rows(),
                                   features[run].rows());
    }
  }
}

Vector RidgeEngine::Evaluate(const RunBlocks &features) const {
  CheckFeatures(features);

  Vector cv(m_num_variables, 0.0);
  for (size_t f = 0; f < m_folds.GetNumberOfFolds(); ++f) {
    cv += FitFold(features, f).z_scores;
  }
  cv /= static_cast<double>(m_folds.GetNumberOfFolds());
  return cv;
}

FoldFit RidgeEngine::FitFold(const RunBlocks &features, size_t fold) const {
  CheckFeatures(features);

  std::vector<const Matrix *> training_x;
  std::vector<const Matrix *> training_y;
  for (size_t run : m_folds.GetTrainingRuns(fold)) {
    training_x.push_back(&features[run]);
    training_y.push_back(&m_regressors[run]);
  }

  std::vector<const Matrix *> test_x;
  std::vector<const Matrix *> test_y;
  for (size_t run : m_folds.GetTestRuns(fold)) {
    test_x.push_back(&features[run]);
    test_y.push_back(&m_regressors[run]);
  }

  const Matrix design = AppendInterceptColumn(StackRows(training_x));
  const Matrix targets = StackRows(training_y);

  FoldFit fit;
  fit.ols_betas = FitLeastSquares(design, targets);

  if (m_options.shrinkage_override) {
    fit.shrinkage = Vector(m_num_variables, *m_options.shrinkage_override);
  } else {
    fit.shrinkage = EstimateShrinkage(design, targets, fit.ols_betas);
  }
  fit.ridge_betas = FitRidge(design, targets, fit.shrinkage);

  const Matrix test_design = AppendInterceptColumn(StackRows(test_x));
  fit.test_targets = StackRows(test_y);
  fit.predictions = test_design * fit.ridge_betas;

  const size_t n = fit.test_targets.rows();
  fit.correlations = Vector(m_num_variables, 0.0);
  fit.z_scores = Vector(m_num_variables, 0.0);

  for (unsigned v = 0; v < m_num_variables; ++v) {
    std::optional<double> r = PearsonCorrelation(
        fit.predictions.get_column(v), fit.test_targets.get_column(v));
    if (!r) {
      continue; // constant prediction or target carries no information
    }
    fit.correlations[v] = *r;
    fit.z_scores[v] = FisherZ(*r, n, m_options.correlation_policy,
                              m_options.clamp_epsilon);
  }

  return fit;
}

Matrix RidgeEngine::FitLeastSquares(const Matrix &design,
                                    const Matrix &targets) {
  return PseudoInverse(design) * targets;
}

Vector RidgeEngine::EstimateShrinkage(const Matrix &design,
                                      const Matrix &targets,
                                      const Matrix &betas) {
  const Matrix residuals = targets - design * betas;
  const double p = static_cast<double>(design.cols());
  const double dof = static_cast<double>(design.rows()) - 1.0;

  Vector shrinkage(targets.cols(), 0.0);
  for (unsigned v = 0; v < targets.cols(); ++v) {
    const double residual_variance =
        residuals.get_column(v).squared_magnitude() / dof;
    const double coefficient_energy = betas.get_column(v).squared_magnitude();

    if (coefficient_energy > 0.0) {
      const double k = p * residual_variance / coefficient_energy;
      shrinkage[v] = std::isfinite(k) ? k : 0.0;
    }
  }
  return shrinkage;
}

Matrix RidgeEngine::FitRidge(const Matrix &design, const Matrix &targets,
                             const Vector &shrinkage) {
  const Matrix design_t = design.transpose();
  const Matrix xtx = design_t * design;
  const Matrix xty = design_t * targets;

  Matrix betas(design.cols(), targets.cols(), 0.0);
  Matrix penalized(xtx.rows(), xtx.cols());

  for (unsigned v = 0; v < targets.cols(); ++v) {
    penalized = xtx;
    for (unsigned d = 0; d < penalized.rows(); ++d) {
      penalized(d, d) += shrinkage[v];
    }
    betas.set_column(v, PseudoInverse(penalized) * xty.get_column(v));
  }
  return betas;
}

double RidgeEngine::FisherZ(double r, size_t n, CorrelationPolicy policy,
                            double clamp_epsilon) {
  if (n < 3) {
    throw NumericalException("FisherZ", "fewer than 3 test trials",
                             static_cast<double>(n));
  }
  if (!std::isfinite(r)) {
    throw NumericalException("FisherZ", "correlation is not finite", r);
  }

  if (policy == CorrelationPolicy::Throw) {
    if (std::abs(r) >= 1.0) {
      throw NumericalException("FisherZ",
                               "transform undefined for |r| >= 1", r);
    }
  } else {
    r = std::clamp(r, -1.0 + clamp_epsilon, 1.0 - clamp_epsilon);
  }

  return 0.5 * std::log((1.0 + r) / (1.0 - r)) *
         std::sqrt(static_cast<double>(n) - 3.0);
}

} // namespace searchlight
} // namespace neurodecode
