/**
 * @file RunLayout.cpp
 * @brief Implementation of run partitioning and trial exclusion
 */

#include "RunLayout.h"
#include "../core/NeuroDecodeExceptions.h"

namespace neurodecode {
namespace searchlight {

RunLayout::RunLayout(size_t run_length, size_t run_count)
    : RunLayout(run_length, run_count,
                std::vector<bool>(run_length * run_count, false)) {}

RunLayout::RunLayout(size_t run_length, size_t run_count,
                     std::vector<bool> excluded)
    : m_run_length(run_length), m_run_count(run_count),
      m_excluded(std::move(excluded)) {
  if (m_run_length == 0) {
    throw ConfigurationException("run_length", "0", "positive integer");
  }
  if (m_run_count == 0) {
    throw ConfigurationException("run_count", "0", "positive integer");
  }
  if (m_excluded.size() != GetTotalTrials()) {
    throw ShapeMismatchException("RunLayout", "trial mask size",
                                 GetTotalTrials(), m_excluded.size());
  }
}

RunLayout RunLayout::FromTrialCount(size_t total_trials, size_t run_length) {
  if (run_length == 0) {
    throw ConfigurationException("run_length", "0", "positive integer");
  }
  if (total_trials == 0 || total_trials % run_length != 0) {
    throw ConfigurationException(
        "run_length", std::to_string(run_length),
        "a divisor of the trial count " + std::to_string(total_trials));
  }
  return RunLayout(run_length, total_trials / run_length);
}

std::vector<bool> RunLayout::ExclusionFromMatrix(const Matrix &mask,
                                                 size_t run_length,
                                                 size_t run_count) {
  const size_t total = run_length * run_count;
  std::vector<bool> excluded(total, false);

  if (mask.rows() == run_length && mask.cols() == run_count) {
    for (size_t run = 0; run < run_count; ++run) {
      for (size_t trial = 0; trial < run_length; ++trial) {
        excluded[run * run_length + trial] =
            mask(static_cast<unsigned>(trial), static_cast<unsigned>(run)) !=
            0.0;
      }
    }
    return excluded;
  }

  const size_t count = static_cast<size_t>(mask.rows()) * mask.cols();
  if ((mask.rows() == 1 || mask.cols() == 1) && count == total) {
    const double *values = mask.data_block();
    for (size_t i = 0; i < total; ++i) {
      excluded[i] = values[i] != 0.0;
    }
    return excluded;
  }

  throw ShapeMismatchException("RunLayout", "trial mask size", total, count);
}

bool RunLayout::IsExcluded(size_t run, size_t trial) const {
  if (run >= m_run_count || trial >= m_run_length) {
    throw ShapeMismatchException("RunLayout", "trial address",
                                 GetTotalTrials(), run * m_run_length + trial);
  }
  return m_excluded[run * m_run_length + trial];
}

size_t RunLayout::GetRetainedCount(size_t run) const {
  return m_run_length - GetExcludedCount(run);
}

size_t RunLayout::GetExcludedCount(size_t run) const {
  size_t count = 0;
  for (size_t trial = 0; trial < m_run_length; ++trial) {
    if (IsExcluded(run, trial)) {
      ++count;
    }
  }
  return count;
}

std::vector<unsigned> RunLayout::RetainedTrials(size_t run) const {
  std::vector<unsigned> retained;
  retained.reserve(m_run_length);
  for (size_t trial = 0; trial < m_run_length; ++trial) {
    if (!IsExcluded(run, trial)) {
      retained.push_back(static_cast<unsigned>(trial));
    }
  }
  return retained;
}

RunBlocks RunLayout::SplitRuns(const Matrix &trialwise,
                               const std::string &what) const {
  if (trialwise.rows() != GetTotalTrials()) {
    throw ShapeMismatchException("RunLayout", what + " row count",
                                 GetTotalTrials(), trialwise.rows());
  }

  RunBlocks blocks;
  blocks.reserve(m_run_count);

  for (size_t run = 0; run < m_run_count; ++run) {
    std::vector<unsigned> rows = RetainedTrials(run);
    for (auto &row : rows) {
      row += static_cast<unsigned>(run * m_run_length);
    }
    blocks.push_back(SelectRows(trialwise, rows));
  }

  return blocks;
}

} // namespace searchlight
} // namespace neurodecode
