/**
 * @file SearchlightAnalysis.h
 * @brief Searchlight decoding analysis: conditioning, enumeration and scoring
 *
 * The analysis conditions the trial-wise inputs once, then sweeps the
 * searchlight stream and scores every searchlight with the cross-validated
 * ridge engine. The result is a variables x searchlights matrix of mean
 * Fisher z statistics ordered by center location.
 */

#ifndef NEURODECODE_SEARCHLIGHT_ANALYSIS_H
#define NEURODECODE_SEARCHLIGHT_ANALYSIS_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/ProcessingTimer.h"
#include "../io/SearchlightStream.h"
#include "../io/VolumeIO.h"
#include "AccuracyAggregator.h"
#include "FoldDefinition.h"
#include "LinearAlgebra.h"
#include "RidgeEngine.h"
#include "RunLayout.h"
#include "SearchlightEnumerator.h"

namespace neurodecode {
namespace searchlight {

/**
 * @brief Searchlight analysis configuration parameters
 */
struct SearchlightAnalysisParameters {
  // Trial layout
  size_t run_length = 50; // Trials per run

  // Location addressing
  io::VolumeGeometry geometry; // Volume the location identifiers index into
  int index_base = 1;          // Base of stream positions and location ids
  double mask_threshold = 0.5; // Centers below this mask value are skipped

  // Model
  double degenerate_epsilon = 1e-3; // Pooled |x| sum below which columns drop
  CorrelationPolicy correlation_policy = CorrelationPolicy::Clamp;
  double clamp_epsilon = 1e-7;
  std::optional<double> shrinkage_override; // Unset = empirical estimate

  // Performance parameters
  size_t num_threads = 1;   // 0 = auto-detect, 1 = interleaved sequential
  size_t batch_size = 64;   // Searchlights per worker task

  // Output options
  size_t progress_interval = 1000; // Searchlights between progress reports
  bool verbose = true;             // Verbose output

  /// Throws ConfigurationException on the first invalid field.
  void Validate() const;
};

/**
 * @brief Counters and timing of one analysis run
 */
struct AnalysisSummary {
  size_t run_count = 0;
  size_t retained_trials = 0;
  size_t excluded_trials = 0;
  size_t fold_count = 0;
  size_t variable_count = 0;

  size_t records_read = 0;
  size_t masked_out = 0;
  size_t degenerate = 0;
  size_t evaluated = 0; // searchlights scored by the ridge engine

  double total_processing_time_ms = 0.0;
};

/**
 * @brief Progress callback, invoked from the calling thread
 */
using AnalysisProgressCallback = std::function<void(
    size_t current, size_t total, const std::string &stage)>;

class SearchlightAnalysis {
private:
  SearchlightAnalysisParameters m_params;
  AnalysisProgressCallback m_progress_callback;

  // Inputs
  Matrix m_activity;
  Matrix m_regressors;
  std::optional<Matrix> m_trial_mask;
  std::optional<Matrix> m_nuisance;
  FoldDefinition m_folds;
  std::unique_ptr<io::LocationMask> m_location_mask;
  bool m_has_trial_data = false;

  // Prepared state, shared read-only by all searchlights
  std::unique_ptr<RunLayout> m_layout;
  RunBlocks m_conditioned_activity;
  std::unique_ptr<RidgeEngine> m_engine;

  AnalysisSummary m_summary;
  ProcessingTimer m_timer;

public:
  SearchlightAnalysis();
  explicit SearchlightAnalysis(const SearchlightAnalysisParameters &params);
  ~SearchlightAnalysis() = default;

  // Configuration
  const SearchlightAnalysisParameters &GetParameters() const {
    return m_params;
  }
  void SetProgressCallback(const AnalysisProgressCallback &callback) {
    m_progress_callback = callback;
  }

  /**
   * @param activity trials x lookup-table positions
   * @param regressors trials x decoded variables
   */
  void SetTrialData(const Matrix &activity, const Matrix &regressors);

  /// run_length x run_count (one column per run) or a flat vector;
  /// nonzero entries exclude a trial.
  void SetTrialMask(const Matrix &mask);

  void SetNuisanceRegressors(const Matrix &nuisance);

  /// Empty folds select FoldDefinition::DefaultFor(run count).
  void SetFolds(const FoldDefinition &folds);

  void SetLocationMask(const io::LocationMask &mask);

  /**
   * @brief Condition activity and regressors and build the ridge engine
   *
   * Every shape and configuration check happens here, before any searchlight
   * is touched. Called by Run when needed.
   */
  void PrepareData();
  bool IsPrepared() const { return m_engine != nullptr; }

  /// Sweep the remaining stream. No partial result survives an exception.
  AccuracyResult Run(io::SearchlightStreamReader &reader);

  /// Sweep searchlights that were decoded beforehand.
  AccuracyResult Run(const std::vector<int32_t> &location_table,
                     const std::vector<io::SearchlightRecord> &records);

  /**
   * @brief Write accuracy, voxelIdx and locationIds records
   *
   * voxelIdx holds the zero-based enumeration position of every column.
   */
  static void SaveResult(const AccuracyResult &result,
                         const std::string &filename);

  // Results access
  const AnalysisSummary &GetSummary() const { return m_summary; }
  const ProcessingTimer &GetTimer() const { return m_timer; }
  const RunLayout *GetLayout() const { return m_layout.get(); }
  const RunBlocks &GetConditionedActivity() const {
    return m_conditioned_activity;
  }
  const RidgeEngine *GetEngine() const { return m_engine.get(); }

private:
  SearchlightEnumerator
  CreateEnumerator(const std::vector<int32_t> &location_table) const;
  void Evaluate(const SearchlightFeatures &features,
                AccuracyAggregator &aggregator) const;
  void RunSequential(const SearchlightEnumerator &enumerator,
                     const std::vector<io::SearchlightRecord> &records,
                     AccuracyAggregator &aggregator);
  void RunParallel(const SearchlightEnumerator &enumerator,
                   const std::vector<io::SearchlightRecord> &records,
                   AccuracyAggregator &aggregator);
  AccuracyResult FinishRun(const AccuracyAggregator &aggregator);
  void ReportProgress(size_t current, size_t total, const std::string &stage);
  void LogProcessingStats() const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_SEARCHLIGHT_ANALYSIS_H
