/**
 * @file SearchlightAnalysis.cpp
 * @brief Implementation of the searchlight decoding analysis
 */

#include "SearchlightAnalysis.h"
#include "../core/NeuroDecodeExceptions.h"
#include "../core/ThreadPool.h"
#include "../io/MatrixIO.h"
#include "RegressorPreparer.h"
#include "TrialConditioner.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>

namespace neurodecode {
namespace searchlight {

void SearchlightAnalysisParameters::Validate() const {
  if (run_length == 0) {
    throw ConfigurationException("run_length", "0", "positive trial count");
  }
  for (size_t axis = 0; axis < 3; ++axis) {
    if (geometry.dimensions[axis] == 0) {
      throw ConfigurationException("dims", "0", "positive voxel counts");
    }
  }
  if (index_base != 0 && index_base != 1) {
    throw ConfigurationException("index_base", std::to_string(index_base),
                                 "0 or 1");
  }
  if (!(mask_threshold >= 0.0)) {
    throw ConfigurationException("mask_threshold",
                                 std::to_string(mask_threshold),
                                 "non-negative value");
  }
  if (!(degenerate_epsilon >= 0.0)) {
    throw ConfigurationException("degenerate_epsilon",
                                 std::to_string(degenerate_epsilon),
                                 "non-negative value");
  }
  if (!(clamp_epsilon > 0.0 && clamp_epsilon < 1.0)) {
    throw ConfigurationException("clamp_epsilon",
                                 std::to_string(clamp_epsilon),
                                 "value in (0, 1)");
  }
  if (shrinkage_override && !(*shrinkage_override >= 0.0)) {
    throw ConfigurationException("shrinkage_override",
                                 std::to_string(*shrinkage_override),
                                 "non-negative value");
  }
  if (batch_size == 0) {
    throw ConfigurationException("batch_size", "0", "positive count");
  }
  if (progress_interval == 0) {
    throw ConfigurationException("progress_interval", "0", "positive count");
  }
}

// ===== SearchlightAnalysis Implementation =====

SearchlightAnalysis::SearchlightAnalysis()
    : SearchlightAnalysis(SearchlightAnalysisParameters()) {}

SearchlightAnalysis::SearchlightAnalysis(
    const SearchlightAnalysisParameters &params)
    : m_params(params) {
  m_params.Validate();
}

void SearchlightAnalysis::SetTrialData(const Matrix &activity,
                                       const Matrix &regressors) {
  m_activity = activity;
  m_regressors = regressors;
  m_has_trial_data = true;
  m_engine.reset();
}

void SearchlightAnalysis::SetTrialMask(const Matrix &mask) {
  m_trial_mask = mask;
  m_engine.reset();
}

void SearchlightAnalysis::SetNuisanceRegressors(const Matrix &nuisance) {
  m_nuisance = nuisance;
  m_engine.reset();
}

void SearchlightAnalysis::SetFolds(const FoldDefinition &folds) {
  m_folds = folds;
  m_engine.reset();
}

void SearchlightAnalysis::SetLocationMask(const io::LocationMask &mask) {
  m_location_mask = std::make_unique<io::LocationMask>(mask);
}

void SearchlightAnalysis::PrepareData() {
  m_timer = ProcessingTimer();
  m_summary = AnalysisSummary();
  m_engine.reset();

  if (!m_has_trial_data) {
    throw ConfigurationException("trial data", "unset",
                                 "activity and regressors before preparation");
  }
  if (m_regressors.rows() != m_activity.rows()) {
    throw ShapeMismatchException("SearchlightAnalysis", "regressor rows",
                                 m_activity.rows(), m_regressors.rows());
  }
  if (m_nuisance && m_nuisance->rows() != m_activity.rows()) {
    throw ShapeMismatchException("SearchlightAnalysis", "nuisance rows",
                                 m_activity.rows(), m_nuisance->rows());
  }

  m_timer.BeginStage("conditioning");

  const RunLayout unmasked =
      RunLayout::FromTrialCount(m_activity.rows(), m_params.run_length);
  if (m_trial_mask) {
    m_layout = std::make_unique<RunLayout>(
        m_params.run_length, unmasked.GetRunCount(),
        RunLayout::ExclusionFromMatrix(*m_trial_mask, m_params.run_length,
                                       unmasked.GetRunCount()));
  } else {
    m_layout = std::make_unique<RunLayout>(unmasked);
  }

  TrialConditioner conditioner(*m_layout);
  m_conditioned_activity = conditioner.Condition(m_activity);

  m_timer.BeginStage("regressor preparation");

  RegressorPreparer preparer(*m_layout);
  if (m_nuisance) {
    preparer.SetNuisanceRegressors(*m_nuisance);
  }
  RunBlocks regressor_blocks =
      preparer.Prepare(m_regressors, m_conditioned_activity);

  const FoldDefinition folds = m_folds.IsEmpty()
                                   ? FoldDefinition::DefaultFor(
                                         m_layout->GetRunCount())
                                   : m_folds;

  RidgeOptions options;
  options.correlation_policy = m_params.correlation_policy;
  options.clamp_epsilon = m_params.clamp_epsilon;
  options.shrinkage_override = m_params.shrinkage_override;

  m_engine = std::make_unique<RidgeEngine>(std::move(regressor_blocks), folds,
                                           options);
  m_timer.EndStage();

  m_summary.run_count = m_layout->GetRunCount();
  m_summary.fold_count = folds.GetNumberOfFolds();
  m_summary.variable_count = m_engine->GetNumberOfVariables();
  for (size_t run = 0; run < m_layout->GetRunCount(); ++run) {
    m_summary.retained_trials += m_layout->GetRetainedCount(run);
    m_summary.excluded_trials += m_layout->GetExcludedCount(run);
  }

  if (m_params.verbose) {
    std::cout << "Prepared " << m_summary.run_count << " runs of "
              << m_params.run_length << " trials ("
              << m_summary.excluded_trials << " excluded), "
              << m_activity.cols() << " locations, "
              << m_summary.variable_count << " variables" << std::endl;
    std::cout << "Folds: " << folds.ToString() << std::endl;
    if (m_nuisance) {
      std::cout << "Nuisance regression with " << m_nuisance->cols()
                << " regressors" << std::endl;
    }
  }
}

SearchlightEnumerator SearchlightAnalysis::CreateEnumerator(
    const std::vector<int32_t> &location_table) const {
  EnumeratorOptions options;
  options.degenerate_epsilon = m_params.degenerate_epsilon;

  SearchlightEnumerator enumerator(m_conditioned_activity, location_table,
                                   m_params.index_base, options);

  if (m_location_mask) {
    // Every center must be addressable before the sweep starts
    for (int32_t location_id : location_table) {
      const int64_t linear =
          static_cast<int64_t>(location_id) - m_params.index_base;
      if (linear < 0 ||
          static_cast<size_t>(linear) >=
              m_location_mask->GetNumberOfLocations()) {
        throw ShapeMismatchException(
            "SearchlightAnalysis", "location identifier against mask",
            m_location_mask->GetNumberOfLocations(),
            static_cast<size_t>(std::max<int64_t>(linear, 0)));
      }
    }
    enumerator.SetLocationMask(m_location_mask.get());
  }

  return enumerator;
}

void SearchlightAnalysis::Evaluate(const SearchlightFeatures &features,
                                   AccuracyAggregator &aggregator) const {
  if (features.IsDegenerate()) {
    aggregator.AddZero(features.sequence, features.location_id);
    return;
  }
  aggregator.Add(features.sequence, features.location_id,
                 m_engine->Evaluate(features.run_features));
}

AccuracyResult SearchlightAnalysis::Run(io::SearchlightStreamReader &reader) {
  if (!IsPrepared()) {
    PrepareData();
  }

  SearchlightEnumerator enumerator = CreateEnumerator(reader.GetLocationTable());
  AccuracyAggregator aggregator(m_engine->GetNumberOfVariables());

  if (m_params.num_threads != 1) {
    m_timer.BeginStage("stream decoding");
    const std::vector<io::SearchlightRecord> records = reader.ReadAll();
    m_timer.EndStage();

    if (m_params.verbose) {
      std::cout << "Decoded " << records.size() << " searchlights from "
                << reader.GetFilename() << std::endl;
    }
    RunParallel(enumerator, records, aggregator);
    return FinishRun(aggregator);
  }

  m_timer.BeginStage("searchlight sweep");

  // Stream length is unknown until the end, so progress reports total 0
  const EnumerationStats stats = enumerator.Enumerate(
      reader, [this, &aggregator](const SearchlightFeatures &features) {
        Evaluate(features, aggregator);
        const size_t done = aggregator.GetNumberOfEntries();
        if (done % m_params.progress_interval == 0) {
          ReportProgress(done, 0, "searchlight sweep");
        }
      });

  m_summary.records_read = stats.records_read;
  m_summary.masked_out = stats.masked_out;
  m_summary.degenerate = stats.degenerate;
  m_summary.evaluated = stats.assembled - stats.degenerate;

  return FinishRun(aggregator);
}

AccuracyResult
SearchlightAnalysis::Run(const std::vector<int32_t> &location_table,
                         const std::vector<io::SearchlightRecord> &records) {
  if (!IsPrepared()) {
    PrepareData();
  }

  SearchlightEnumerator enumerator = CreateEnumerator(location_table);
  AccuracyAggregator aggregator(m_engine->GetNumberOfVariables());

  if (m_params.num_threads == 1) {
    RunSequential(enumerator, records, aggregator);
  } else {
    RunParallel(enumerator, records, aggregator);
  }
  return FinishRun(aggregator);
}

void SearchlightAnalysis::RunSequential(
    const SearchlightEnumerator &enumerator,
    const std::vector<io::SearchlightRecord> &records,
    AccuracyAggregator &aggregator) {
  m_timer.BeginStage("searchlight sweep");

  m_summary.records_read = records.size();
  for (size_t i = 0; i < records.size(); ++i) {
    std::optional<SearchlightFeatures> features =
        enumerator.Assemble(records[i], i);
    if (!features) {
      ++m_summary.masked_out;
    } else {
      if (features->IsDegenerate()) {
        ++m_summary.degenerate;
      } else {
        ++m_summary.evaluated;
      }
      Evaluate(*features, aggregator);
    }

    if ((i + 1) % m_params.progress_interval == 0) {
      ReportProgress(i + 1, records.size(), "searchlight sweep");
    }
  }
}

void SearchlightAnalysis::RunParallel(
    const SearchlightEnumerator &enumerator,
    const std::vector<io::SearchlightRecord> &records,
    AccuracyAggregator &aggregator) {
  m_timer.BeginStage("searchlight sweep");

  const size_t total = records.size();
  const size_t batch_size = m_params.batch_size;

  std::atomic<size_t> masked_out(0);
  std::atomic<size_t> degenerate(0);
  std::atomic<size_t> evaluated(0);
  std::atomic<bool> failed(false);

  // Declared last so that workers are joined before the counters go away
  ThreadPool pool(m_params.num_threads);

  if (m_params.verbose) {
    std::cout << "Evaluating " << total << " searchlights on "
              << pool.GetNumThreads() << " threads" << std::endl;
  }

  std::vector<std::future<void>> futures;
  for (size_t begin = 0; begin < total; begin += batch_size) {
    const size_t end = std::min(total, begin + batch_size);
    futures.push_back(pool.Enqueue([&, begin, end]() {
      for (size_t i = begin; i < end && !failed; ++i) {
        try {
          std::optional<SearchlightFeatures> features =
              enumerator.Assemble(records[i], i);
          if (!features) {
            ++masked_out;
            continue;
          }
          if (features->IsDegenerate()) {
            ++degenerate;
          } else {
            ++evaluated;
          }
          Evaluate(*features, aggregator);
        } catch (...) {
          failed = true;
          throw;
        }
      }
    }));
  }

  size_t completed = 0;
  size_t next_report = m_params.progress_interval;
  for (size_t batch = 0; batch < futures.size(); ++batch) {
    futures[batch].get();
    completed = std::min(total, (batch + 1) * batch_size);
    if (completed >= next_report || completed == total) {
      ReportProgress(completed, total, "searchlight sweep");
      next_report = completed + m_params.progress_interval;
    }
  }

  m_summary.records_read = total;
  m_summary.masked_out = masked_out;
  m_summary.degenerate = degenerate;
  m_summary.evaluated = evaluated;
}

AccuracyResult
SearchlightAnalysis::FinishRun(const AccuracyAggregator &aggregator) {
  m_timer.BeginStage("sorting");
  AccuracyResult result = aggregator.Finalize();
  m_timer.EndStage();

  m_summary.total_processing_time_ms = m_timer.TotalMilliseconds();
  ReportProgress(m_summary.records_read, m_summary.records_read, "complete");

  if (m_params.verbose) {
    LogProcessingStats();
  }
  return result;
}

void SearchlightAnalysis::SaveResult(const AccuracyResult &result,
                                     const std::string &filename) {
  const unsigned count =
      static_cast<unsigned>(result.GetNumberOfSearchlights());

  Matrix permutation(1, count);
  Matrix location_ids(1, count);
  for (unsigned i = 0; i < count; ++i) {
    permutation(0, i) = static_cast<double>(result.permutation[i]);
    location_ids(0, i) = static_cast<double>(result.location_ids[i]);
  }

  io::MatrixFileWriter writer;
  writer.AddRecord("accuracy", result.accuracy);
  writer.AddRecord("voxelIdx", permutation);
  writer.AddRecord("locationIds", location_ids);
  writer.Write(filename);
}

void SearchlightAnalysis::ReportProgress(size_t current, size_t total,
                                         const std::string &stage) {
  if (m_progress_callback) {
    m_progress_callback(current, total, stage);
  }

  if (m_params.verbose && stage != "complete") {
    std::cout << "[" << stage << "] " << current;
    if (total > 0) {
      std::cout << "/" << total;
    }
    std::cout << " searchlights" << std::endl;
  }
}

void SearchlightAnalysis::LogProcessingStats() const {
  std::cout << "Searchlights read: " << m_summary.records_read << std::endl;
  std::cout << "Masked out: " << m_summary.masked_out << std::endl;
  std::cout << "Without usable features: " << m_summary.degenerate
            << std::endl;
  std::cout << "Evaluated: " << m_summary.evaluated << std::endl;
  m_timer.PrintSummary(std::cout);
}

} // namespace searchlight
} // namespace neurodecode
