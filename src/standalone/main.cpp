/**
 * @file main.cpp
 * @brief Command line searchlight decoding tool
 *
 * Reads trial-wise activity and model variables, sweeps a searchlight
 * definition file and writes the cross-validated decoding statistic of every
 * searchlight.
 */

#include "../core/NeuroDecodeExceptions.h"
#include "../io/MatrixIO.h"
#include "../io/SearchlightStream.h"
#include "../io/VolumeIO.h"
#include "../searchlight/SearchlightAnalysis.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace neurodecode;
using namespace neurodecode::searchlight;

namespace {

struct CommandLineOptions {
  std::string activity_file;
  std::string regressor_file;
  std::string searchlight_file;
  std::string output_file;

  std::string trial_mask_file;
  std::string nuisance_file;
  std::string folds_file;
  bool leave_one_run_out = false;
  std::string location_mask_file;
  std::string features_name = "features";
  std::string maps_prefix;

  SearchlightAnalysisParameters params;
};

void printUsage(const char *program_name) {
  std::cout << "Usage: " << program_name
            << " <activity.ndm> <regressors> <searchlights.bin> <output.ndm>"
               " [options]\n";
  std::cout << "\nArguments:\n";
  std::cout << "  activity      : Trial x location activity (record file or "
               "text)\n";
  std::cout << "  regressors    : Trial x variable model estimates\n";
  std::cout << "  searchlights  : Binary searchlight definition stream\n";
  std::cout << "  output        : Result record file (accuracy, voxelIdx, "
               "locationIds)\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --trial-mask <file>          : Trials to exclude (nonzero = "
               "excluded)\n";
  std::cout << "  --nuisance <file>            : Nuisance regressors to "
               "project out\n";
  std::cout << "  --folds <file>               : Fold table, lines of "
               "'train runs : test runs'\n";
  std::cout << "  --loro                       : Leave-one-run-out folds\n";
  std::cout << "  --location-mask <file>       : Raw float32 or image mask of "
               "searchlight centers\n";
  std::cout << "  --mask-threshold <value>     : Inclusion threshold (default: "
               "0.5)\n";
  std::cout << "  --run-length <trials>        : Trials per run (default: 50)\n";
  std::cout << "  --dims <x> <y> <z>           : Volume size (default: 53 63 "
               "46)\n";
  std::cout << "  --index-base <0|1>           : Base of stored positions "
               "(default: 1)\n";
  std::cout << "  --features-name <name>       : Activity record name "
               "(default: features)\n";
  std::cout << "  --threads <num>              : Worker threads, 0 = auto "
               "(default: 1)\n";
  std::cout << "  --correlation-policy <name>  : clamp or throw (default: "
               "clamp)\n";
  std::cout << "  --shrinkage <k>              : Fixed ridge factor instead of "
               "the empirical one\n";
  std::cout << "  --maps <prefix>              : Also write one volume per "
               "variable\n";
  std::cout << "  --verbose                    : Verbose output\n";
}

double parseDouble(const std::string &name, const std::string &value) {
  try {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception &) {
    // reported below
  }
  throw ConfigurationException(name, value, "number");
}

long parseInteger(const std::string &name, const std::string &value) {
  try {
    size_t consumed = 0;
    long parsed = std::stol(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception &) {
    // reported below
  }
  throw ConfigurationException(name, value, "integer");
}

size_t parseCount(const std::string &name, const std::string &value) {
  long parsed = parseInteger(name, value);
  if (parsed < 0) {
    throw ConfigurationException(name, value, "non-negative integer");
  }
  return static_cast<size_t>(parsed);
}

CommandLineOptions parseArguments(int argc, char *argv[]) {
  CommandLineOptions options;
  options.activity_file = argv[1];
  options.regressor_file = argv[2];
  options.searchlight_file = argv[3];
  options.output_file = argv[4];
  options.params.verbose = false;

  for (int i = 5; i < argc; ++i) {
    std::string arg = argv[i];

    auto next = [&](const std::string &what) -> std::string {
      if (i + 1 >= argc) {
        throw ConfigurationException(arg, "", what);
      }
      return argv[++i];
    };

    if (arg == "--trial-mask") {
      options.trial_mask_file = next("file name");
    } else if (arg == "--nuisance") {
      options.nuisance_file = next("file name");
    } else if (arg == "--folds") {
      options.folds_file = next("file name");
    } else if (arg == "--loro") {
      options.leave_one_run_out = true;
    } else if (arg == "--location-mask") {
      options.location_mask_file = next("file name");
    } else if (arg == "--mask-threshold") {
      options.params.mask_threshold = parseDouble(arg, next("number"));
    } else if (arg == "--run-length") {
      options.params.run_length = parseCount(arg, next("trial count"));
    } else if (arg == "--dims") {
      for (size_t axis = 0; axis < 3; ++axis) {
        options.params.geometry.dimensions[axis] =
            parseCount(arg, next("three voxel counts"));
      }
    } else if (arg == "--index-base") {
      options.params.index_base =
          static_cast<int>(parseInteger(arg, next("0 or 1")));
    } else if (arg == "--features-name") {
      options.features_name = next("record name");
    } else if (arg == "--threads") {
      options.params.num_threads = parseCount(arg, next("thread count"));
    } else if (arg == "--correlation-policy") {
      options.params.correlation_policy =
          ParseCorrelationPolicy(next("clamp or throw"));
    } else if (arg == "--shrinkage") {
      options.params.shrinkage_override = parseDouble(arg, next("number"));
    } else if (arg == "--maps") {
      options.maps_prefix = next("output prefix");
    } else if (arg == "--verbose") {
      options.params.verbose = true;
    } else {
      throw ConfigurationException("argument", arg, "known option");
    }
  }

  if (options.leave_one_run_out && !options.folds_file.empty()) {
    throw ConfigurationException("--loro", "set together with --folds",
                                 "only one fold source");
  }

  options.params.Validate();
  return options;
}

void printResultSummary(const AccuracyResult &result,
                        const AnalysisSummary &summary) {
  std::cout << "\n=== Searchlight Decoding Summary ===" << std::endl;
  std::cout << "Runs: " << summary.run_count << " (" << summary.retained_trials
            << " trials kept, " << summary.excluded_trials << " excluded)"
            << std::endl;
  std::cout << "Folds: " << summary.fold_count << std::endl;
  std::cout << "Searchlights in output: " << result.GetNumberOfSearchlights()
            << std::endl;
  std::cout << "Masked out: " << summary.masked_out << std::endl;
  std::cout << "Without usable features: " << summary.degenerate << std::endl;

  for (unsigned v = 0; v < result.accuracy.rows(); ++v) {
    if (result.accuracy.cols() == 0) {
      break;
    }
    const auto row = result.accuracy.get_row(v);
    std::cout << "Variable " << (v + 1) << ": mean z " << std::fixed
              << std::setprecision(3) << row.mean() << ", max z "
              << row.max_value() << std::endl;
  }
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << summary.total_processing_time_ms / 1000.0 << " seconds"
            << std::endl;
  std::cout << "====================================" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 5) {
    printUsage(argv[0]);
    return 1;
  }

  try {
    CommandLineOptions options = parseArguments(argc, argv);
    SearchlightAnalysisParameters &params = options.params;

    std::cout << "NeuroDecode Searchlight Analysis" << std::endl;
    std::cout << "================================" << std::endl;
    std::cout << "Activity: " << options.activity_file << std::endl;
    std::cout << "Regressors: " << options.regressor_file << std::endl;
    std::cout << "Searchlights: " << options.searchlight_file << std::endl;
    std::cout << "Output: " << options.output_file << std::endl;
    std::cout << std::endl;

    auto start_time = std::chrono::high_resolution_clock::now();

    const io::Matrix activity = io::MatrixFileReader::ReadMatrix(
        options.activity_file, options.features_name);
    const io::Matrix regressors =
        io::MatrixFileReader::ReadMatrix(options.regressor_file);

    std::unique_ptr<io::LocationMask> location_mask;
    if (!options.location_mask_file.empty()) {
      location_mask = std::make_unique<io::LocationMask>(io::LocationMask::Read(
          options.location_mask_file, params.geometry, params.mask_threshold));
      // Image masks carry their own geometry
      params.geometry = location_mask->GetGeometry();
      std::cout << "Location mask: " << location_mask->CountIncluded() << " of "
                << location_mask->GetNumberOfLocations()
                << " locations included" << std::endl;
    }

    SearchlightAnalysis analysis(params);
    analysis.SetTrialData(activity, regressors);

    if (!options.trial_mask_file.empty()) {
      analysis.SetTrialMask(
          io::MatrixFileReader::ReadMatrix(options.trial_mask_file));
    }
    if (!options.nuisance_file.empty()) {
      analysis.SetNuisanceRegressors(
          io::MatrixFileReader::ReadMatrix(options.nuisance_file));
    }
    if (!options.folds_file.empty()) {
      analysis.SetFolds(FoldDefinition::ReadFile(options.folds_file));
    } else if (options.leave_one_run_out) {
      const RunLayout layout =
          RunLayout::FromTrialCount(activity.rows(), params.run_length);
      analysis.SetFolds(FoldDefinition::LeaveOneRunOut(layout.GetRunCount()));
    }
    if (location_mask) {
      analysis.SetLocationMask(*location_mask);
    }

    if (!params.verbose) {
      analysis.SetProgressCallback(
          [](size_t current, size_t total, const std::string &stage) {
            if (stage == "complete") {
              return;
            }
            std::cout << "[" << stage << "] " << current;
            if (total > 0) {
              std::cout << "/" << total;
            }
            std::cout << std::endl;
          });
    }

    analysis.PrepareData();

    io::SearchlightStreamReader reader(options.searchlight_file,
                                       params.index_base);
    const AccuracyResult result = analysis.Run(reader);

    SearchlightAnalysis::SaveResult(result, options.output_file);
    std::cout << "Results saved to: " << options.output_file << std::endl;

    if (!options.maps_prefix.empty()) {
      io::AccuracyMapWriter map_writer(params.geometry, params.index_base);
      for (const auto &filename : map_writer.WriteMaps(
               options.maps_prefix, result.accuracy, result.location_ids)) {
        std::cout << "Accuracy map: " << filename << std::endl;
      }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration<double>(end_time - start_time);

    printResultSummary(result, analysis.GetSummary());
    std::cout << "Wall time: " << std::fixed << std::setprecision(2)
              << duration.count() << " seconds" << std::endl;

  } catch (const NeuroDecodeException &e) {
    std::cerr << e.GetFormattedReport() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
