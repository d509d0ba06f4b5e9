/**
 * @file FoldDefinition.cpp
 * @brief Implementation of fold construction, parsing and validation
 */

#include "FoldDefinition.h"
#include "../core/NeuroDecodeExceptions.h"
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace neurodecode {
namespace searchlight {

namespace {

std::string GroupToString(const FoldDefinition::RunGroup &group) {
  std::stringstream ss;
  for (size_t i = 0; i < group.size(); ++i) {
    ss << (i ? " " : "") << group[i] + 1;
  }
  return ss.str();
}

FoldDefinition::RunGroup ParseGroup(const std::string &text,
                                    const std::string &filename,
                                    size_t line_number) {
  std::string cleaned = text;
  for (char &c : cleaned) {
    if (c == ',') {
      c = ' ';
    }
  }

  FoldDefinition::RunGroup group;
  std::istringstream tokens(cleaned);
  std::string token;
  while (tokens >> token) {
    char *end = nullptr;
    long run = std::strtol(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0' || run < 1) {
      throw DataIOException(filename, "parse",
                            "invalid run number '" + token + "' on line " +
                                std::to_string(line_number));
    }
    group.push_back(static_cast<size_t>(run - 1));
  }
  return group;
}

} // namespace

FoldDefinition::FoldDefinition(std::vector<RunGroup> training,
                               std::vector<RunGroup> test)
    : m_training(std::move(training)), m_test(std::move(test)) {
  if (m_training.size() != m_test.size()) {
    throw ConfigurationException(
        "folds", std::to_string(m_training.size()) + " training rows",
        std::to_string(m_test.size()) + " rows to match the test table");
  }
  if (m_training.empty()) {
    throw ConfigurationException("folds", "0 folds", "at least one fold");
  }
  for (size_t f = 0; f < m_training.size(); ++f) {
    if (m_training[f].empty() || m_test[f].empty()) {
      throw ConfigurationException("folds", "fold " + std::to_string(f + 1),
                                   "non-empty training and test groups");
    }
  }
}

FoldDefinition FoldDefinition::LeaveOneRunOut(size_t run_count) {
  if (run_count < 2) {
    throw ConfigurationException("run_count", std::to_string(run_count),
                                 "at least 2 runs for cross-validation");
  }

  std::vector<RunGroup> training;
  std::vector<RunGroup> test;
  for (size_t held_out = 0; held_out < run_count; ++held_out) {
    RunGroup train_runs;
    for (size_t run = 0; run < run_count; ++run) {
      if (run != held_out) {
        train_runs.push_back(run);
      }
    }
    training.push_back(train_runs);
    test.push_back({held_out});
  }
  return FoldDefinition(std::move(training), std::move(test));
}

FoldDefinition FoldDefinition::ThreeBlockDesign() {
  return FoldDefinition({{0, 1, 2, 3, 4, 5}, {0, 1, 2, 6, 7, 8},
                         {3, 4, 5, 6, 7, 8}},
                        {{6, 7, 8}, {3, 4, 5}, {0, 1, 2}});
}

FoldDefinition FoldDefinition::DefaultFor(size_t run_count) {
  if (run_count == 9) {
    return ThreeBlockDesign();
  }
  return LeaveOneRunOut(run_count);
}

FoldDefinition FoldDefinition::ReadFile(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw DataIOException(filename, "open", "cannot open fold file");
  }

  std::vector<RunGroup> training;
  std::vector<RunGroup> test;
  std::string line;
  size_t line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;

    size_t comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    size_t separator = line.find(':');
    if (separator == std::string::npos ||
        line.find(':', separator + 1) != std::string::npos) {
      throw DataIOException(filename, "parse",
                            "expected 'training : test' on line " +
                                std::to_string(line_number));
    }

    training.push_back(
        ParseGroup(line.substr(0, separator), filename, line_number));
    test.push_back(ParseGroup(line.substr(separator + 1), filename,
                              line_number));
  }

  if (file.bad()) {
    throw DataIOException(filename, "read", "stream error");
  }

  return FoldDefinition(std::move(training), std::move(test));
}

void FoldDefinition::Validate(size_t run_count) const {
  if (IsEmpty()) {
    throw ConfigurationException("folds", "0 folds", "at least one fold");
  }

  for (size_t f = 0; f < m_training.size(); ++f) {
    std::set<size_t> training_runs;
    for (size_t run : m_training[f]) {
      if (run >= run_count) {
        throw ConfigurationException(
            "folds", "training run " + std::to_string(run + 1),
            "run number between 1 and " + std::to_string(run_count));
      }
      if (!training_runs.insert(run).second) {
        throw ConfigurationException(
            "folds", "training run " + std::to_string(run + 1),
            "each run once per group (fold " + std::to_string(f + 1) + ")");
      }
    }

    std::set<size_t> test_runs;
    for (size_t run : m_test[f]) {
      if (run >= run_count) {
        throw ConfigurationException(
            "folds", "test run " + std::to_string(run + 1),
            "run number between 1 and " + std::to_string(run_count));
      }
      if (!test_runs.insert(run).second) {
        throw ConfigurationException(
            "folds", "test run " + std::to_string(run + 1),
            "each run once per group (fold " + std::to_string(f + 1) + ")");
      }
      if (training_runs.count(run) != 0) {
        throw ConfigurationException(
            "folds", "run " + std::to_string(run + 1),
            "disjoint training and test runs (fold " +
                std::to_string(f + 1) + ")");
      }
    }
  }
}

std::string FoldDefinition::ToString() const {
  std::stringstream ss;
  for (size_t f = 0; f < m_training.size(); ++f) {
    ss << GroupToString(m_training[f]) << " : " << GroupToString(m_test[f])
       << std::endl;
  }
  return ss.str();
}

} // namespace searchlight
} // namespace neurodecode
