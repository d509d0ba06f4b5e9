/**
 * @file FoldDefinition.h
 * @brief Run-based cross-validation folds
 */

#ifndef NEURODECODE_FOLD_DEFINITION_H
#define NEURODECODE_FOLD_DEFINITION_H

#include <string>
#include <vector>

namespace neurodecode {
namespace searchlight {

/**
 * @brief Parallel tables of training and test run groups
 *
 * Run indices are zero-based in memory. Fold files and the printed form use
 * one-based run numbers, as experiment designs are usually written.
 */
class FoldDefinition {
public:
  using RunGroup = std::vector<size_t>;

private:
  std::vector<RunGroup> m_training;
  std::vector<RunGroup> m_test;

public:
  FoldDefinition() = default;

  /// Throws ConfigurationException for unequal tables or empty groups.
  FoldDefinition(std::vector<RunGroup> training, std::vector<RunGroup> test);

  /// Every run is the test set of one fold, the others train.
  static FoldDefinition LeaveOneRunOut(size_t run_count);

  /// Nine runs in three blocks of three, each block held out once.
  static FoldDefinition ThreeBlockDesign();

  /// ThreeBlockDesign for nine runs, LeaveOneRunOut otherwise.
  static FoldDefinition DefaultFor(size_t run_count);

  /**
   * @brief Parse a fold file
   *
   * One fold per line as "training runs : test runs", one-based, separated
   * by whitespace or commas. '#' starts a comment. Throws DataIOException.
   */
  static FoldDefinition ReadFile(const std::string &filename);

  /**
   * @brief Check the folds against a run count
   *
   * Throws ConfigurationException for run numbers out of range, a run
   * repeated within a group, or a run used for training and test in the same
   * fold.
   */
  void Validate(size_t run_count) const;

  size_t GetNumberOfFolds() const { return m_training.size(); }
  const RunGroup &GetTrainingRuns(size_t fold) const {
    return m_training.at(fold);
  }
  const RunGroup &GetTestRuns(size_t fold) const { return m_test.at(fold); }
  bool IsEmpty() const { return m_training.empty(); }

  std::string ToString() const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_FOLD_DEFINITION_H
