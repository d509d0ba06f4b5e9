/**
 * @file AccuracyAggregator.h
 * @brief Thread-safe collection of per-searchlight statistics
 */

#ifndef NEURODECODE_ACCURACY_AGGREGATOR_H
#define NEURODECODE_ACCURACY_AGGREGATOR_H

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "LinearAlgebra.h"

namespace neurodecode {
namespace searchlight {

struct AccuracyEntry {
  int32_t location_id = 0;
  Vector values;
};

/**
 * @brief Final statistic matrix, columns in ascending location order
 */
struct AccuracyResult {
  Matrix accuracy; // variables x searchlights

  // permutation[i] is the enumeration-order position of sorted column i
  std::vector<size_t> permutation;

  std::vector<int32_t> location_ids; // sorted, one per column

  size_t GetNumberOfSearchlights() const { return location_ids.size(); }
};

class AccuracyAggregator {
private:
  unsigned m_num_variables;
  std::map<size_t, AccuracyEntry> m_entries; // keyed by enumeration sequence
  mutable std::mutex m_mutex;

public:
  explicit AccuracyAggregator(unsigned num_variables);

  /**
   * @brief Record one searchlight; safe to call from several threads
   *
   * Throws ShapeMismatchException for a wrong number of values and
   * NeuroDecodeException when the sequence number was already recorded.
   */
  void Add(size_t sequence, int32_t location_id, const Vector &values);

  /// A searchlight without usable features.
  void AddZero(size_t sequence, int32_t location_id);

  size_t GetNumberOfEntries() const;
  unsigned GetNumberOfVariables() const { return m_num_variables; }

  /**
   * @brief Order entries by sequence, then stably by location
   *
   * Equal locations keep their enumeration order.
   */
  AccuracyResult Finalize() const;
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_ACCURACY_AGGREGATOR_H
