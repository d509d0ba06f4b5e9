/**
 * @file AccuracyAggregator.cpp
 * @brief Implementation of the searchlight statistic collector
 */

#include "AccuracyAggregator.h"
#include "../core/NeuroDecodeExceptions.h"
#include <algorithm>
#include <numeric>

namespace neurodecode {
namespace searchlight {

AccuracyAggregator::AccuracyAggregator(unsigned num_variables)
    : m_num_variables(num_variables) {
  if (num_variables == 0) {
    throw ConfigurationException("num_variables", "0",
                                 "at least one decoded variable");
  }
}

void AccuracyAggregator::Add(size_t sequence, int32_t location_id,
                             const Vector &values) {
  if (values.size() != m_num_variables) {
    throw ShapeMismatchException("AccuracyAggregator", "statistic count",
                                 m_num_variables, values.size());
  }

  AccuracyEntry entry;
  entry.location_id = location_id;
  entry.values = values;

  std::lock_guard<std::mutex> lock(m_mutex);
  const bool inserted = m_entries.emplace(sequence, std::move(entry)).second;
  if (!inserted) {
    throw NeuroDecodeException("Searchlight " + std::to_string(sequence) +
                                   " reported twice",
                               "AccuracyAggregator", "Add",
                               NeuroDecodeException::Severity::Error,
                               NeuroDecodeException::Category::Validation);
  }
}

void AccuracyAggregator::AddZero(size_t sequence, int32_t location_id) {
  Add(sequence, location_id, Vector(m_num_variables, 0.0));
}

size_t AccuracyAggregator::GetNumberOfEntries() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

AccuracyResult AccuracyAggregator::Finalize() const {
  std::lock_guard<std::mutex> lock(m_mutex);

  std::vector<const AccuracyEntry *> ordered;
  ordered.reserve(m_entries.size());
  for (const auto &item : m_entries) {
    ordered.push_back(&item.second);
  }

  std::vector<size_t> permutation(ordered.size());
  std::iota(permutation.begin(), permutation.end(), 0);
  std::stable_sort(permutation.begin(), permutation.end(),
                   [&ordered](size_t a, size_t b) {
                     return ordered[a]->location_id < ordered[b]->location_id;
                   });

  AccuracyResult result;
  result.accuracy =
      Matrix(m_num_variables, static_cast<unsigned>(ordered.size()), 0.0);
  result.location_ids.reserve(ordered.size());

  for (size_t column = 0; column < permutation.size(); ++column) {
    const AccuracyEntry &entry = *ordered[permutation[column]];
    result.accuracy.set_column(static_cast<unsigned>(column), entry.values);
    result.location_ids.push_back(entry.location_id);
  }
  result.permutation = std::move(permutation);

  return result;
}

} // namespace searchlight
} // namespace neurodecode
