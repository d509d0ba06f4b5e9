/**
 * @file SearchlightEnumerator.cpp
 * @brief Implementation of searchlight feature assembly
 */

#include "SearchlightEnumerator.h"
#include "../core/NeuroDecodeExceptions.h"
#include <cmath>

namespace neurodecode {
namespace searchlight {

SearchlightEnumerator::SearchlightEnumerator(const RunBlocks &activity,
                                             std::vector<int32_t> location_table,
                                             int index_base,
                                             EnumeratorOptions options)
    : m_activity(activity), m_location_table(std::move(location_table)),
      m_index_base(index_base), m_options(options) {
  if (m_activity.empty()) {
    throw ConfigurationException("activity", "0 runs", "at least one run");
  }
  if (!(m_options.degenerate_epsilon >= 0.0)) {
    throw ConfigurationException("degenerate_epsilon",
                                 std::to_string(m_options.degenerate_epsilon),
                                 "non-negative value");
  }

  for (const auto &block : m_activity) {
    if (block.cols() != m_location_table.size()) {
      throw ShapeMismatchException("SearchlightEnumerator",
                                   "activity columns against lookup table",
                                   m_location_table.size(), block.cols());
    }
  }
}

bool SearchlightEnumerator::IsCenterIncluded(int32_t location_id) const {
  if (m_location_mask == nullptr) {
    return true;
  }

  const int64_t linear = static_cast<int64_t>(location_id) - m_index_base;
  if (linear < 0) {
    throw ShapeMismatchException("SearchlightEnumerator",
                                 "center location identifier",
                                 m_location_mask->GetNumberOfLocations(),
                                 static_cast<size_t>(location_id));
  }
  return m_location_mask->IsIncluded(static_cast<size_t>(linear));
}

std::optional<SearchlightFeatures>
SearchlightEnumerator::Assemble(const io::SearchlightRecord &record,
                                size_t sequence) const {
  if (record.center_position >= m_location_table.size()) {
    throw ShapeMismatchException("SearchlightEnumerator", "center position",
                                 m_location_table.size(),
                                 record.center_position);
  }

  const int32_t location_id = m_location_table[record.center_position];
  if (!IsCenterIncluded(location_id)) {
    return std::nullopt;
  }

  std::vector<unsigned> members;
  members.reserve(record.member_positions.size());
  for (size_t position : record.member_positions) {
    members.push_back(static_cast<unsigned>(position));
  }

  RunBlocks sliced;
  sliced.reserve(m_activity.size());
  for (const auto &block : m_activity) {
    sliced.push_back(SelectColumns(block, members));
  }

  SearchlightFeatures features;
  features.sequence = sequence;
  features.location_id = location_id;
  features.center_position = record.center_position;
  features.member_count = members.size();

  const std::vector<unsigned> kept =
      SelectInformativeColumns(sliced, m_options.degenerate_epsilon);
  features.kept_count = kept.size();

  if (kept.size() == members.size()) {
    features.run_features = std::move(sliced);
  } else if (!kept.empty()) {
    features.run_features.reserve(sliced.size());
    for (const auto &block : sliced) {
      features.run_features.push_back(SelectColumns(block, kept));
    }
  }

  return features;
}

EnumerationStats
SearchlightEnumerator::Enumerate(io::SearchlightStreamReader &reader,
                                 const Visitor &visitor) const {
  EnumerationStats stats;

  while (std::optional<io::SearchlightRecord> record = reader.Next()) {
    const size_t sequence = stats.records_read++;

    std::optional<SearchlightFeatures> features = Assemble(*record, sequence);
    if (!features) {
      ++stats.masked_out;
      continue;
    }

    if (features->IsDegenerate()) {
      ++stats.degenerate;
    }
    ++stats.assembled;
    visitor(*features);
  }

  return stats;
}

std::vector<unsigned>
SearchlightEnumerator::SelectInformativeColumns(const RunBlocks &blocks,
                                                double epsilon) {
  if (blocks.empty()) {
    return {};
  }

  const unsigned cols = blocks.front().cols();
  std::vector<double> absolute_sums(cols, 0.0);
  for (const auto &block : blocks) {
    if (block.cols() != cols) {
      throw ShapeMismatchException("SearchlightEnumerator",
                                   "run block column count", cols,
                                   block.cols());
    }
    for (unsigned r = 0; r < block.rows(); ++r) {
      for (unsigned c = 0; c < cols; ++c) {
        absolute_sums[c] += std::abs(block(r, c));
      }
    }
  }

  std::vector<unsigned> kept;
  for (unsigned c = 0; c < cols; ++c) {
    if (absolute_sums[c] > epsilon) {
      kept.push_back(c);
    }
  }
  return kept;
}

} // namespace searchlight
} // namespace neurodecode
