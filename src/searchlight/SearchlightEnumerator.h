/**
 * @file SearchlightEnumerator.h
 * @brief Assembly of per-searchlight feature blocks from the decoded stream
 */

#ifndef NEURODECODE_SEARCHLIGHT_ENUMERATOR_H
#define NEURODECODE_SEARCHLIGHT_ENUMERATOR_H

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "../io/SearchlightStream.h"
#include "../io/VolumeIO.h"
#include "LinearAlgebra.h"

namespace neurodecode {
namespace searchlight {

/**
 * @brief Feature blocks of one searchlight, ready for the ridge engine
 */
struct SearchlightFeatures {
  size_t sequence = 0;      // record index in stream order
  int32_t location_id = 0;  // global identifier of the center
  size_t center_position = 0;
  RunBlocks run_features;   // retained trials x kept members, per run
  size_t member_count = 0;
  size_t kept_count = 0;

  /// No member column carries signal; the searchlight scores zero.
  bool IsDegenerate() const { return kept_count == 0; }
};

struct EnumeratorOptions {
  // Columns whose absolute sum over all runs stays at or below this are
  // dropped
  double degenerate_epsilon = 1e-3;
};

struct EnumerationStats {
  size_t records_read = 0;
  size_t masked_out = 0;
  size_t degenerate = 0;
  size_t assembled = 0; // handed to the visitor, degenerate included
};

class SearchlightEnumerator {
public:
  using Visitor = std::function<void(const SearchlightFeatures &)>;

private:
  const RunBlocks &m_activity;
  std::vector<int32_t> m_location_table;
  int m_index_base;
  EnumeratorOptions m_options;
  const io::LocationMask *m_location_mask = nullptr;

public:
  /**
   * @param activity conditioned run blocks; one column per lookup table
   *        position. Must outlive the enumerator.
   * @param index_base base of the global location identifiers, used to
   *        address the location mask
   */
  SearchlightEnumerator(const RunBlocks &activity,
                        std::vector<int32_t> location_table,
                        int index_base = 1,
                        EnumeratorOptions options = EnumeratorOptions());

  /// Not owned. nullptr includes every location.
  void SetLocationMask(const io::LocationMask *mask) { m_location_mask = mask; }
  const io::LocationMask *GetLocationMask() const { return m_location_mask; }

  bool IsCenterIncluded(int32_t location_id) const;

  /**
   * @brief Slice and filter the member columns of one record
   * @return std::nullopt when the center is masked out
   */
  std::optional<SearchlightFeatures>
  Assemble(const io::SearchlightRecord &record, size_t sequence) const;

  /**
   * @brief Walk the remaining stream in order
   *
   * The visitor sees every searchlight whose center is included, degenerate
   * ones too, in stream order. Exceptions from the reader or the visitor
   * propagate.
   */
  EnumerationStats Enumerate(io::SearchlightStreamReader &reader,
                             const Visitor &visitor) const;

  /// Column indices whose absolute sum over all blocks exceeds epsilon.
  static std::vector<unsigned>
  SelectInformativeColumns(const RunBlocks &blocks, double epsilon);

  const std::vector<int32_t> &GetLocationTable() const {
    return m_location_table;
  }
};

} // namespace searchlight
} // namespace neurodecode

#endif // NEURODECODE_SEARCHLIGHT_ENUMERATOR_H
