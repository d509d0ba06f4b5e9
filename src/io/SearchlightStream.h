/**
 * @file SearchlightStream.h
 * @brief Sequential access to binary searchlight definition files
 *
 * Layout (little-endian int32 throughout, optionally gzip compressed):
 *
 *   n, id[0] ... id[n-1]            location lookup table
 *   repeated until end of file:
 *     count, center, member[0] ... member[count-1]
 *
 * The lookup table holds global volume indices of the analysed locations.
 * center and member values are positions into that table, stored with the
 * producer's index base (1 for streams written by MATLAB tooling).
 */

#ifndef NEURODECODE_SEARCHLIGHT_STREAM_H
#define NEURODECODE_SEARCHLIGHT_STREAM_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "GzFile.h"

namespace neurodecode {
namespace io {

/**
 * @brief One decoded searchlight
 *
 * Positions are zero-based and already checked against the lookup table.
 */
struct SearchlightRecord {
  size_t center_position = 0;
  std::vector<size_t> member_positions;
};

class SearchlightStreamReader {
private:
  std::unique_ptr<GzInputFile> m_file;
  std::vector<int32_t> m_location_table;
  int m_index_base;
  size_t m_records_read = 0;
  bool m_exhausted = false;

public:
  /// Opens the file and reads the lookup table. Throws DataIOException.
  explicit SearchlightStreamReader(const std::string &filename,
                                   int index_base = 1);

  const std::vector<int32_t> &GetLocationTable() const {
    return m_location_table;
  }

  /// Global location identifier stored at a zero-based table position.
  int32_t GetLocationId(size_t position) const;

  /**
   * @brief Decode the next record
   * @return std::nullopt once the stream ends cleanly before a record starts.
   *         A record cut short, or one referencing positions outside the
   *         lookup table, throws DataIOException.
   */
  std::optional<SearchlightRecord> Next();

  /// Decode every remaining record.
  std::vector<SearchlightRecord> ReadAll();

  size_t GetRecordsRead() const { return m_records_read; }
  bool IsExhausted() const { return m_exhausted; }
  const std::string &GetFilename() const { return m_file->GetFilename(); }

private:
  size_t ToPosition(int32_t stored, const std::string &what) const;
};

/**
 * @brief Produces files readable by SearchlightStreamReader
 */
class SearchlightStreamWriter {
private:
  std::unique_ptr<GzOutputFile> m_file;
  size_t m_table_size = 0;
  int m_index_base;
  bool m_table_written = false;

public:
  explicit SearchlightStreamWriter(const std::string &filename,
                                   int index_base = 1);

  void WriteLocationTable(const std::vector<int32_t> &location_ids);

  /// Positions are zero-based; the index base is applied on write.
  void WriteRecord(size_t center_position,
                   const std::vector<size_t> &member_positions);

  void Close();
};

} // namespace io
} // namespace neurodecode

#endif // NEURODECODE_SEARCHLIGHT_STREAM_H
