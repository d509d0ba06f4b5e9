/**
 * @file SearchlightStream.cpp
 * @brief Implementation of searchlight stream decoding and encoding
 */

#include "SearchlightStream.h"
#include "../core/NeuroDecodeExceptions.h"

namespace neurodecode {
namespace io {

// ===== SearchlightStreamReader Implementation =====

SearchlightStreamReader::SearchlightStreamReader(const std::string &filename,
                                                 int index_base)
    : m_file(std::make_unique<GzInputFile>(filename)),
      m_index_base(index_base) {
  int32_t table_size = m_file->ReadInt32("lookup table length");
  if (table_size < 0) {
    throw DataIOException(filename, "read",
                          "negative lookup table length " +
                              std::to_string(table_size));
  }

  m_location_table.resize(static_cast<size_t>(table_size));
  for (auto &id : m_location_table) {
    id = m_file->ReadInt32("lookup table");
  }
}

int32_t SearchlightStreamReader::GetLocationId(size_t position) const {
  if (position >= m_location_table.size()) {
    throw ShapeMismatchException("SearchlightStream", "lookup table position",
                                 m_location_table.size(), position);
  }
  return m_location_table[position];
}

size_t SearchlightStreamReader::ToPosition(int32_t stored,
                                           const std::string &what) const {
  int64_t position = static_cast<int64_t>(stored) - m_index_base;
  if (position < 0 ||
      position >= static_cast<int64_t>(m_location_table.size())) {
    throw DataIOException(GetFilename(), "read",
                          what + " " + std::to_string(stored) +
                              " outside lookup table of " +
                              std::to_string(m_location_table.size()) +
                              " entries (record " +
                              std::to_string(m_records_read + 1) + ")");
  }
  return static_cast<size_t>(position);
}

std::optional<SearchlightRecord> SearchlightStreamReader::Next() {
  if (m_exhausted) {
    return std::nullopt;
  }

  int32_t count = 0;
  if (!m_file->TryReadInt32(count)) {
    m_exhausted = true;
    return std::nullopt;
  }

  if (count < 0) {
    throw DataIOException(GetFilename(), "read",
                          "negative member count in record " +
                              std::to_string(m_records_read + 1));
  }

  SearchlightRecord record;
  record.center_position = ToPosition(m_file->ReadInt32("searchlight center"),
                                      "center");
  record.member_positions.reserve(static_cast<size_t>(count));
  for (int32_t i = 0; i < count; ++i) {
    record.member_positions.push_back(
        ToPosition(m_file->ReadInt32("searchlight members"), "member"));
  }

  ++m_records_read;
  return record;
}

std::vector<SearchlightRecord> SearchlightStreamReader::ReadAll() {
  std::vector<SearchlightRecord> records;
  while (auto record = Next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

// ===== SearchlightStreamWriter Implementation =====

SearchlightStreamWriter::SearchlightStreamWriter(const std::string &filename,
                                                 int index_base)
    : m_file(std::make_unique<GzOutputFile>(
          filename, GzOutputFile::ShouldCompress(filename))),
      m_index_base(index_base) {}

void SearchlightStreamWriter::WriteLocationTable(
    const std::vector<int32_t> &location_ids) {
  if (m_table_written) {
    throw DataIOException(m_file->GetFilename(), "write",
                          "lookup table already written");
  }
  m_file->WriteInt32(static_cast<int32_t>(location_ids.size()));
  for (int32_t id : location_ids) {
    m_file->WriteInt32(id);
  }
  m_table_size = location_ids.size();
  m_table_written = true;
}

void SearchlightStreamWriter::WriteRecord(
    size_t center_position, const std::vector<size_t> &member_positions) {
  if (!m_table_written) {
    throw DataIOException(m_file->GetFilename(), "write",
                          "records must follow the lookup table");
  }
  if (center_position >= m_table_size) {
    throw ShapeMismatchException("SearchlightStream", "center position",
                                 m_table_size, center_position);
  }

  m_file->WriteInt32(static_cast<int32_t>(member_positions.size()));
  m_file->WriteInt32(static_cast<int32_t>(center_position) + m_index_base);
  for (size_t position : member_positions) {
    if (position >= m_table_size) {
      throw ShapeMismatchException("SearchlightStream", "member position",
                                   m_table_size, position);
    }
    m_file->WriteInt32(static_cast<int32_t>(position) + m_index_base);
  }
}

void SearchlightStreamWriter::Close() { m_file->Close(); }

} // namespace io
} // namespace neurodecode
