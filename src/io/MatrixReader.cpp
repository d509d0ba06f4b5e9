/**
 * @file MatrixReader.cpp
 * @brief Implementation of matrix record and text matrix reading
 */

#include "MatrixIO.h"
#include "../core/NeuroDecodeExceptions.h"
#include "CompatUtils.h"
#include "GzFile.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace neurodecode {
namespace io {

namespace {

constexpr char kMagic[4] = {'N', 'D', 'M', '1'};
constexpr int32_t kMaxNameLength = 4096;

} // namespace

// ===== MatrixFileReader Implementation =====

MatrixFileReader::MatrixFileReader(const std::string &filename)
    : m_filename(filename) {
  ReadRecords();
}

void MatrixFileReader::ReadRecords() {
  GzInputFile file(m_filename);

  char magic[4] = {0};
  file.ReadExact(magic, sizeof(magic), "file magic");
  if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
    throw DataIOException(m_filename, "read", "not a matrix record file");
  }

  int32_t num_records = file.ReadInt32("record count");
  if (num_records < 0) {
    throw DataIOException(m_filename, "read",
                          "negative record count " +
                              std::to_string(num_records));
  }

  m_records.clear();
  m_records.reserve(static_cast<size_t>(num_records));

  for (int32_t r = 0; r < num_records; ++r) {
    int32_t name_length = file.ReadInt32("record name length");
    if (name_length < 0 || name_length > kMaxNameLength) {
      throw DataIOException(m_filename, "read",
                            "invalid record name length " +
                                std::to_string(name_length));
    }

    MatrixRecord record;
    record.name.resize(static_cast<size_t>(name_length));
    if (name_length > 0) {
      file.ReadExact(&record.name[0], record.name.size(), "record name");
    }

    int32_t rows = file.ReadInt32("row count of '" + record.name + "'");
    int32_t cols = file.ReadInt32("column count of '" + record.name + "'");
    if (rows < 0 || cols < 0) {
      throw DataIOException(m_filename, "read",
                            "invalid shape for record '" + record.name + "'");
    }

    record.values.set_size(static_cast<unsigned>(rows),
                           static_cast<unsigned>(cols));
    const size_t count = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    if (count > 0) {
      file.ReadExact(record.values.data_block(), count * sizeof(double),
                     "values of '" + record.name + "'");
      if (!IsHostLittleEndian()) {
        double *values = record.values.data_block();
        for (size_t i = 0; i < count; ++i) {
          SwapEndianness(values[i]);
        }
      }
    }

    m_records.push_back(std::move(record));
  }
}

bool MatrixFileReader::HasRecord(const std::string &name) const {
  for (const auto &record : m_records) {
    if (record.name == name) {
      return true;
    }
  }
  return false;
}

const Matrix &MatrixFileReader::GetRecord(const std::string &name) const {
  for (const auto &record : m_records) {
    if (record.name == name) {
      return record.values;
    }
  }
  throw DataIOException(m_filename, "lookup",
                        "no record named '" + name + "'");
}

bool MatrixFileReader::IsRecordFile(const std::string &filename) {
  return compat::has_extension(filename, ".ndm");
}

Matrix MatrixFileReader::ReadMatrix(const std::string &filename,
                                    const std::string &record_name) {
  if (!IsRecordFile(filename)) {
    return ReadTextMatrix(filename);
  }

  MatrixFileReader reader(filename);
  if (record_name.empty()) {
    if (reader.GetRecords().empty()) {
      throw DataIOException(filename, "lookup", "file contains no records");
    }
    return reader.GetRecords().front().values;
  }
  return reader.GetRecord(record_name);
}

Matrix MatrixFileReader::ReadTextMatrix(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw DataIOException(filename, "open", "cannot open text matrix");
  }

  std::vector<std::vector<double>> rows;
  std::string line;
  size_t line_number = 0;

  while (std::getline(file, line)) {
    ++line_number;

    size_t comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    for (char &c : line) {
      if (c == ',' || c == ';') {
        c = ' ';
      }
    }

    std::istringstream tokens(line);
    std::vector<double> row;
    std::string token;
    while (tokens >> token) {
      char *end = nullptr;
      double value = std::strtod(token.c_str(), &end);
      if (end == token.c_str() || *end != '\0') {
        throw DataIOException(filename, "parse",
                              "non-numeric token '" + token + "' on line " +
                                  std::to_string(line_number));
      }
      row.push_back(value);
    }

    if (row.empty()) {
      continue;
    }
    if (!rows.empty() && row.size() != rows.front().size()) {
      throw DataIOException(filename, "parse",
                            "line " + std::to_string(line_number) + " has " +
                                std::to_string(row.size()) +
                                " values, expected " +
                                std::to_string(rows.front().size()));
    }
    rows.push_back(std::move(row));
  }

  if (file.bad()) {
    throw DataIOException(filename, "read", "stream error");
  }

  Matrix matrix(static_cast<unsigned>(rows.size()),
                rows.empty() ? 0u : static_cast<unsigned>(rows.front().size()));
  for (size_t r = 0; r < rows.size(); ++r) {
    for (size_t c = 0; c < rows[r].size(); ++c) {
      matrix(static_cast<unsigned>(r), static_cast<unsigned>(c)) = rows[r][c];
    }
  }
  return matrix;
}

} // namespace io
} // namespace neurodecode
