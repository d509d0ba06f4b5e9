/**
 * @file MatrixIO.h
 * @brief Reading and writing of named numeric matrices
 *
 * Activity data, regressors and analysis results are exchanged as matrix
 * record files (".ndm", optionally gzip compressed):
 *
 *   "NDM1"            4-byte magic
 *   int32             number of records
 *   per record:
 *     int32           name length, followed by the name bytes
 *     int32, int32    rows, cols
 *     float64[]       rows * cols values, row-major
 *
 * All integers and floats are little-endian. Small trial-wise inputs can also
 * be supplied as delimited text, one matrix row per line.
 */

#ifndef NEURODECODE_MATRIX_IO_H
#define NEURODECODE_MATRIX_IO_H

#include <string>
#include <vector>

#include "vnl/vnl_matrix.h"

namespace neurodecode {
namespace io {

using Matrix = vnl_matrix<double>;

struct MatrixRecord {
  std::string name;
  Matrix values;
};

/**
 * @brief Reads all records of a matrix record file
 *
 * Any failure to open or decode the file throws DataIOException.
 */
class MatrixFileReader {
private:
  std::string m_filename;
  std::vector<MatrixRecord> m_records;

public:
  explicit MatrixFileReader(const std::string &filename);

  const std::string &GetFilename() const { return m_filename; }
  const std::vector<MatrixRecord> &GetRecords() const { return m_records; }

  bool HasRecord(const std::string &name) const;

  /// Throws DataIOException when no record carries this name.
  const Matrix &GetRecord(const std::string &name) const;

  static bool IsRecordFile(const std::string &filename);

  /**
   * @brief Load one matrix from either file flavour
   *
   * Record files yield the record called record_name, or the first record
   * when record_name is empty. Anything else is parsed as text.
   */
  static Matrix ReadMatrix(const std::string &filename,
                           const std::string &record_name = "");

  /**
   * @brief Parse a delimited text matrix
   *
   * Values are separated by whitespace, commas or semicolons; text after '#'
   * is ignored; blank lines are skipped. Rows must have equal lengths.
   */
  static Matrix ReadTextMatrix(const std::string &filename);

private:
  void ReadRecords();
};

/**
 * @brief Collects records and writes them in one go
 */
class MatrixFileWriter {
private:
  std::vector<MatrixRecord> m_records;

public:
  void AddRecord(const std::string &name, const Matrix &values);
  void Clear() { m_records.clear(); }
  size_t GetNumberOfRecords() const { return m_records.size(); }

  /// Throws DataIOException; a failed write leaves no complete file behind.
  void Write(const std::string &filename) const;
};

} // namespace io
} // namespace neurodecode

#endif // NEURODECODE_MATRIX_IO_H
