/**
 * @file MatrixWriter.cpp
 * @brief Implementation of matrix record writing
 */

#include "MatrixIO.h"
#include "../core/NeuroDecodeExceptions.h"
#include "GzFile.h"
#include <filesystem>

namespace neurodecode {
namespace io {

void MatrixFileWriter::AddRecord(const std::string &name,
                                 const Matrix &values) {
  for (auto &record : m_records) {
    if (record.name == name) {
      record.values = values;
      return;
    }
  }
  m_records.push_back(MatrixRecord{name, values});
}

void MatrixFileWriter::Write(const std::string &filename) const {
  // Written under a temporary name so readers never see a partial file
  const std::string partial_name = filename + ".partial";

  try {
    GzOutputFile file(partial_name, GzOutputFile::ShouldCompress(filename));

    const char magic[4] = {'N', 'D', 'M', '1'};
    file.Write(magic, sizeof(magic));
    file.WriteInt32(static_cast<int32_t>(m_records.size()));

    for (const auto &record : m_records) {
      file.WriteInt32(static_cast<int32_t>(record.name.size()));
      file.Write(record.name.data(), record.name.size());
      file.WriteInt32(static_cast<int32_t>(record.values.rows()));
      file.WriteInt32(static_cast<int32_t>(record.values.cols()));

      for (unsigned r = 0; r < record.values.rows(); ++r) {
        for (unsigned c = 0; c < record.values.cols(); ++c) {
          file.WriteFloat64(record.values(r, c));
        }
      }
    }

    file.Close();
    std::filesystem::rename(partial_name, filename);
  } catch (const NeuroDecodeException &) {
    std::error_code ignored;
    std::filesystem::remove(partial_name, ignored);
    throw;
  } catch (const std::filesystem::filesystem_error &e) {
    std::error_code ignored;
    std::filesystem::remove(partial_name, ignored);
    throw DataIOException(filename, "write", e.what());
  }
}

} // namespace io
} // namespace neurodecode
