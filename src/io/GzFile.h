/**
 * @file GzFile.h
 * @brief RAII wrappers around zlib file handles
 *
 * Both readers accept plain and gzip-compressed files: zlib passes
 * uncompressed input through unchanged.
 */

#ifndef NEURODECODE_GZ_FILE_H
#define NEURODECODE_GZ_FILE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <zlib.h>

namespace neurodecode {
namespace io {

class GzInputFile {
private:
  std::string m_filename;
  gzFile m_file = nullptr;

public:
  /// Throws DataIOException when the file cannot be opened.
  explicit GzInputFile(const std::string &filename);
  ~GzInputFile();

  GzInputFile(const GzInputFile &) = delete;
  GzInputFile &operator=(const GzInputFile &) = delete;

  /**
   * @brief Read up to num_bytes
   * @return Number of bytes actually read; less than num_bytes only at end of
   *         file. Decoder errors throw DataIOException.
   */
  size_t Read(void *buffer, size_t num_bytes);

  /// Read exactly num_bytes or throw DataIOException naming what was read.
  void ReadExact(void *buffer, size_t num_bytes, const std::string &what);

  /// Little-endian int32; returns false on a clean end of file.
  bool TryReadInt32(int32_t &value);

  int32_t ReadInt32(const std::string &what);
  double ReadFloat64(const std::string &what);

  const std::string &GetFilename() const { return m_filename; }
};

class GzOutputFile {
private:
  std::string m_filename;
  gzFile m_file = nullptr;

public:
  GzOutputFile(const std::string &filename, bool compress);

  /// True when the filename ends in ".gz".
  static bool ShouldCompress(const std::string &filename);
  ~GzOutputFile();

  GzOutputFile(const GzOutputFile &) = delete;
  GzOutputFile &operator=(const GzOutputFile &) = delete;

  void Write(const void *buffer, size_t num_bytes);
  void WriteInt32(int32_t value);
  void WriteFloat64(double value);

  /// Flushes and closes; throws if zlib reports a deferred write error.
  void Close();

  const std::string &GetFilename() const { return m_filename; }
};

bool IsHostLittleEndian();

template <typename T> void SwapEndianness(T &value) {
  char *bytes = reinterpret_cast<char *>(&value);
  for (size_t i = 0; i < sizeof(T) / 2; ++i) {
    char tmp = bytes[i];
    bytes[i] = bytes[sizeof(T) - 1 - i];
    bytes[sizeof(T) - 1 - i] = tmp;
  }
}

} // namespace io
} // namespace neurodecode

#endif // NEURODECODE_GZ_FILE_H
