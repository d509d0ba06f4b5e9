/**
 * @file GzFile.cpp
 * @brief zlib-backed binary file access
 */

#include "GzFile.h"
#include "../core/NeuroDecodeExceptions.h"
#include "CompatUtils.h"
#include <algorithm>
#include <climits>
#include <cstring>

namespace neurodecode {
namespace io {

bool IsHostLittleEndian() {
  const uint16_t probe = 1;
  uint8_t first_byte = 0;
  std::memcpy(&first_byte, &probe, 1);
  return first_byte == 1;
}

// ===== GzInputFile =====

GzInputFile::GzInputFile(const std::string &filename) : m_filename(filename) {
  m_file = gzopen(filename.c_str(), "rb");
  if (!m_file) {
    throw DataIOException(filename, "open", "cannot open file for reading");
  }
}

GzInputFile::~GzInputFile() {
  if (m_file) {
    gzclose(m_file);
  }
}

size_t GzInputFile::Read(void *buffer, size_t num_bytes) {
  size_t total = 0;
  char *out = static_cast<char *>(buffer);

  while (total < num_bytes) {
    size_t chunk = std::min<size_t>(num_bytes - total, INT_MAX);
    int bytes_read = gzread(m_file, out + total, static_cast<unsigned>(chunk));
    if (bytes_read < 0) {
      int errnum = 0;
      const char *message = gzerror(m_file, &errnum);
      throw DataIOException(m_filename, "read",
                            message ? message : "zlib read error");
    }
    if (bytes_read == 0) {
      break;
    }
    total += static_cast<size_t>(bytes_read);
  }

  return total;
}

void GzInputFile::ReadExact(void *buffer, size_t num_bytes,
                            const std::string &what) {
  size_t bytes_read = Read(buffer, num_bytes);
  if (bytes_read != num_bytes) {
    throw DataIOException(m_filename, "read",
                          "unexpected end of file while reading " + what +
                              " (" + std::to_string(bytes_read) + " of " +
                              std::to_string(num_bytes) + " bytes)");
  }
}

bool GzInputFile::TryReadInt32(int32_t &value) {
  int32_t raw = 0;
  size_t bytes_read = Read(&raw, sizeof(raw));
  if (bytes_read == 0) {
    return false;
  }
  if (bytes_read != sizeof(raw)) {
    throw DataIOException(m_filename, "read",
                          "truncated integer at end of file");
  }
  if (!IsHostLittleEndian()) {
    SwapEndianness(raw);
  }
  value = raw;
  return true;
}

int32_t GzInputFile::ReadInt32(const std::string &what) {
  int32_t value = 0;
  ReadExact(&value, sizeof(value), what);
  if (!IsHostLittleEndian()) {
    SwapEndianness(value);
  }
  return value;
}

double GzInputFile::ReadFloat64(const std::string &what) {
  double value = 0.0;
  ReadExact(&value, sizeof(value), what);
  if (!IsHostLittleEndian()) {
    SwapEndianness(value);
  }
  return value;
}

// ===== GzOutputFile =====

bool GzOutputFile::ShouldCompress(const std::string &filename) {
  return compat::ends_with(compat::to_lower(filename), ".gz");
}

GzOutputFile::GzOutputFile(const std::string &filename, bool compress)
    : m_filename(filename) {
  // "T" asks zlib for transparent (uncompressed) writing
  const char *mode = compress ? "wb6" : "wbT";
  m_file = gzopen(filename.c_str(), mode);
  if (!m_file) {
    throw DataIOException(filename, "open", "cannot open file for writing");
  }
}

GzOutputFile::~GzOutputFile() {
  if (m_file) {
    gzclose(m_file);
  }
}

void GzOutputFile::Write(const void *buffer, size_t num_bytes) {
  if (!m_file) {
    throw DataIOException(m_filename, "write", "file already closed");
  }

  const char *in = static_cast<const char *>(buffer);
  size_t total = 0;
  while (total < num_bytes) {
    size_t chunk = std::min<size_t>(num_bytes - total, INT_MAX);
    int written = gzwrite(m_file, in + total, static_cast<unsigned>(chunk));
    if (written <= 0) {
      int errnum = 0;
      const char *message = gzerror(m_file, &errnum);
      throw DataIOException(m_filename, "write",
                            message ? message : "zlib write error");
    }
    total += static_cast<size_t>(written);
  }
}

void GzOutputFile::WriteInt32(int32_t value) {
  if (!IsHostLittleEndian()) {
    SwapEndianness(value);
  }
  Write(&value, sizeof(value));
}

void GzOutputFile::WriteFloat64(double value) {
  if (!IsHostLittleEndian()) {
    SwapEndianness(value);
  }
  Write(&value, sizeof(value));
}

void GzOutputFile::Close() {
  if (!m_file) {
    return;
  }
  int status = gzclose(m_file);
  m_file = nullptr;
  if (status != Z_OK) {
    throw DataIOException(m_filename, "close",
                          "zlib error " + std::to_string(status));
  }
}

} // namespace io
} // namespace neurodecode
