#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pakx {

// File entry in the PAK archive
struct Entry {
  std::string name;          // Stored verbatim, may contain '/' or '\' separators
  uint32_t offset = 0;       // Offset within archive (recomputed on every encode)
  uint32_t size = 0;         // File size in bytes
  std::vector<uint8_t> data; // Owned file contents, exactly `size` bytes
};

// Archive header (12 bytes, little-endian)
struct PakHeader {
  static constexpr char magic[4] = {'P', 'A', 'C', 'K'}; // File identifier, not NUL-terminated
  uint32_t dirOffset = 0; // Offset of the directory
  uint32_t dirSize = 0;   // Directory size in bytes (64 per entry)

  static constexpr size_t headerSize = 12;
};

// Directory record layout (64 bytes)
struct DirectoryRecord {
  static constexpr size_t recordSize = 64;
  static constexpr size_t nameFieldSize = 56;
  static constexpr size_t maxNameLength = nameFieldSize - 1; // Room for the terminator
};

enum class ErrorCode {
  None,
  MalformedHeader,
  MalformedDirectory,
  OutOfBounds,
  NameTooLong,
  InvalidName,
  NotFound,
  IoFailure,
  UnsafePath,
};

// Error reported through the optional outError parameter of library calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
};

const char *toString(ErrorCode code) noexcept;

namespace detail {

// Fills *outError when the caller asked for it
inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

} // namespace detail

} // namespace pakx
