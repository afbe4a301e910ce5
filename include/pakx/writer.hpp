#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace pakx {

// Check that `name` fits a directory record: at most 55 bytes (NameTooLong)
// and no embedded NUL (InvalidName)
bool validateName(const std::string &name, Error *outError = nullptr);

// Size of the encoded archive: header + 64 bytes per entry + all data.
// Validates every name and fails with OutOfBounds if the result would not be
// addressable by the format's 32-bit offsets.
std::optional<uint64_t> encodedSize(std::span<const Entry> entries, Error *outError = nullptr);

// Serialize entries into a complete PAK image.
// Layout is header, directory, then data back to back in directory order. Offsets
// are computed here from the entry sizes; the `offset` fields of the input are
// ignored, and each entry's size is taken from its data.
std::optional<std::vector<uint8_t>> encode(std::span<const Entry> entries,
                                           Error *outError = nullptr);

// Encode entries into a file at `path`.
// All validation happens before anything is created. The image is written to
// `path` + ".tmp" and renamed over `path` only after it was flushed, so a failed
// write leaves any existing file at `path` untouched.
bool encodeFile(const std::filesystem::path &path, std::span<const Entry> entries,
                Error *outError = nullptr);

// Offset each entry's data will have when `entries` is encoded
std::vector<uint32_t> canonicalOffsets(std::span<const Entry> entries);

} // namespace pakx
