#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace pakx {

// Decode a complete PAK image into its directory entries, in directory order.
// Every entry owns a copy of its data, so the buffer may be released afterwards.
//
// Validation is strict and all-or-nothing: the first structural problem aborts the
// decode and std::nullopt is returned with the reason in outError:
//   MalformedHeader    - buffer shorter than the header, or magic is not "PACK"
//   MalformedDirectory - dir_size not a multiple of 64, directory out of range,
//                        or a name field without a terminator in its 56 bytes
//   OutOfBounds        - an entry's data runs past the end of the buffer or
//                        overlaps the header/directory region
std::optional<std::vector<Entry>> decode(std::span<const uint8_t> buffer,
                                         Error *outError = nullptr);

// Map the archive at `path` read-only and decode it.
// Open/map failures are reported as IoFailure, format problems as in decode().
std::optional<std::vector<Entry>> decodeFile(const std::filesystem::path &path,
                                             Error *outError = nullptr);

} // namespace pakx
