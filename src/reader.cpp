#include <algorithm>
#include <cstring>
#include <format>
#include <string_view>
#include <system_error>

#include <pakx/endian.hpp>
#include <pakx/mmap.hpp>
#include <pakx/reader.hpp>

namespace pakx {

namespace {

bool overlaps(uint64_t begin, uint64_t end, uint64_t otherBegin, uint64_t otherEnd) {
  return begin < otherEnd && otherBegin < end;
}

} // namespace

std::optional<std::vector<Entry>> decode(std::span<const uint8_t> buffer, Error *outError) {
  if (buffer.size() < PakHeader::headerSize) {
    detail::setError(outError, ErrorCode::MalformedHeader,
                     std::format("File too small to be a PAK archive (size: {})", buffer.size()));
    return std::nullopt;
  }

  const char *magic = reinterpret_cast<const char *>(buffer.data());
  if (std::memcmp(magic, PakHeader::magic, sizeof(PakHeader::magic)) != 0) {
    detail::setError(outError, ErrorCode::MalformedHeader,
                     std::format("Invalid PAK magic (expected '{}', got '{:.4s}')",
                                 std::string_view(PakHeader::magic, sizeof(PakHeader::magic)),
                                 std::string_view(magic, 4)));
    return std::nullopt;
  }

  PakHeader header;
  header.dirOffset = loadLE32(buffer.data() + 4);
  header.dirSize = loadLE32(buffer.data() + 8);

  if (header.dirSize % DirectoryRecord::recordSize != 0) {
    detail::setError(outError, ErrorCode::MalformedDirectory,
                     std::format("Directory size {} is not a multiple of {}", header.dirSize,
                                 DirectoryRecord::recordSize));
    return std::nullopt;
  }

  const uint64_t dirBegin = header.dirOffset;
  const uint64_t dirEnd = dirBegin + header.dirSize;
  if (dirEnd > buffer.size()) {
    detail::setError(outError, ErrorCode::MalformedDirectory,
                     std::format("Directory (offset={}, size={}) extends beyond file bounds "
                                 "(fileSize={})",
                                 header.dirOffset, header.dirSize, buffer.size()));
    return std::nullopt;
  }
  if (header.dirSize > 0 && dirBegin < PakHeader::headerSize) {
    detail::setError(outError, ErrorCode::MalformedDirectory,
                     std::format("Directory offset {} overlaps the header", header.dirOffset));
    return std::nullopt;
  }

  const uint32_t entryCount = header.dirSize / DirectoryRecord::recordSize;
  std::vector<Entry> entries;
  entries.reserve(entryCount);

  size_t pos = header.dirOffset;
  for (uint32_t i = 0; i < entryCount; ++i) {
    const uint8_t *record = buffer.data() + pos;
    pos += DirectoryRecord::recordSize;

    // Name runs up to the first NUL; anything after it is padding
    const uint8_t *nameEnd = std::find(record, record + DirectoryRecord::nameFieldSize, 0);
    if (nameEnd == record + DirectoryRecord::nameFieldSize) {
      detail::setError(outError, ErrorCode::MalformedDirectory,
                       std::format("Entry {} has unterminated name field", i));
      return std::nullopt;
    }

    Entry entry;
    entry.name.assign(reinterpret_cast<const char *>(record), nameEnd - record);
    entry.offset = loadLE32(record + DirectoryRecord::nameFieldSize);
    entry.size = loadLE32(record + DirectoryRecord::nameFieldSize + 4);

    const uint64_t dataBegin = entry.offset;
    const uint64_t dataEnd = dataBegin + entry.size;
    if (dataEnd > buffer.size()) {
      detail::setError(outError, ErrorCode::OutOfBounds,
                       std::format("Entry {} '{}' has invalid offset/size (offset={}, size={}, "
                                   "fileSize={})",
                                   i, entry.name, entry.offset, entry.size, buffer.size()));
      return std::nullopt;
    }

    if (entry.size > 0 && (overlaps(dataBegin, dataEnd, 0, PakHeader::headerSize) ||
                           overlaps(dataBegin, dataEnd, dirBegin, dirEnd))) {
      detail::setError(outError, ErrorCode::OutOfBounds,
                       std::format("Entry {} '{}' overlaps the header or directory (offset={}, "
                                   "size={})",
                                   i, entry.name, entry.offset, entry.size));
      return std::nullopt;
    }

    entry.data.assign(buffer.begin() + entry.offset, buffer.begin() + dataEnd);
    entries.push_back(std::move(entry));
  }

  return entries;
}

std::optional<std::vector<Entry>> decodeFile(const std::filesystem::path &path, Error *outError) {
  // An empty file can't be mapped, but it is still a (truncated) archive
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec) && std::filesystem::file_size(path, ec) == 0 &&
      !ec) {
    return decode({}, outError);
  }

  MappedFile mappedFile;
  if (!mappedFile.openRead(path, outError)) {
    return std::nullopt;
  }

  return decode(mappedFile.data(), outError);
}

} // namespace pakx
