#include <cstring>
#include <format>
#include <limits>
#include <system_error>

#include <pakx/endian.hpp>
#include <pakx/mmap.hpp>
#include <pakx/writer.hpp>

namespace pakx {

namespace {

// Write header, directory and data into `out`, which must be exactly encodedSize() bytes
void serialize(std::span<uint8_t> out, std::span<const Entry> entries) {
  const uint32_t dirSize = static_cast<uint32_t>(entries.size() * DirectoryRecord::recordSize);

  // Header
  std::memcpy(out.data(), PakHeader::magic, sizeof(PakHeader::magic));
  storeLE32(out.data() + 4, static_cast<uint32_t>(PakHeader::headerSize));
  storeLE32(out.data() + 8, dirSize);

  // Directory and data
  size_t recordPos = PakHeader::headerSize;
  size_t dataPos = PakHeader::headerSize + dirSize;
  for (const auto &entry : entries) {
    uint8_t *record = out.data() + recordPos;
    std::memset(record, 0, DirectoryRecord::nameFieldSize);
    std::memcpy(record, entry.name.data(), entry.name.size());
    storeLE32(record + DirectoryRecord::nameFieldSize, static_cast<uint32_t>(dataPos));
    storeLE32(record + DirectoryRecord::nameFieldSize + 4,
              static_cast<uint32_t>(entry.data.size()));
    recordPos += DirectoryRecord::recordSize;

    if (!entry.data.empty()) {
      std::memcpy(out.data() + dataPos, entry.data.data(), entry.data.size());
    }
    dataPos += entry.data.size();
  }
}

// Sibling file that is removed unless commit() renames it over the destination
class TemporaryFile {
public:
  explicit TemporaryFile(const std::filesystem::path &destPath) : destPath_(destPath) {
    path_ = destPath;
    path_ += ".tmp";
  }

  ~TemporaryFile() {
    // Leave anything that isn't our partially written file alone
    std::error_code ec;
    if (!committed_ && std::filesystem::is_regular_file(path_, ec)) {
      std::filesystem::remove(path_, ec);
    }
  }

  TemporaryFile(const TemporaryFile &) = delete;
  TemporaryFile &operator=(const TemporaryFile &) = delete;

  const std::filesystem::path &path() const { return path_; }

  bool commit(Error *outError) {
    std::error_code ec;
    std::filesystem::rename(path_, destPath_, ec);
    if (ec) {
      detail::setError(outError, ErrorCode::IoFailure,
                       std::format("Failed to replace {}: {}", destPath_.string(), ec.message()));
      return false;
    }
    committed_ = true;
    return true;
  }

private:
  std::filesystem::path destPath_;
  std::filesystem::path path_;
  bool committed_ = false;
};

} // namespace

bool validateName(const std::string &name, Error *outError) {
  if (name.size() > DirectoryRecord::maxNameLength) {
    detail::setError(outError, ErrorCode::NameTooLong,
                     std::format("Name '{}' is {} bytes long (maximum is {})", name, name.size(),
                                 DirectoryRecord::maxNameLength));
    return false;
  }
  if (name.find('\0') != std::string::npos) {
    detail::setError(outError, ErrorCode::InvalidName,
                     std::format("Name contains an embedded NUL byte at position {}",
                                 name.find('\0')));
    return false;
  }
  return true;
}

std::optional<uint64_t> encodedSize(std::span<const Entry> entries, Error *outError) {
  uint64_t total = PakHeader::headerSize + uint64_t{entries.size()} * DirectoryRecord::recordSize;
  for (const auto &entry : entries) {
    if (!validateName(entry.name, outError)) {
      return std::nullopt;
    }
    total += entry.data.size();
  }

  // Every offset and the directory size must fit a u32 field
  if (total > std::numeric_limits<uint32_t>::max()) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Archive of {} bytes exceeds the 4 GiB format limit", total));
    return std::nullopt;
  }
  return total;
}

std::optional<std::vector<uint8_t>> encode(std::span<const Entry> entries, Error *outError) {
  auto totalSize = encodedSize(entries, outError);
  if (!totalSize) {
    return std::nullopt;
  }

  std::vector<uint8_t> out(static_cast<size_t>(*totalSize));
  serialize(out, entries);
  return out;
}

bool encodeFile(const std::filesystem::path &path, std::span<const Entry> entries,
                Error *outError) {
  auto totalSize = encodedSize(entries, outError);
  if (!totalSize) {
    return false;
  }

  // Build the archive beside the destination and only replace `path` once it is complete
  TemporaryFile temp(path);

  // Header is always present, so the mapping is never empty
  MappedFile outputFile;
  if (!outputFile.openWrite(temp.path(), static_cast<size_t>(*totalSize), outError)) {
    return false;
  }

  serialize(outputFile.data(), entries);

  if (!outputFile.flush(outError)) {
    return false;
  }
  outputFile.close();

  return temp.commit(outError);
}

std::vector<uint32_t> canonicalOffsets(std::span<const Entry> entries) {
  std::vector<uint32_t> offsets;
  offsets.reserve(entries.size());
  uint64_t pos = PakHeader::headerSize + uint64_t{entries.size()} * DirectoryRecord::recordSize;
  for (const auto &entry : entries) {
    offsets.push_back(static_cast<uint32_t>(pos));
    pos += entry.data.size();
  }
  return offsets;
}

} // namespace pakx
