#include <algorithm>
#include <format>
#include <fstream>
#include <numeric>
#include <system_error>

#include <pakx/archive.hpp>
#include <pakx/reader.hpp>
#include <pakx/writer.hpp>

namespace pakx {

namespace {

// Map an entry name onto a relative path, refusing anything that could escape destDir
std::optional<std::filesystem::path> nestedPath(const std::string &name, Error *outError) {
  std::filesystem::path relative;
  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find_first_of("/\\", start);
    if (end == std::string::npos) {
      end = name.size();
    }
    std::string component = name.substr(start, end - start);

    if (start == 0 && component.empty() && end < name.size()) {
      detail::setError(outError, ErrorCode::UnsafePath,
                       std::format("Entry name '{}' is an absolute path", name));
      return std::nullopt;
    }
    if (component == ".." || std::filesystem::path(component).has_root_name()) {
      detail::setError(outError, ErrorCode::UnsafePath,
                       std::format("Entry name '{}' escapes the destination directory", name));
      return std::nullopt;
    }
    if (!component.empty() && component != ".") {
      relative /= component;
    }
    start = end + 1;
  }

  if (relative.empty()) {
    detail::setError(outError, ErrorCode::UnsafePath,
                     std::format("Entry name '{}' has no file component", name));
    return std::nullopt;
  }
  return relative;
}

bool checkEntryName(const std::string &name, Error *outError) {
  if (name.empty()) {
    detail::setError(outError, ErrorCode::InvalidName, "Entry name must not be empty");
    return false;
  }
  return validateName(name, outError);
}

bool writeBytes(const std::filesystem::path &destPath, std::span<const uint8_t> data,
                Error *outError) {
  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      detail::setError(outError, ErrorCode::IoFailure,
                       std::format("Failed to create directory {}: {}",
                                   destPath.parent_path().string(), ec.message()));
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  // Buffered bytes only hit the disk on close
  out.close();
  if (!out) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> readBytes(const std::filesystem::path &sourcePath,
                                              Error *outError) {
  std::ifstream inFile(sourcePath, std::ios::binary | std::ios::ate);
  if (!inFile) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to open source file: {}", sourcePath.string()));
    return std::nullopt;
  }

  std::streamoff fileSize = inFile.tellg();
  if (fileSize < 0) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to get size of source file: {}", sourcePath.string()));
    return std::nullopt;
  }
  inFile.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
  if (!inFile.read(reinterpret_cast<char *>(buffer.data()), fileSize)) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to read source file: {}", sourcePath.string()));
    return std::nullopt;
  }
  return buffer;
}

} // namespace

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  auto entries = decodeFile(path, outError);
  if (!entries) {
    return std::nullopt;
  }

  Archive archive;
  archive.entries_ = std::move(*entries);
  archive.sourcePath_ = path;
  return archive;
}

std::optional<Archive> Archive::fromBuffer(std::span<const uint8_t> buffer, Error *outError) {
  auto entries = decode(buffer, outError);
  if (!entries) {
    return std::nullopt;
  }

  Archive archive;
  archive.entries_ = std::move(*entries);
  return archive;
}

Archive Archive::create() {
  return Archive();
}

bool Archive::addFile(std::span<const uint8_t> data, const std::string &name, Error *outError) {
  if (!checkEntryName(name, outError)) {
    return false;
  }

  Entry entry;
  entry.name = name;
  entry.size = static_cast<uint32_t>(data.size());
  entry.data.assign(data.begin(), data.end());
  entries_.push_back(std::move(entry));
  return true;
}

bool Archive::addFile(const std::filesystem::path &sourcePath, const std::string &name,
                      Error *outError) {
  // Check the name before touching the disk
  if (!checkEntryName(name, outError)) {
    return false;
  }

  auto data = readBytes(sourcePath, outError);
  if (!data) {
    return false;
  }
  return addFile(std::span<const uint8_t>(*data), name, outError);
}

bool Archive::removeFile(const std::string &name, Error *outError) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry &entry) { return entry.name == name; });
  if (it == entries_.end()) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("Entry not found in archive: {}", name));
    return false;
  }

  entries_.erase(it);
  return true;
}

const Entry *Archive::findFile(const std::string &name, Error *outError) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry &entry) { return entry.name == name; });
  if (it == entries_.end()) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("Entry not found in archive: {}", name));
    return nullptr;
  }
  return &*it;
}

std::optional<std::filesystem::path> Archive::extract(const Entry &entry,
                                                      const std::filesystem::path &destPath,
                                                      ExtractMode mode, Error *outError) const {
  std::filesystem::path target = destPath;
  if (mode == ExtractMode::Nested) {
    auto relative = nestedPath(entry.name, outError);
    if (!relative) {
      return std::nullopt;
    }
    target = destPath / *relative;
  }

  if (!writeBytes(target, entry.data, outError)) {
    return std::nullopt;
  }
  return target;
}

std::optional<std::filesystem::path> Archive::extract(const std::string &name,
                                                      const std::filesystem::path &destPath,
                                                      ExtractMode mode, Error *outError) const {
  const Entry *entry = findFile(name, outError);
  if (!entry) {
    return std::nullopt;
  }
  return extract(*entry, destPath, mode, outError);
}

bool Archive::extractAll(const std::filesystem::path &destDir, Error *outError) const {
  for (const auto &entry : entries_) {
    if (!extract(entry, destDir, ExtractMode::Nested, outError)) {
      return false;
    }
  }
  return true;
}

std::optional<std::vector<uint8_t>> Archive::encode(Error *outError) const {
  return pakx::encode(entries_, outError);
}

bool Archive::write(const std::filesystem::path &destPath, Error *outError) {
  if (!encodeFile(destPath, entries_, outError)) {
    return false;
  }

  auto offsets = canonicalOffsets(entries_);
  for (size_t i = 0; i < entries_.size(); ++i) {
    entries_[i].offset = offsets[i];
    entries_[i].size = static_cast<uint32_t>(entries_[i].data.size());
  }
  sourcePath_ = destPath;
  return true;
}

uint64_t Archive::totalDataSize() const {
  return std::accumulate(entries_.begin(), entries_.end(), uint64_t{0},
                         [](uint64_t sum, const Entry &entry) { return sum + entry.data.size(); });
}

std::string Archive::describe() const {
  return std::format("<pak archive '{}' with {} files>", sourcePath_.string(), entries_.size());
}

void Archive::clear() {
  entries_.clear();
}

} // namespace pakx
