#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace pakx {

// How extract() maps an entry name onto the destination
enum class ExtractMode {
  Flat,   // Write the data to exactly the destination path
  Nested, // Treat the destination as a root directory and recreate the name's subdirectories
};

// In-memory PAK archive: an ordered list of entries that own their data.
//
// Entry names are not required to be unique. addFile() does not check for
// duplicates; findFile() and removeFile() always act on the first match in
// directory order, so a later duplicate is shadowed until the first one is removed.
//
// Offsets stored on entries are informational. write() and encode() lay the data
// out again from scratch.
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Open existing PAK archive from disk
  static std::optional<Archive> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Decode an archive image already held in memory
  static std::optional<Archive> fromBuffer(std::span<const uint8_t> buffer,
                                           Error *outError = nullptr);

  // Create new, empty archive
  static Archive create();

  // Append an entry from memory. Fails with NameTooLong/InvalidName for names that
  // don't fit a directory record (empty names included)
  bool addFile(std::span<const uint8_t> data, const std::string &name, Error *outError = nullptr);

  // Append an entry read from a file on disk
  bool addFile(const std::filesystem::path &sourcePath, const std::string &name,
               Error *outError = nullptr);

  // Remove the first entry named exactly `name`. NotFound leaves the archive untouched
  bool removeFile(const std::string &name, Error *outError = nullptr);

  // Exact, case-sensitive lookup. Returns nullptr (NotFound) if no entry matches.
  // The pointer is invalidated by any later add/remove.
  const Entry *findFile(const std::string &name, Error *outError = nullptr) const;

  // Write an entry's data to disk, returning the path actually written
  std::optional<std::filesystem::path> extract(const Entry &entry,
                                               const std::filesystem::path &destPath,
                                               ExtractMode mode = ExtractMode::Flat,
                                               Error *outError = nullptr) const;

  std::optional<std::filesystem::path> extract(const std::string &name,
                                               const std::filesystem::path &destPath,
                                               ExtractMode mode = ExtractMode::Flat,
                                               Error *outError = nullptr) const;

  // Extract every entry below destDir, recreating subdirectories. Stops at the first failure
  bool extractAll(const std::filesystem::path &destDir, Error *outError = nullptr) const;

  std::vector<uint8_t> extractToMemory(const Entry &entry) const { return entry.data; }

  // Serialize to a PAK image
  std::optional<std::vector<uint8_t>> encode(Error *outError = nullptr) const;

  // Write archive to disk. On success entry offsets are updated to where the data
  // now lives and destPath becomes the archive's source path
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  const std::vector<Entry> &files() const { return entries_; }

  size_t fileCount() const { return entries_.size(); }

  // Sum of all entry sizes
  uint64_t totalDataSize() const;

  // Path the archive was opened from or last written to, empty for in-memory archives
  const std::filesystem::path &sourcePath() const { return sourcePath_; }

  // Short human-readable summary, e.g. "<pak archive 'pak0.pak' with 3 files>"
  std::string describe() const;

  // Remove all entries
  void clear();

private:
  std::vector<Entry> entries_;
  std::filesystem::path sourcePath_;
};

} // namespace pakx
