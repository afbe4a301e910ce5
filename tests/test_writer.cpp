#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <pakx/endian.hpp>
#include <pakx/reader.hpp>
#include <pakx/writer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class WriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "pakx_test_writer";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  static pakx::Entry makeEntry(const std::string &name, const std::string &content,
                               uint32_t offset = 0) {
    pakx::Entry entry;
    entry.name = name;
    entry.offset = offset;
    entry.size = static_cast<uint32_t>(content.size());
    entry.data.assign(content.begin(), content.end());
    return entry;
  }

  static std::vector<uint8_t> readAll(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
  }

  fs::path tempDir_;
};

TEST_F(WriterTest, EmptyArchiveIsHeaderOnly) {
  std::vector<pakx::Entry> entries;

  pakx::Error error;
  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;
  ASSERT_EQ(image->size(), 12u);

  EXPECT_EQ(std::string(image->begin(), image->begin() + 4), "PACK");
  EXPECT_EQ(pakx::loadLE32(image->data() + 4), 12u);
  EXPECT_EQ(pakx::loadLE32(image->data() + 8), 0u);

  auto decoded = pakx::decode(*image, &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  EXPECT_TRUE(decoded->empty());
}

TEST_F(WriterTest, SingleEntryLayout) {
  std::vector<pakx::Entry> entries = {makeEntry("a.txt", "hello")};

  pakx::Error error;
  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;
  ASSERT_EQ(image->size(), 81u);

  // Header
  EXPECT_EQ(std::string(image->begin(), image->begin() + 4), "PACK");
  EXPECT_EQ(std::memcmp(image->data(), pakx::PakHeader::magic, sizeof(pakx::PakHeader::magic)), 0);
  EXPECT_EQ(pakx::loadLE32(image->data() + 4), 12u);
  EXPECT_EQ(pakx::loadLE32(image->data() + 8), 64u);

  // Directory record: name zero-padded through byte 56, then offset and size
  const uint8_t *record = image->data() + 12;
  EXPECT_EQ(std::string(reinterpret_cast<const char *>(record)), "a.txt");
  for (size_t i = 5; i < 56; ++i) {
    EXPECT_EQ(record[i], 0) << "Padding byte " << i << " not zero";
  }
  EXPECT_EQ(pakx::loadLE32(record + 56), 76u);
  EXPECT_EQ(pakx::loadLE32(record + 60), 5u);

  EXPECT_EQ(std::string(image->begin() + 76, image->end()), "hello");
}

TEST_F(WriterTest, OffsetsAreRecomputed) {
  // Caller-supplied offsets are stale on purpose
  std::vector<pakx::Entry> entries = {makeEntry("file1.txt", "Content 1", 9999),
                                      makeEntry("file2.txt", "Content 22", 1),
                                      makeEntry("file3.txt", "", 77)};

  pakx::Error error;
  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;

  const uint32_t dataStart = 12 + 3 * 64;
  EXPECT_EQ(pakx::loadLE32(image->data() + 12 + 56), dataStart);
  EXPECT_EQ(pakx::loadLE32(image->data() + 12 + 64 + 56), dataStart + 9);
  EXPECT_EQ(pakx::loadLE32(image->data() + 12 + 128 + 56), dataStart + 19);
  EXPECT_EQ(image->size(), dataStart + 19);

  EXPECT_EQ(pakx::canonicalOffsets(entries),
            (std::vector<uint32_t>{dataStart, dataStart + 9, dataStart + 19}));
}

TEST_F(WriterTest, SizeComesFromData) {
  auto entry = makeEntry("stale.txt", "abcdef");
  entry.size = 2;
  std::vector<pakx::Entry> entries = {entry};

  pakx::Error error;
  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;
  EXPECT_EQ(pakx::loadLE32(image->data() + 12 + 60), 6u);
  EXPECT_EQ(image->size(), 12u + 64u + 6u);
}

TEST_F(WriterTest, RoundTripPreservesEntries) {
  std::string binary("\x00\x01\x02\xff special", 12);
  std::vector<pakx::Entry> entries = {makeEntry("maps/e1m1.bsp", "BSP29"),
                                      makeEntry("progs\\player.mdl", binary),
                                      makeEntry("maps/e1m1.bsp", "duplicate"),
                                      makeEntry("empty.cfg", "")};

  pakx::Error error;
  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;

  auto decoded = pakx::decode(*image, &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  ASSERT_EQ(decoded->size(), entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ((*decoded)[i].name, entries[i].name);
    EXPECT_EQ((*decoded)[i].size, entries[i].data.size());
    EXPECT_EQ((*decoded)[i].data, entries[i].data);
  }
}

TEST_F(WriterTest, ReencodeIsByteIdentical) {
  std::vector<pakx::Entry> entries = {makeEntry("gfx/palette.lmp", std::string(768, '\x7f'), 5),
                                      makeEntry("default.cfg", "bind w +forward\n", 3)};

  pakx::Error error;
  auto first = pakx::encode(entries, &error);
  ASSERT_TRUE(first.has_value()) << error.message;

  auto decoded = pakx::decode(*first, &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;

  auto second = pakx::encode(*decoded, &error);
  ASSERT_TRUE(second.has_value()) << error.message;
  EXPECT_EQ(*first, *second);
}

TEST_F(WriterTest, NameLengthBoundary) {
  pakx::Error error;
  EXPECT_TRUE(pakx::validateName(std::string(55, 'x'), &error)) << error.message;

  EXPECT_FALSE(pakx::validateName(std::string(56, 'x'), &error));
  EXPECT_EQ(error.code, pakx::ErrorCode::NameTooLong);
}

TEST_F(WriterTest, RejectsEmbeddedNul) {
  std::string name("maps/", 5);
  name.push_back('\0');
  name += "e1m1.bsp";

  pakx::Error error;
  EXPECT_FALSE(pakx::validateName(name, &error));
  EXPECT_EQ(error.code, pakx::ErrorCode::InvalidName);
}

TEST_F(WriterTest, EncodeFailsOnLongNameWithoutOutput) {
  std::vector<pakx::Entry> entries = {makeEntry("ok.txt", "1"),
                                      makeEntry(std::string(60, 'y'), "2")};

  pakx::Error error;
  EXPECT_FALSE(pakx::encode(entries, &error).has_value());
  EXPECT_EQ(error.code, pakx::ErrorCode::NameTooLong);

  fs::path archivePath = tempDir_ / "never.pak";
  EXPECT_FALSE(pakx::encodeFile(archivePath, entries, &error));
  EXPECT_EQ(error.code, pakx::ErrorCode::NameTooLong);
  EXPECT_FALSE(fs::exists(archivePath));
}

TEST_F(WriterTest, EncodedSize) {
  std::vector<pakx::Entry> entries = {makeEntry("a", "123"), makeEntry("b", "4567")};

  pakx::Error error;
  auto size = pakx::encodedSize(entries, &error);
  ASSERT_TRUE(size.has_value()) << error.message;
  EXPECT_EQ(*size, 12u + 128u + 7u);
}

TEST_F(WriterTest, EncodeFileMatchesEncode) {
  std::vector<pakx::Entry> entries = {makeEntry("sound/misc/null.wav", "RIFF"),
                                      makeEntry("maps/start.bsp", "BSP29 data")};

  pakx::Error error;
  fs::path archivePath = tempDir_ / "pak1.pak";
  ASSERT_TRUE(pakx::encodeFile(archivePath, entries, &error)) << error.message;

  auto image = pakx::encode(entries, &error);
  ASSERT_TRUE(image.has_value()) << error.message;
  EXPECT_EQ(readAll(archivePath), *image);

  auto decoded = pakx::decodeFile(archivePath, &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  ASSERT_EQ(decoded->size(), 2u);
  EXPECT_EQ((*decoded)[1].name, "maps/start.bsp");
}

TEST_F(WriterTest, EncodeFileEmptyArchive) {
  std::vector<pakx::Entry> entries;

  pakx::Error error;
  fs::path archivePath = tempDir_ / "empty.pak";
  ASSERT_TRUE(pakx::encodeFile(archivePath, entries, &error)) << error.message;
  EXPECT_EQ(fs::file_size(archivePath), 12u);
}

TEST_F(WriterTest, EncodeFileReplacesExistingFile) {
  fs::path archivePath = tempDir_ / "pak0.pak";
  {
    std::ofstream old(archivePath, std::ios::binary);
    old << std::string(4096, 'z');
  }

  std::vector<pakx::Entry> entries = {makeEntry("a.txt", "hello")};
  pakx::Error error;
  ASSERT_TRUE(pakx::encodeFile(archivePath, entries, &error)) << error.message;

  EXPECT_EQ(fs::file_size(archivePath), 81u);
  EXPECT_FALSE(fs::exists(tempDir_ / "pak0.pak.tmp"));
}

TEST_F(WriterTest, EncodeFileIntoMissingDirectory) {
  std::vector<pakx::Entry> entries = {makeEntry("a.txt", "hello")};

  pakx::Error error;
  EXPECT_FALSE(pakx::encodeFile(tempDir_ / "missing" / "out.pak", entries, &error));
  EXPECT_EQ(error.code, pakx::ErrorCode::IoFailure);
}
