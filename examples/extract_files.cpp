#include <filesystem>
#include <iostream>

#include <pakx/pakx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.pak> <output_dir> [entry_name]\n";
    return 1;
  }

  pakx::Error error;
  auto archive = pakx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];

  // Single entry: write it flat into the output directory
  if (argc > 3) {
    const auto *entry = archive->findFile(argv[3], &error);
    if (!entry) {
      std::cerr << "Error: " << error.message << "\n";
      return 1;
    }
    std::filesystem::path fileName = std::filesystem::path(entry->name).filename();
    auto written = archive->extract(*entry, outputDir / fileName, pakx::ExtractMode::Flat, &error);
    if (!written) {
      std::cerr << "Failed to extract " << entry->name << ": " << error.message << "\n";
      return 1;
    }
    std::cout << "Extracted " << entry->name << " to " << written->string() << "\n";
    return 0;
  }

  int extractedCount = 0;
  for (const auto &file : archive->files()) {
    if (!archive->extract(file, outputDir, pakx::ExtractMode::Nested, &error)) {
      std::cerr << "Failed to extract " << file.name << ": " << error.message << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " of " << archive->fileCount() << " files to "
            << outputDir << "\n";
  return extractedCount == static_cast<int>(archive->fileCount()) ? 0 : 1;
}
