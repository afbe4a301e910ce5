#include <filesystem>
#include <iostream>

#include <pakx/pakx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " <archive.pak> <source_file> <entry_name>\n";
    return 1;
  }

  std::filesystem::path archivePath = argv[1];
  pakx::Error error;

  // Start a fresh archive when the target doesn't exist yet
  std::optional<pakx::Archive> archive;
  if (std::filesystem::exists(archivePath)) {
    archive = pakx::Archive::open(archivePath, &error);
    if (!archive) {
      std::cerr << "Error: " << error.message << "\n";
      return 1;
    }
  } else {
    archive = pakx::Archive::create();
  }

  if (!archive->addFile(std::filesystem::path(argv[2]), argv[3], &error)) {
    std::cerr << "Failed to add " << argv[2] << ": " << error.message << "\n";
    return 1;
  }

  if (!archive->write(archivePath, &error)) {
    std::cerr << "Failed to write " << archivePath << ": " << error.message << "\n";
    return 1;
  }

  std::cout << archive->describe() << "\n";
  return 0;
}
