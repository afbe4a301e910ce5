#include <iostream>

#include <pakx/pakx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.pak>\n";
    return 1;
  }

  pakx::Error error;
  auto archive = pakx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error (" << pakx::toString(error.code) << "): " << error.message << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Files: " << archive->fileCount() << " (" << archive->totalDataSize()
            << " bytes)\n\n";

  for (const auto &file : archive->files()) {
    std::cout << "  " << file.name << " (" << file.size << " bytes @ " << file.offset << ")\n";
  }

  return 0;
}
