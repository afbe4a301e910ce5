#include <format>
#include <utility>

#include <pakx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace pakx {

namespace {

#ifdef _WIN32
std::string lastErrorText() {
  return std::format("error: {}", GetLastError());
}
#else
std::string lastErrorText() {
  return std::format("errno {}: {}", errno, std::strerror(errno));
}
#endif

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  cleanup();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      writable_(std::exchange(other.writable_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    cleanup();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

  auto fail = [&](const char *what) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("{}: {} ({})", what, path.string(), lastErrorText()));
    cleanup();
    return false;
  };

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail("Failed to open archive for reading");
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    return fail("Failed to get archive size");
  }
  if (fileSize.QuadPart == 0) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Cannot map empty file: {}", path.string()));
    cleanup();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    return fail("Failed to create file mapping");
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    return fail("Failed to map view of file");
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    return fail("Failed to open archive for reading");
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    return fail("Failed to get archive size");
  }
  if (st.st_size == 0) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Cannot map empty file: {}", path.string()));
    cleanup();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);

  void *mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    return fail("Failed to map archive");
  }
  data_ = mapped;
#endif

  writable_ = false;
  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    detail::setError(outError, ErrorCode::IoFailure, "Cannot create file mapping with zero size");
    return false;
  }

  auto fail = [&](const char *what) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("{}: {} ({})", what, path.string(), lastErrorText()));
    cleanup();
    return false;
  };

  size_ = size;

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail("Failed to create archive for writing");
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    return fail("Failed to set archive size");
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (!mappingHandle_) {
    return fail("Failed to create file mapping");
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  if (!data_) {
    return fail("Failed to map view of file");
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    return fail("Failed to create archive for writing");
  }

#ifdef __APPLE__
  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    return fail("Failed to set archive size");
  }
#else
  // Reserve real blocks so a full disk fails here instead of faulting on a store into the map
  if (int rc = posix_fallocate(fd_, 0, static_cast<off_t>(size)); rc != 0) {
    errno = rc;
    return fail("Failed to allocate archive space");
  }
#endif

  void *mapped = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (mapped == MAP_FAILED) {
    return fail("Failed to map archive");
  }
  data_ = mapped;
#endif

  writable_ = true;
  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    detail::setError(outError, ErrorCode::IoFailure, "Cannot flush: file not open or not writable");
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to flush mapped archive ({})", lastErrorText()));
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    detail::setError(outError, ErrorCode::IoFailure,
                     std::format("Failed to sync mapped archive ({})", lastErrorText()));
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
#ifdef _WIN32
  if (data_) {
    UnmapViewOfFile(data_);
  }
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
  data_ = nullptr;
  size_ = 0;
  writable_ = false;
}

} // namespace pakx
