#include "petrel/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "petrel/log.hpp"

namespace petrel {

namespace {

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    case File::OpenMode::WriteTruncate:
      return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

int CreateFileBaseFd(const char* path, File::OpenMode mode) {
  static constexpr mode_t kCreateMode = 0644;
  const int fd = ::open(path, Flags(mode), kCreateMode);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    return BaseFd::kClosedFd;
  }
  return fd;
}

}  // namespace

File::File(const char* path, OpenMode mode) : _fd(CreateFileBaseFd(path, mode)) {}

std::size_t File::size() const {
  struct stat st{};
  if (_fd && ::fstat(_fd.fd(), &st) == 0) {
    return static_cast<std::uint64_t>(st.st_size);
  }
  throw std::runtime_error("File::size failed");
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::runtime_error("File is not opened");
  }

  std::string content;
  content.reserve(size());

  constexpr std::size_t kBufSize = 8192;
  for (;;) {
    const std::size_t oldSize = content.size();

    // We capture lastRead to inspect the result after the non-throwing lambda.
    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize,
                                 [this, oldSize, &lastRead](char* data, [[maybe_unused]] std::size_t newCap) {
                                   lastRead = ::read(_fd.fd(), data + oldSize, kBufSize);
                                   if (lastRead > 0) {
                                     return oldSize + static_cast<std::size_t>(lastRead);
                                   }
                                   // On EOF or error, return oldSize to indicate no progress.
                                   return oldSize;
                                 });

    if (lastRead > 0) {
      continue;
    }
    if (lastRead == 0) {
      break;  // EOF
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("Unable to read file (fd {}): errno {}: {}", _fd.fd(), errno, std::strerror(errno));
    throw std::runtime_error("File::loadAllContent read error");
  }

  return content;
}

bool File::writeAll(std::string_view data) const {
  if (!_fd) {
    return false;
  }
  while (!data.empty()) {
    const auto nbWritten = ::write(_fd.fd(), data.data(), data.size());
    if (nbWritten < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("Unable to write file (fd {}): errno {}: {}", _fd.fd(), errno, std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
  return true;
}

}  // namespace petrel
