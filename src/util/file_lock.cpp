#include "docsync/util/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "docsync/util/filesystem.hpp"

namespace docsync::util {

Result<FileLock> FileLock::tryAcquire(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    auto dir_result = FileSystem::createDirectories(path.parent_path());
    if (!dir_result.has_value()) {
      return std::unexpected(dir_result.error());
    }
  }

  int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot open lock file " + path.string() + ": " +
                                     std::strerror(errno)));
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int error = errno;
    ::close(fd);
    if (error == EWOULDBLOCK) {
      return std::unexpected(makeError(ErrorCode::kInvalidState,
                                       "A sync pass is already running for this workspace (" +
                                       path.string() + ")"));
    }
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot lock " + path.string() + ": " + std::strerror(error)));
  }

  spdlog::debug("Acquired lock {}", path.string());
  return FileLock(path, fd);
}

FileLock::FileLock(std::filesystem::path path, int fd)
    : path_(std::move(path)), fd_(fd) {}

FileLock::FileLock(FileLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

FileLock::~FileLock() {
  release();
}

void FileLock::release() {
  if (fd_ < 0) {
    return;
  }
  // Closing the descriptor drops the flock
  ::close(fd_);
  fd_ = -1;
  spdlog::debug("Released lock {}", path_.string());
}

}  // namespace docsync::util
