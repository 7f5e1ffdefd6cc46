#pragma once

#include <filesystem>

#include "docsync/common.hpp"

namespace docsync::util {

/**
 * @brief Exclusive advisory lock on a file, held for the object's lifetime.
 *
 * Uses flock(2), so the lock is visible to other processes and to other
 * FileLock instances in the same process. The lock file is left in place on
 * release.
 */
class FileLock {
 public:
  // Non-blocking; kInvalidState when another holder owns the lock
  static Result<FileLock> tryAcquire(const std::filesystem::path& path);

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;
  ~FileLock();

  const std::filesystem::path& path() const { return path_; }
  bool held() const { return fd_ >= 0; }

  void release();

 private:
  FileLock(std::filesystem::path path, int fd);

  std::filesystem::path path_;
  int fd_ = -1;
};

}  // namespace docsync::util
