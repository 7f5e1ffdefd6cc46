#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "docsync/common.hpp"

namespace docsync::util {

// Atomic filesystem operations with safety guarantees
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  // Write content to temporary file beside the target
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

  const std::filesystem::path& tempPath() const { return temp_path_; }

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename; creates missing parent directories
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file with error handling
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Read file if it exists; nullopt when it does not
  static Result<std::optional<std::string>> readFileIfExists(const std::filesystem::path& path);

  // Create directory tree
  static Result<void> createDirectories(const std::filesystem::path& path);
};

}  // namespace docsync::util
