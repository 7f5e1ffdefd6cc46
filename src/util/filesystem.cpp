#include "docsync/util/filesystem.hpp"

#include <fstream>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace docsync::util {

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  // The temp file lives beside the target so the rename stays on one filesystem
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    auto dir_result = FileSystem::createDirectories(parent);
    if (!dir_result.has_value()) {
      return dir_result;
    }
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    file.close();
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Operation cancelled"));
  }

  auto parent = target_path_.parent_path();

  // Sync the temporary file
  int fd = open(temp_path_.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory to ensure rename is persistent
  if (!parent.empty()) {
    int dir_fd = open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      fsync(dir_fd);
      close(dir_fd);
    }
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + path.string()));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }

  return content;
}

Result<std::optional<std::string>> FileSystem::readFileIfExists(const std::filesystem::path& path) {
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot stat " + path.string() + ": " + ec.message()));
  }
  if (!exists) {
    return std::optional<std::string>{};
  }

  auto content = readFile(path);
  if (!content.has_value()) {
    // The file existed a moment ago; failing to open it now is a read error
    return std::unexpected(makeError(ErrorCode::kFileReadError, content.error().message()));
  }
  return std::optional<std::string>(std::move(*content));
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories " + path.string() + ": " + ec.message()));
  }

  return {};
}

}  // namespace docsync::util
