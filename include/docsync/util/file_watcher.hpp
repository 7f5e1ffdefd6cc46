#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "docsync/common.hpp"

namespace docsync::util {

// Polls a fixed set of paths and reports creation, modification and removal
class PollingFileWatcher {
 public:
  using Callback = std::function<void(const std::filesystem::path& changed)>;

  PollingFileWatcher(std::vector<std::filesystem::path> paths,
                     std::chrono::milliseconds interval,
                     Callback callback);
  ~PollingFileWatcher();

  PollingFileWatcher(const PollingFileWatcher&) = delete;
  PollingFileWatcher& operator=(const PollingFileWatcher&) = delete;

  Result<void> start();
  void stop();

  // One synchronous scan; invokes the callback for every changed path.
  // Returns the number of changes seen.
  size_t poll();

  const std::vector<std::filesystem::path>& paths() const { return paths_; }

 private:
  struct Signature {
    bool exists = false;
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime{};

    bool operator==(const Signature&) const = default;
  };

  static Signature sample(const std::filesystem::path& path);
  void loop();

  std::vector<std::filesystem::path> paths_;
  std::vector<Signature> signatures_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::unique_ptr<std::thread> thread_;
};

}  // namespace docsync::util
