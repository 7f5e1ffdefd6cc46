#include "docsync/util/file_watcher.hpp"

#include <spdlog/spdlog.h>

namespace docsync::util {

PollingFileWatcher::PollingFileWatcher(std::vector<std::filesystem::path> paths,
                                       std::chrono::milliseconds interval,
                                       Callback callback)
    : paths_(std::move(paths)), interval_(interval), callback_(std::move(callback)) {
  signatures_.reserve(paths_.size());
  for (const auto& path : paths_) {
    signatures_.push_back(sample(path));
  }
}

PollingFileWatcher::~PollingFileWatcher() {
  stop();
}

PollingFileWatcher::Signature PollingFileWatcher::sample(const std::filesystem::path& path) {
  Signature signature;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return signature;
  }
  signature.exists = true;
  signature.size = std::filesystem::file_size(path, ec);
  if (ec) signature.size = 0;
  signature.mtime = std::filesystem::last_write_time(path, ec);
  if (ec) signature.mtime = {};
  return signature;
}

Result<void> PollingFileWatcher::start() {
  if (thread_) {
    return {};
  }
  if (interval_ <= std::chrono::milliseconds::zero()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Watch interval must be positive"));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::make_unique<std::thread>(&PollingFileWatcher::loop, this);
  spdlog::debug("Watching {} path(s) every {}ms", paths_.size(), interval_.count());
  return {};
}

void PollingFileWatcher::stop() {
  if (!thread_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_->joinable()) {
    thread_->join();
  }
  thread_.reset();
}

size_t PollingFileWatcher::poll() {
  size_t changes = 0;
  for (size_t i = 0; i < paths_.size(); ++i) {
    auto current = sample(paths_[i]);
    if (current == signatures_[i]) {
      continue;
    }
    signatures_[i] = current;
    ++changes;
    spdlog::debug("Detected change in {}", paths_[i].string());
    if (callback_) {
      callback_(paths_[i]);
    }
  }
  return changes;
}

void PollingFileWatcher::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
      break;
    }
    lock.unlock();
    try {
      poll();
    } catch (const std::exception& e) {
      spdlog::error("File watcher callback failed: {}", e.what());
    }
    lock.lock();
  }
}

}  // namespace docsync::util
