#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "docsync/sync/trigger_coordinator.hpp"
#include "test_helpers.hpp"

using namespace docsync;
using namespace docsync::sync;
using namespace std::chrono_literals;

namespace {

// Holds passes open until released
class Gate {
 public:
  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return open_; });
  }

  void waitUntilEntered() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, 2s, [this] { return entered_; });
  }

  void open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  bool entered_ = false;
};

CoordinatorOptions quietOptions() {
  CoordinatorOptions options;
  options.startup_enabled = false;
  options.interval_enabled = false;
  options.change_enabled = false;
  return options;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

}  // namespace

class TriggerCoordinatorTest : public ::testing::Test {
 protected:
  TriggerCoordinator::PassRunner countingRunner() {
    return [this](TriggerSource source) {
      std::lock_guard<std::mutex> lock(mutex_);
      sources_.push_back(source);
      return SyncOutcome{};
    };
  }

  std::vector<TriggerSource> sources() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_;
  }

  std::mutex mutex_;
  std::vector<TriggerSource> sources_;
};

TEST_F(TriggerCoordinatorTest, StartRequiresRunner) {
  TriggerCoordinator coordinator(nullptr, quietOptions());
  EXPECT_ERROR(coordinator.start(), ErrorCode::kInvalidArgument);
  EXPECT_FALSE(coordinator.isRunning());
}

TEST_F(TriggerCoordinatorTest, StartRejectsNonPositiveInterval) {
  auto options = quietOptions();
  options.interval_enabled = true;
  options.interval = 0ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  EXPECT_ERROR(coordinator.start(), ErrorCode::kInvalidArgument);
}

TEST_F(TriggerCoordinatorTest, TriggerIgnoredWhenStopped) {
  TriggerCoordinator coordinator(countingRunner(), quietOptions());
  EXPECT_FALSE(coordinator.trigger(TriggerSource::kManual));
  EXPECT_EQ(coordinator.state(), CoordinatorState::kIdle);
}

TEST_F(TriggerCoordinatorTest, StartupCheckRunsOnce) {
  auto options = quietOptions();
  options.startup_enabled = true;
  options.startup_delay = 10ms;
  TriggerCoordinator coordinator(countingRunner(), options);

  ASSERT_OK(coordinator.start());
  ASSERT_TRUE(eventually([&] { return sources().size() == 1; }));
  ASSERT_TRUE(coordinator.waitForIdle(2s));

  // Restart keeps the startup check from repeating
  ASSERT_OK(coordinator.restart(options));
  std::this_thread::sleep_for(60ms);
  coordinator.stop();

  ASSERT_EQ(sources().size(), 1u);
  EXPECT_EQ(sources()[0], TriggerSource::kStartup);
}

TEST_F(TriggerCoordinatorTest, ManualTriggerRunsOnWorker) {
  TriggerCoordinator coordinator(countingRunner(), quietOptions());
  ASSERT_OK(coordinator.start());

  EXPECT_TRUE(coordinator.trigger(TriggerSource::kManual));
  ASSERT_TRUE(coordinator.waitForIdle(2s));

  EXPECT_EQ(sources(), std::vector<TriggerSource>{TriggerSource::kManual});
  auto stats = coordinator.stats();
  EXPECT_EQ(stats.started, 1u);
  EXPECT_EQ(stats.completed, 1u);
  EXPECT_EQ(stats.failed, 0u);
}

TEST_F(TriggerCoordinatorTest, TriggersWhileBusyAreDropped) {
  Gate gate;
  std::atomic<int> passes{0};
  TriggerCoordinator coordinator(
      [&](TriggerSource) {
        ++passes;
        gate.wait();
        return SyncOutcome{};
      },
      quietOptions());
  ASSERT_OK(coordinator.start());

  ASSERT_TRUE(coordinator.trigger(TriggerSource::kManual));
  gate.waitUntilEntered();

  EXPECT_EQ(coordinator.state(), CoordinatorState::kSyncRunning);
  ASSERT_TRUE(coordinator.session().has_value());
  EXPECT_EQ(coordinator.session()->source, TriggerSource::kManual);

  EXPECT_FALSE(coordinator.trigger(TriggerSource::kInterval));
  EXPECT_FALSE(coordinator.trigger(TriggerSource::kChange));

  gate.open();
  ASSERT_TRUE(coordinator.waitForIdle(2s));
  coordinator.stop();

  EXPECT_EQ(passes.load(), 1);
  EXPECT_EQ(coordinator.stats().dropped, 2u);
  EXPECT_EQ(coordinator.state(), CoordinatorState::kIdle);
}

TEST_F(TriggerCoordinatorTest, ChangesAreDebounced) {
  auto options = quietOptions();
  options.change_enabled = true;
  options.debounce = 80ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  ASSERT_OK(coordinator.start());

  for (int i = 0; i < 5; ++i) {
    coordinator.notifyChanged();
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_TRUE(eventually([&] { return sources().size() == 1; }));
  std::this_thread::sleep_for(150ms);
  coordinator.stop();

  EXPECT_EQ(sources(), std::vector<TriggerSource>{TriggerSource::kChange});
}

TEST_F(TriggerCoordinatorTest, ChangesIgnoredWhenDisabled) {
  TriggerCoordinator coordinator(countingRunner(), quietOptions());
  ASSERT_OK(coordinator.start());
  coordinator.notifyChanged();
  std::this_thread::sleep_for(50ms);
  coordinator.stop();
  EXPECT_TRUE(sources().empty());
}

TEST_F(TriggerCoordinatorTest, IntervalRepeats) {
  auto options = quietOptions();
  options.interval_enabled = true;
  options.interval = 20ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  ASSERT_OK(coordinator.start());

  ASSERT_TRUE(eventually([&] { return sources().size() >= 3; }));
  coordinator.stop();

  for (auto source : sources()) {
    EXPECT_EQ(source, TriggerSource::kInterval);
  }
}

TEST_F(TriggerCoordinatorTest, FailedPassReturnsToIdle) {
  TriggerCoordinator coordinator(
      [](TriggerSource) -> SyncOutcome { throw std::runtime_error("boom"); },
      quietOptions());
  std::optional<SyncOutcome> seen;
  std::mutex seen_mutex;
  coordinator.setOutcomeListener([&](TriggerSource, const SyncOutcome& outcome) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    seen = outcome;
  });
  ASSERT_OK(coordinator.start());

  ASSERT_TRUE(coordinator.trigger(TriggerSource::kManual));
  ASSERT_TRUE(coordinator.waitForIdle(2s));
  coordinator.stop();

  EXPECT_EQ(coordinator.state(), CoordinatorState::kIdle);
  EXPECT_EQ(coordinator.stats().failed, 1u);
  std::lock_guard<std::mutex> lock(seen_mutex);
  ASSERT_TRUE(seen.has_value());
  ASSERT_FALSE(seen->ok());
  EXPECT_EQ(seen->error->code(), ErrorCode::kUnknownError);
}

TEST_F(TriggerCoordinatorTest, ListenerSeesTriggerSource) {
  TriggerCoordinator coordinator(countingRunner(), quietOptions());
  std::vector<TriggerSource> notified;
  std::mutex notified_mutex;
  coordinator.setOutcomeListener([&](TriggerSource source, const SyncOutcome&) {
    std::lock_guard<std::mutex> lock(notified_mutex);
    notified.push_back(source);
  });
  ASSERT_OK(coordinator.start());
  ASSERT_TRUE(coordinator.trigger(TriggerSource::kManual));
  ASSERT_TRUE(coordinator.waitForIdle(2s));
  coordinator.stop();

  std::lock_guard<std::mutex> lock(notified_mutex);
  EXPECT_EQ(notified, std::vector<TriggerSource>{TriggerSource::kManual});
}

TEST_F(TriggerCoordinatorTest, RestartAppliesNewOptions) {
  TriggerCoordinator coordinator(countingRunner(), quietOptions());
  ASSERT_OK(coordinator.start());

  auto options = quietOptions();
  options.change_enabled = true;
  options.debounce = 10ms;
  ASSERT_OK(coordinator.restart(options));
  EXPECT_TRUE(coordinator.isRunning());
  EXPECT_TRUE(coordinator.options().change_enabled);

  coordinator.notifyChanged();
  ASSERT_TRUE(eventually([&] { return sources().size() == 1; }));
  coordinator.stop();
}

TEST_F(TriggerCoordinatorTest, RestartWithEqualOptionsKeepsPendingChange) {
  auto options = quietOptions();
  options.change_enabled = true;
  options.debounce = 100ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  ASSERT_OK(coordinator.start());

  coordinator.notifyChanged();
  ASSERT_OK(coordinator.restart(options));
  EXPECT_TRUE(coordinator.isRunning());

  ASSERT_TRUE(eventually([&] { return sources().size() == 1; }));
  std::this_thread::sleep_for(200ms);
  coordinator.stop();

  EXPECT_EQ(sources(), std::vector<TriggerSource>{TriggerSource::kChange});
}

TEST_F(TriggerCoordinatorTest, RestartWithNewOptionsKeepsPendingChange) {
  auto options = quietOptions();
  options.change_enabled = true;
  options.debounce = 100ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  ASSERT_OK(coordinator.start());

  coordinator.notifyChanged();
  auto updated = options;
  updated.interval_enabled = true;
  updated.interval = std::chrono::minutes(60);
  ASSERT_OK(coordinator.restart(updated));
  EXPECT_EQ(coordinator.options(), updated);

  ASSERT_TRUE(eventually([&] { return sources().size() == 1; }));
  std::this_thread::sleep_for(200ms);
  coordinator.stop();

  EXPECT_EQ(sources(), std::vector<TriggerSource>{TriggerSource::kChange});
}

TEST_F(TriggerCoordinatorTest, RestartDropsPendingChangeWhenDisabled) {
  auto options = quietOptions();
  options.change_enabled = true;
  options.debounce = 50ms;
  TriggerCoordinator coordinator(countingRunner(), options);
  ASSERT_OK(coordinator.start());

  coordinator.notifyChanged();
  ASSERT_OK(coordinator.restart(quietOptions()));
  std::this_thread::sleep_for(150ms);
  coordinator.stop();

  EXPECT_TRUE(sources().empty());
}

TEST(CoordinatorOptionsTest, Equality) {
  CoordinatorOptions a;
  CoordinatorOptions b;
  EXPECT_EQ(a, b);
  b.debounce = 10ms;
  EXPECT_NE(a, b);
}

TEST(CoordinatorOptionsTest, FromConfig) {
  config::Config config;
  config.sync.auto_check_on_start = false;
  config.sync.startup_delay_ms = 500;
  config.sync.interval_minutes = 5;
  config.sync.change_enabled = false;
  config.sync.debounce_ms = 750;

  auto options = CoordinatorOptions::fromConfig(config);
  EXPECT_FALSE(options.startup_enabled);
  EXPECT_EQ(options.startup_delay, 500ms);
  EXPECT_TRUE(options.interval_enabled);
  EXPECT_EQ(options.interval, std::chrono::minutes(5));
  EXPECT_FALSE(options.change_enabled);
  EXPECT_EQ(options.debounce, 750ms);
}

TEST(TriggerSourceTest, Names) {
  EXPECT_EQ(toString(TriggerSource::kStartup), "startup");
  EXPECT_EQ(toString(TriggerSource::kInterval), "interval");
  EXPECT_EQ(toString(TriggerSource::kChange), "change");
  EXPECT_EQ(toString(TriggerSource::kManual), "manual");
}
