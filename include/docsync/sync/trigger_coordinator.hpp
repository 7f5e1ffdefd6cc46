#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

#include "docsync/common.hpp"
#include "docsync/config/config.hpp"
#include "docsync/sync/sync_types.hpp"

namespace docsync::sync {

enum class TriggerSource {
    kStartup,
    kInterval,
    kChange,
    kManual
};

std::string_view toString(TriggerSource source);

enum class CoordinatorState {
    kIdle,
    kSyncRunning
};

// Mutual-exclusion token; exists while a pass is queued or running
struct SyncSession {
    TriggerSource source;
    std::chrono::steady_clock::time_point started_at;
};

struct CoordinatorOptions {
    bool startup_enabled = true;
    std::chrono::milliseconds startup_delay{2000};
    bool interval_enabled = true;
    std::chrono::milliseconds interval{std::chrono::minutes(30)};
    bool change_enabled = true;
    std::chrono::milliseconds debounce{2000};

    static CoordinatorOptions fromConfig(const config::Config& config);

    bool operator==(const CoordinatorOptions&) const = default;
};

struct CoordinatorStats {
    std::uint64_t started = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;
    std::uint64_t dropped = 0;
};

/**
 * @brief Serializes every reconciliation pass behind one Idle/SyncRunning flag.
 *
 * A scheduler thread owns the startup, interval and debounced change timers
 * and feeds a single intake slot consumed by one worker thread. A trigger
 * that fires while a session exists is dropped and counted, never queued.
 * The flag returns to Idle after every pass, including failed ones.
 */
class TriggerCoordinator {
public:
    using PassRunner = std::function<SyncOutcome(TriggerSource)>;
    using OutcomeListener = std::function<void(TriggerSource, const SyncOutcome&)>;

    TriggerCoordinator(PassRunner runner, CoordinatorOptions options);
    ~TriggerCoordinator();

    TriggerCoordinator(const TriggerCoordinator&) = delete;
    TriggerCoordinator& operator=(const TriggerCoordinator&) = delete;

    // Start/stop background triggers. stop() waits for an in-flight pass.
    Result<void> start();
    void stop();
    bool isRunning() const;

    // Apply new options. A no-op when running with equal options; otherwise timers
    // are rescheduled, a pending change trigger is kept and startup is not repeated.
    Result<void> restart(CoordinatorOptions options);

    // Local artifact changed; debounced into one kChange trigger
    void notifyChanged();

    // Fire a trigger now on the worker. Returns false when dropped.
    bool trigger(TriggerSource source);

    void setOutcomeListener(OutcomeListener listener);

    CoordinatorState state() const;
    std::optional<SyncSession> session() const;
    CoordinatorStats stats() const;
    CoordinatorOptions options() const;

    // Blocks until no pass is queued or running, or the timeout expires
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    using SteadyClock = std::chrono::steady_clock;

    void schedulerLoop();
    void workerLoop();

    // Requires mutex_ held
    bool fireLocked(TriggerSource source);

    SyncOutcome runPass(const PassRunner& runner, TriggerSource source);
    void finishSession(TriggerSource source, const SyncOutcome& outcome);

    PassRunner runner_;
    OutcomeListener listener_;
    CoordinatorOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable scheduler_cv_;
    std::condition_variable worker_cv_;
    std::condition_variable idle_cv_;

    bool running_ = false;
    bool stopping_ = false;
    bool startup_fired_ = false;

    std::optional<SyncSession> session_;
    std::deque<TriggerSource> intake_;
    CoordinatorStats stats_;

    std::optional<SteadyClock::time_point> startup_deadline_;
    std::optional<SteadyClock::time_point> interval_deadline_;
    std::optional<SteadyClock::time_point> change_deadline_;

    std::unique_ptr<std::thread> scheduler_thread_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace docsync::sync
