#include "docsync/sync/trigger_coordinator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace docsync::sync {

std::string_view toString(TriggerSource source) {
    switch (source) {
        case TriggerSource::kStartup: return "startup";
        case TriggerSource::kInterval: return "interval";
        case TriggerSource::kChange: return "change";
        case TriggerSource::kManual: return "manual";
    }
    return "unknown";
}

CoordinatorOptions CoordinatorOptions::fromConfig(const config::Config& config) {
    CoordinatorOptions options;
    options.startup_enabled = config.sync.auto_check_on_start;
    options.startup_delay = std::chrono::milliseconds(config.sync.startup_delay_ms);
    options.interval_enabled = config.sync.interval_enabled;
    options.interval = std::chrono::minutes(config.sync.interval_minutes);
    options.change_enabled = config.sync.change_enabled;
    options.debounce = std::chrono::milliseconds(config.sync.debounce_ms);
    return options;
}

TriggerCoordinator::TriggerCoordinator(PassRunner runner, CoordinatorOptions options)
    : runner_(std::move(runner)), options_(options) {}

TriggerCoordinator::~TriggerCoordinator() {
    stop();
}

Result<void> TriggerCoordinator::start() {
    CoordinatorOptions active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return {}; // Already running
        }
        if (!runner_) {
            return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                             "Trigger coordinator has no pass runner"));
        }
        if (options_.interval_enabled && options_.interval <= std::chrono::milliseconds::zero()) {
            return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                             "Sync interval must be positive"));
        }
        if (options_.debounce < std::chrono::milliseconds::zero() ||
            options_.startup_delay < std::chrono::milliseconds::zero()) {
            return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                             "Trigger delays must not be negative"));
        }

        const auto now = SteadyClock::now();
        if (options_.startup_enabled && !startup_fired_) {
            startup_deadline_ = now + options_.startup_delay;
        }
        if (options_.interval_enabled) {
            interval_deadline_ = now + options_.interval;
        }

        stopping_ = false;
        running_ = true;
        active = options_;
    }

    worker_thread_ = std::make_unique<std::thread>(&TriggerCoordinator::workerLoop, this);
    scheduler_thread_ = std::make_unique<std::thread>(&TriggerCoordinator::schedulerLoop, this);

    spdlog::info("Trigger coordinator started (startup: {}, interval: {}, change: {})",
                 active.startup_enabled, active.interval_enabled, active.change_enabled);
    return {};
}

void TriggerCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    scheduler_cv_.notify_all();
    worker_cv_.notify_all();

    if (scheduler_thread_ && scheduler_thread_->joinable()) {
        scheduler_thread_->join();
    }
    scheduler_thread_.reset();
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A queued-but-unstarted pass owns the session; discard both
        if (!intake_.empty()) {
            intake_.clear();
            session_.reset();
        }
        startup_deadline_.reset();
        interval_deadline_.reset();
        change_deadline_.reset();
        running_ = false;
        stopping_ = false;
    }
    idle_cv_.notify_all();

    spdlog::info("Trigger coordinator stopped");
}

bool TriggerCoordinator::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

Result<void> TriggerCoordinator::restart(CoordinatorOptions options) {
    std::optional<SteadyClock::time_point> pending_change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ && options_ == options) {
            spdlog::debug("Trigger options unchanged; keeping current schedule");
            return {};
        }
        pending_change = change_deadline_;
    }

    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options_ = options;
        if (pending_change && options_.change_enabled) {
            change_deadline_ = pending_change;
        }
    }
    spdlog::debug("Trigger coordinator restarting with new options");
    return start();
}

void TriggerCoordinator::notifyChanged() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_ || !options_.change_enabled) {
            return;
        }
        change_deadline_ = SteadyClock::now() + options_.debounce;
    }
    scheduler_cv_.notify_all();
}

bool TriggerCoordinator::trigger(TriggerSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
        spdlog::debug("Ignoring {} trigger: coordinator not running", toString(source));
        return false;
    }
    return fireLocked(source);
}

bool TriggerCoordinator::fireLocked(TriggerSource source) {
    if (session_.has_value()) {
        ++stats_.dropped;
        spdlog::info("Dropped {} trigger: {} pass already active",
                     toString(source), toString(session_->source));
        return false;
    }
    session_ = SyncSession{source, SteadyClock::now()};
    intake_.push_back(source);
    worker_cv_.notify_one();
    return true;
}

void TriggerCoordinator::setOutcomeListener(OutcomeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

CoordinatorState TriggerCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value() ? CoordinatorState::kSyncRunning : CoordinatorState::kIdle;
}

std::optional<SyncSession> TriggerCoordinator::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

CoordinatorStats TriggerCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

CoordinatorOptions TriggerCoordinator::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

bool TriggerCoordinator::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return !session_.has_value() && intake_.empty();
    });
}

void TriggerCoordinator::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        std::optional<SteadyClock::time_point> next;
        for (const auto& deadline : {startup_deadline_, interval_deadline_, change_deadline_}) {
            if (deadline && (!next || *deadline < *next)) {
                next = deadline;
            }
        }

        if (!next) {
            scheduler_cv_.wait(lock);
            continue;
        }
        if (SteadyClock::now() < *next) {
            scheduler_cv_.wait_until(lock, *next);
            continue;
        }

        const auto now = SteadyClock::now();
        if (startup_deadline_ && *startup_deadline_ <= now) {
            startup_deadline_.reset();
            startup_fired_ = true;
            fireLocked(TriggerSource::kStartup);
        }
        if (interval_deadline_ && *interval_deadline_ <= now) {
            interval_deadline_ = now + options_.interval;
            fireLocked(TriggerSource::kInterval);
        }
        if (change_deadline_ && *change_deadline_ <= now) {
            change_deadline_.reset();
            fireLocked(TriggerSource::kChange);
        }
    }
}

void TriggerCoordinator::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        worker_cv_.wait(lock, [this] { return stopping_ || !intake_.empty(); });
        if (stopping_) {
            break;
        }

        const TriggerSource source = intake_.front();
        intake_.pop_front();
        PassRunner runner = runner_;
        lock.unlock();

        auto outcome = runPass(runner, source);
        if (!outcome.ok()) {
            spdlog::warn("{} sync pass failed: {}", toString(source), outcome.error->message());
        }
        finishSession(source, outcome);

        lock.lock();
    }
}

SyncOutcome TriggerCoordinator::runPass(const PassRunner& runner, TriggerSource source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.started;
    }
    spdlog::debug("Sync pass started ({})", toString(source));

    try {
        return runner(source);
    } catch (const std::exception& e) {
        spdlog::error("Sync pass ({}) threw: {}", toString(source), e.what());
        SyncOutcome outcome;
        outcome.error = makeError(ErrorCode::kUnknownError, e.what());
        return outcome;
    }
}

void TriggerCoordinator::finishSession(TriggerSource source, const SyncOutcome& outcome) {
    OutcomeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }

    if (listener) {
        try {
            listener(source, outcome);
        } catch (const std::exception& e) {
            spdlog::error("Outcome listener threw: {}", e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
        if (outcome.ok()) {
            ++stats_.completed;
        } else {
            ++stats_.failed;
        }
    }
    idle_cv_.notify_all();

    spdlog::debug("Sync pass finished ({}): {}", toString(source), toString(outcome.action));
}

} // namespace docsync::sync
