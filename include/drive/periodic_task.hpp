#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tgdrive {

/// Configuration for PeriodicTask
struct PeriodicTaskConfig {
    std::chrono::milliseconds interval{std::chrono::minutes(30)};
    bool run_immediately{false};  // First run at start() instead of after one interval
};

/// Background worker running one job on a fixed interval
///
/// stop() wakes the worker and waits for an in-flight run to finish. Errors
/// thrown by the job are logged and the schedule carries on.
class PeriodicTask {
public:
    using Config = PeriodicTaskConfig;
    using Job = std::function<void()>;

    PeriodicTask(std::string name, Job job, Config config = {});
    ~PeriodicTask();

    // Disable copy
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start background thread
    void start();

    /// Stop and join thread
    void stop();

    /// Run the job on the worker without waiting for the interval
    void trigger();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /// Completed runs, successful or not
    [[nodiscard]] uint64_t run_count() const { return run_count_.load(); }

private:
    /// Main loop (runs in background thread)
    void loop();

    void run_once();

    std::string name_;
    Job job_;
    Config config_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};
    bool triggered_{false};
    std::condition_variable cv_;
    std::mutex mutex_;
};

}  // namespace tgdrive
