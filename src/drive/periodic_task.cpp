#include "drive/periodic_task.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace tgdrive {

PeriodicTask::PeriodicTask(std::string name, Job job, Config config)
    : name_(std::move(name)), job_(std::move(job)), config_(config) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    spdlog::info("PeriodicTask[{}]: starting (every {}s)", name_, config_.interval.count() / 1000);
    worker_ = std::thread([this]() { loop(); });
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("PeriodicTask[{}]: stopping", name_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

void PeriodicTask::trigger() {
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = true;
    cv_.notify_one();
}

void PeriodicTask::loop() {
    spdlog::debug("PeriodicTask[{}]: loop started", name_);

    if (config_.run_immediately && running_.load()) {
        run_once();
    }

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, config_.interval, [this]() { return !running_.load() || triggered_; });
            triggered_ = false;
        }

        if (!running_.load()) {
            break;
        }
        run_once();
    }

    spdlog::debug("PeriodicTask[{}]: loop stopped", name_);
}

void PeriodicTask::run_once() {
    try {
        job_();
    } catch (const std::exception& e) {
        spdlog::error("PeriodicTask[{}]: run failed: {}", name_, e.what());
    }
    ++run_count_;
}

}  // namespace tgdrive
