#include "chunknet/core/BackgroundTask.hpp"

#include "chunknet/logging/StructuredLogger.hpp"

#include <exception>
#include <utility>

namespace chunknet::core {

BackgroundTask::BackgroundTask(std::string name, std::chrono::milliseconds interval, Work work)
    : name_(std::move(name)), interval_(interval), work_(std::move(work)) {}

BackgroundTask::~BackgroundTask() {
    stop();
}

void BackgroundTask::start() {
    std::scoped_lock lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&BackgroundTask::loop, this);
}

void BackgroundTask::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool BackgroundTask::running() const {
    std::scoped_lock lock(mutex_);
    return running_;
}

void BackgroundTask::run_once() {
    try {
        work_();
    } catch (const std::exception& ex) {
        logging::StructuredLogger::instance().log(logging::StructuredLogger::Level::Error,
                                                  name_,
                                                  "task.iteration_failed",
                                                  {{"error", ex.what()}});
    }
}

void BackgroundTask::loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        run_once();
        lock.lock();
    }
}

}  // namespace chunknet::core
