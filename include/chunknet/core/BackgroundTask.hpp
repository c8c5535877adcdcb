#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace chunknet::core {

// Runs `work` every `interval` on its own thread until stop(). The first run happens one
// interval after start(). stop() wakes the thread immediately and joins it.
class BackgroundTask {
public:
    using Work = std::function<void()>;

    BackgroundTask(std::string name, std::chrono::milliseconds interval, Work work);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    void start();
    void stop();
    bool running() const;

    // Executes one iteration on the calling thread.
    void run_once();

    const std::string& name() const noexcept { return name_; }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    Work work_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_{false};
    std::thread thread_;
};

}  // namespace chunknet::core
