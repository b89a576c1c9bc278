#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace tasktrack::core {

class TaskStore;
class TaskFile;

// Background thread that saves the store every `interval` while it is dirty.
// Running -> Stopping on request_shutdown(), Stopping -> Stopped once the
// worker has finished its last save.
class AutoSaver {
public:
    enum class State {
        Running,
        Stopping,
        Stopped,
    };

    AutoSaver(TaskStore& store,
              const TaskFile& file,
              std::chrono::milliseconds interval,
              bool save_on_stop = true);
    ~AutoSaver();

    AutoSaver(const AutoSaver&) = delete;
    AutoSaver& operator=(const AutoSaver&) = delete;

    void request_shutdown();
    void wait_until_stopped();

    State state() const;

    std::size_t ticks() const;
    std::size_t saves() const;
    std::size_t failed_saves() const;

private:
    void worker_loop();
    void save_if_dirty();

    TaskStore& store_;
    const TaskFile& file_;
    const std::chrono::milliseconds interval_;
    const bool save_on_stop_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Running;
    std::size_t ticks_ = 0;
    std::size_t saves_ = 0;
    std::size_t failed_saves_ = 0;
    std::thread worker_;
};

}
