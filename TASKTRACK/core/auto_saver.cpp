#include "core/auto_saver.hpp"

#include <string>

#include "core/task_file.hpp"
#include "core/task_store.hpp"
#include "utils/log.hpp"

namespace tasktrack::core {

AutoSaver::AutoSaver(TaskStore& store,
                     const TaskFile& file,
                     std::chrono::milliseconds interval,
                     bool save_on_stop)
    : store_(store),
      file_(file),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      save_on_stop_(save_on_stop),
      worker_([this]() { this->worker_loop(); }) {}

AutoSaver::~AutoSaver() {
    request_shutdown();
    wait_until_stopped();
}

void AutoSaver::request_shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Running) {
            return;
        }
        state_ = State::Stopping;
    }
    cv_.notify_all();
}

void AutoSaver::wait_until_stopped() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return state_ == State::Stopped; });
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

AutoSaver::State AutoSaver::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t AutoSaver::ticks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

std::size_t AutoSaver::saves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

std::size_t AutoSaver::failed_saves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_saves_;
}

void AutoSaver::worker_loop() {
    log::info("[AutoSaver] Started; interval " + std::to_string(interval_.count()) + " ms");
    auto next_tick = std::chrono::steady_clock::now() + interval_;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (cv_.wait_until(lock, next_tick, [this]() { return state_ != State::Running; })) {
            break;
        }
        ++ticks_;

        lock.unlock();
        save_if_dirty();
        lock.lock();

        // Ticks missed while a save overran are dropped.
        const auto now = std::chrono::steady_clock::now();
        next_tick += interval_;
        while (next_tick <= now) {
            next_tick += interval_;
        }
    }
    lock.unlock();

    if (save_on_stop_) {
        save_if_dirty();
    }
    log::info("[AutoSaver] Auto-save stopped.");

    lock.lock();
    state_ = State::Stopped;
    lock.unlock();
    cv_.notify_all();
}

void AutoSaver::save_if_dirty() {
    if (!store_.dirty()) {
        return;
    }
    const bool ok = file_.save(store_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) {
            ++saves_;
        } else {
            ++failed_saves_;
        }
    }
    if (!ok) {
        log::error("[AutoSaver] Error saving file '" + file_.path().string() + "'; will retry on the next tick");
    }
}

}
