#include "core/task_store.hpp"

#include <algorithm>
#include <utility>

#include "utils/log.hpp"

namespace tasktrack::core {

TaskRecord TaskStore::create(const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++id_counter_;
    TaskRecord record;
    record.id = id_counter_;
    record.title = title;
    record.completed = false;
    record.created_at = time::Clock::now();
    tasks_.push_back(record);
    touch_locked();
    log::debug("[TaskStore] Created task " + std::to_string(record.id));
    return record;
}

std::vector<TaskRecord> TaskStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

bool TaskStore::update(int id, const std::string& new_title, bool completed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [id](const TaskRecord& t) { return t.id == id; });
    if (it == tasks_.end()) {
        return false;
    }
    if (!new_title.empty()) {
        it->title = new_title;
    }
    it->completed = completed;
    touch_locked();
    log::debug("[TaskStore] Updated task " + std::to_string(id));
    return true;
}

bool TaskStore::remove(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [id](const TaskRecord& t) { return t.id == id; });
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    touch_locked();
    log::debug("[TaskStore] Deleted task " + std::to_string(id));
    return true;
}

bool TaskStore::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_ != saved_revision_;
}

std::size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

int TaskStore::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_counter_;
}

TaskSnapshot TaskStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return TaskSnapshot{tasks_, revision_};
}

bool TaskStore::mark_saved(std::uint64_t revision) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (revision != revision_) {
        return false;
    }
    saved_revision_ = revision;
    return true;
}

void TaskStore::replace_all(std::vector<TaskRecord> tasks) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_ = std::move(tasks);
    ++revision_;
    saved_revision_ = revision_;
}

void TaskStore::reserve_ids_through(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_counter_ = std::max(id_counter_, id);
}

void TaskStore::touch_locked() {
    ++revision_;
}

}
