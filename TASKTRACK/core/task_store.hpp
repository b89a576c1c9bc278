#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "core/task.hpp"

namespace tasktrack::core {

struct TaskSnapshot {
    std::vector<TaskRecord> tasks;
    std::uint64_t revision = 0;
};

// In-memory task list shared by the shell and the auto-saver. Every public
// member takes the one store mutex for its whole duration.
class TaskStore {
public:
    TaskStore() = default;

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    TaskRecord create(const std::string& title);
    std::vector<TaskRecord> list() const;

    // Empty new_title keeps the current title; completed is always written.
    // Returns false when no task has the id.
    bool update(int id, const std::string& new_title, bool completed);
    bool remove(int id);

    bool dirty() const;
    std::size_t size() const;
    int last_id() const;

    TaskSnapshot snapshot() const;

    // Clears the dirty flag only if nothing changed since the snapshot with
    // this revision was taken.
    bool mark_saved(std::uint64_t revision);

    // Replaces the whole list with persisted state. The id counter is left
    // alone, so it does not follow the loaded ids.
    void replace_all(std::vector<TaskRecord> tasks);

    // Raises the id counter to at least `id`. Never lowers it.
    void reserve_ids_through(int id);

private:
    void touch_locked();

    mutable std::mutex mutex_;
    std::vector<TaskRecord> tasks_;
    int id_counter_ = 0;
    std::uint64_t revision_ = 0;
    std::uint64_t saved_revision_ = 0;
};

}
