#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/task.hpp"

namespace tasktrack::core {

class TaskStore;

enum class LoadResult {
    Loaded,
    Missing,
    Failed,
};

const char* to_string(LoadResult result);

// JSON file holding the whole task list. The id counter is not written.
class TaskFile {
public:
    explicit TaskFile(std::filesystem::path path, int indent = 2);

    const std::filesystem::path& path() const { return path_; }

    // Snapshot under the store lock, write outside it, then mark the snapshot
    // revision as saved. Returns false on any I/O error; the store stays dirty.
    bool save(TaskStore& store) const;

    // Missing is the normal first-run case. On Failed the store is untouched
    // and, if given, *error receives the reason.
    LoadResult load(TaskStore& store, std::string* error = nullptr) const;

private:
    bool read_tasks(std::vector<TaskRecord>& out, std::string& error) const;

    std::filesystem::path path_;
    int indent_ = 2;
};

}
