#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "utils/timestamp.hpp"

namespace tasktrack::core {

struct TaskRecord {
    int id = 0;
    std::string title;
    bool completed = false;
    time::TimePoint created_at{};
};

bool operator==(const TaskRecord& a, const TaskRecord& b);
bool operator!=(const TaskRecord& a, const TaskRecord& b);

// from_json throws nlohmann::json::exception on a missing or mistyped field and
// std::invalid_argument on an unparsable created_at.
void to_json(nlohmann::json& j, const TaskRecord& task);
void from_json(const nlohmann::json& j, TaskRecord& task);

}
