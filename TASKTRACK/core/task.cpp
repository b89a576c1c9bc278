#include "core/task.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

namespace tasktrack::core {
namespace {
// Files written by earlier tools store an unset creation time as year 1.
constexpr const char* kUnsetTimestamp = "0001-01-01T00:00:00Z";
}

bool operator==(const TaskRecord& a, const TaskRecord& b) {
    return a.id == b.id && a.title == b.title && a.completed == b.completed && a.created_at == b.created_at;
}

bool operator!=(const TaskRecord& a, const TaskRecord& b) {
    return !(a == b);
}

void to_json(nlohmann::json& j, const TaskRecord& task) {
    j = nlohmann::json{
        {"id", task.id},
        {"title", task.title},
        {"completed", task.completed},
        {"created_at", time::format_rfc3339(task.created_at)},
    };
}

void from_json(const nlohmann::json& j, TaskRecord& task) {
    j.at("id").get_to(task.id);
    j.at("title").get_to(task.title);
    task.completed = j.value("completed", false);

    task.created_at = time::TimePoint{};
    auto it = j.find("created_at");
    if (it == j.end() || it->is_null()) {
        return;
    }
    const std::string text = it->get<std::string>();
    if (text == kUnsetTimestamp) {
        return;
    }
    const auto parsed = time::parse_rfc3339(text);
    if (!parsed) {
        throw std::invalid_argument("invalid created_at timestamp '" + text + "'");
    }
    task.created_at = *parsed;
}

}
