#include "core/task_file.hpp"

#include <SDL_log.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/task_store.hpp"
#include "utils/log.hpp"

namespace tasktrack::core {
namespace {

void log_error(const std::string& message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", message.c_str());
}

void log_info(const std::string& message) {
    SDL_Log("%s", message.c_str());
}

// Writes `<path>.tmp` and renames it over `path`, keeping the permissions of
// an existing target.
bool write_file(const std::filesystem::path& path,
                const std::string& payload,
                std::ostream& error_sink) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error_sink << "[TaskFile] Failed to create parent directory for '" << path.string() << "': " << ec.message();
            return false;
        }
    }

    const std::filesystem::path tmp_full = path.string() + ".tmp";

    std::filesystem::perms target_perms = std::filesystem::perms::unknown;
    const bool target_exists = std::filesystem::exists(path, ec);
    if (!ec && target_exists) {
        target_perms = std::filesystem::status(path, ec).permissions();
    }
    ec.clear();

    {
        std::ofstream out(tmp_full, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error_sink << "[TaskFile] Failed to open temp file '" << tmp_full.string() << "' for writing";
            return false;
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            error_sink << "[TaskFile] Stream error while writing temp '" << tmp_full.string() << "'";
            out.close();
            std::filesystem::remove(tmp_full, ec);
            return false;
        }
    }

    if (target_perms != std::filesystem::perms::unknown) {
        std::filesystem::permissions(tmp_full, target_perms, ec);
        ec.clear();
    }

    std::filesystem::rename(tmp_full, path, ec);
    if (ec) {
        error_sink << "[TaskFile] rename('" << tmp_full.string() << "' -> '" << path.string() << "') failed: " << ec.message();
        std::error_code remove_ec;
        std::filesystem::remove(tmp_full, remove_ec);
        return false;
    }
    return true;
}

}

const char* to_string(LoadResult result) {
    switch (result) {
        case LoadResult::Loaded:  return "loaded";
        case LoadResult::Missing: return "missing";
        case LoadResult::Failed:  return "failed";
        default:                  return "unknown";
    }
}

TaskFile::TaskFile(std::filesystem::path path, int indent)
    : path_(std::move(path)), indent_(indent) {}

bool TaskFile::save(TaskStore& store) const {
    TaskSnapshot snap = store.snapshot();

    std::string payload;
    try {
        payload = nlohmann::json(snap.tasks).dump(indent_, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        log_error(std::string("[TaskFile] Failed to serialize tasks: ") + e.what());
        return false;
    }
    payload += '\n';

    std::ostringstream errors;
    if (!write_file(path_, payload, errors)) {
        log_error(errors.str());
        return false;
    }

    if (!store.mark_saved(snap.revision)) {
        log::debug("[TaskFile] Store changed during save; keeping dirty flag");
    }
    log_info("[TaskFile] Saved " + std::to_string(snap.tasks.size()) + " task(s) to '" + path_.string() + "'");
    return true;
}

LoadResult TaskFile::load(TaskStore& store, std::string* error) const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            const std::string message = "exists(" + path_.string() + ") failed: " + ec.message();
            log_error("[TaskFile] " + message);
            if (error) *error = message;
            return LoadResult::Failed;
        }
        log::info("[TaskFile] No task file at '" + path_.string() + "'; starting empty");
        return LoadResult::Missing;
    }

    std::vector<TaskRecord> tasks;
    std::string reason;
    if (!read_tasks(tasks, reason)) {
        log_error("[TaskFile] Failed to load '" + path_.string() + "': " + reason);
        if (error) *error = reason;
        return LoadResult::Failed;
    }

    const std::size_t count = tasks.size();
    store.replace_all(std::move(tasks));
    log_info("[TaskFile] Loaded " + std::to_string(count) + " task(s) from '" + path_.string() + "'");
    return LoadResult::Loaded;
}

bool TaskFile::read_tasks(std::vector<TaskRecord>& out, std::string& error) const {
    std::ifstream in(path_);
    if (!in.is_open()) {
        error = "cannot open file for reading";
        return false;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read error";
        return false;
    }

    try {
        const nlohmann::json parsed = nlohmann::json::parse(contents);
        if (parsed.is_null()) {
            out.clear();
            return true;
        }
        if (!parsed.is_array()) {
            error = std::string("expected a JSON array, found ") + parsed.type_name();
            return false;
        }
        out = parsed.get<std::vector<TaskRecord>>();
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    return true;
}

}
