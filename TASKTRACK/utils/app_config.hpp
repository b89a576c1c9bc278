#pragma once

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "utils/log.hpp"

namespace tasktrack {

struct AppConfig {
    std::filesystem::path data_file;
    std::chrono::seconds autosave_interval{0};
    int json_indent = 2;
    bool restore_id_counter = false;
    bool save_on_exit = true;
    log::Level log_level = log::Level::Warn;

    static AppConfig defaults();
    static AppConfig from_json(const nlohmann::json* obj);

    // Reads a JSON config file over defaults(). A missing or malformed file
    // logs a warning and yields defaults().
    static AppConfig load_file(const std::filesystem::path& path);

    void clamp();
    void apply_to_json(nlohmann::json& obj) const;

    // TASKTRACK_FILE, TASKTRACK_AUTOSAVE_SECONDS, TASKTRACK_RESTORE_IDS,
    // TASKTRACK_LOG_LEVEL.
    void apply_env();
};

struct CommandLine {
    AppConfig config;
    bool show_help = false;
};

// defaults < --config/TASKTRACK_CONFIG file < environment < arguments.
// Returns nullopt and writes a diagnostic to `err` on a bad argument.
std::optional<CommandLine> parse_command_line(int argc, const char* const* argv, std::ostream& err);

void print_usage(std::ostream& out, const std::string& program);

}
