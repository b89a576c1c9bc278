#include "utils/app_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/string_utils.hpp"

namespace tasktrack {
namespace {
constexpr const char* kDefaultDataFile = "todos.json";
constexpr int kDefaultIntervalSeconds = 10;
constexpr int kMinIntervalSeconds = 1;
constexpr int kMaxIntervalSeconds = 86400;
constexpr int kMinIndent = -1;
constexpr int kMaxIndent = 8;

bool truthy(std::string_view v) {
    const std::string lower = strings::to_lower_copy(std::string(v));
    return lower == "1" || lower == "y" || lower == "yes" || lower == "t" || lower == "true" || lower == "on";
}
}

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.data_file = kDefaultDataFile;
    config.autosave_interval = std::chrono::seconds(kDefaultIntervalSeconds);
    config.json_indent = 2;
    config.restore_id_counter = false;
    config.save_on_exit = true;
    config.log_level = log::Level::Warn;
    return config;
}

AppConfig AppConfig::from_json(const nlohmann::json* obj) {
    AppConfig config = defaults();
    if (!obj || !obj->is_object()) {
        return config;
    }
    if (obj->contains("data_file") && (*obj)["data_file"].is_string()) {
        const std::string file = (*obj)["data_file"].get<std::string>();
        if (!file.empty()) {
            config.data_file = file;
        }
    }
    if (obj->contains("autosave_interval_seconds") && (*obj)["autosave_interval_seconds"].is_number_integer()) {
        config.autosave_interval = std::chrono::seconds((*obj)["autosave_interval_seconds"].get<long long>());
    }
    if (obj->contains("json_indent") && (*obj)["json_indent"].is_number_integer()) {
        config.json_indent = (*obj)["json_indent"].get<int>();
    }
    if (obj->contains("restore_id_counter") && (*obj)["restore_id_counter"].is_boolean()) {
        config.restore_id_counter = (*obj)["restore_id_counter"].get<bool>();
    }
    if (obj->contains("save_on_exit") && (*obj)["save_on_exit"].is_boolean()) {
        config.save_on_exit = (*obj)["save_on_exit"].get<bool>();
    }
    if (obj->contains("log_level") && (*obj)["log_level"].is_string()) {
        config.log_level = log::parse_level((*obj)["log_level"].get<std::string>()).value_or(config.log_level);
    }
    config.clamp();
    return config;
}

AppConfig AppConfig::load_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        log::warn("[AppConfig] Cannot open config file '" + path.string() + "'; using defaults");
        return defaults();
    }
    nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        log::warn("[AppConfig] Config file '" + path.string() + "' is not valid JSON; using defaults");
        return defaults();
    }
    return from_json(&parsed);
}

void AppConfig::clamp() {
    const auto secs = static_cast<int>(std::clamp<std::chrono::seconds::rep>(
        autosave_interval.count(), kMinIntervalSeconds, kMaxIntervalSeconds));
    autosave_interval = std::chrono::seconds(secs);
    json_indent = std::clamp(json_indent, kMinIndent, kMaxIndent);
    if (data_file.empty()) {
        data_file = kDefaultDataFile;
    }
}

void AppConfig::apply_to_json(nlohmann::json& obj) const {
    if (!obj.is_object()) {
        obj = nlohmann::json::object();
    }
    obj["data_file"] = data_file.string();
    obj["autosave_interval_seconds"] = autosave_interval.count();
    obj["json_indent"] = json_indent;
    obj["restore_id_counter"] = restore_id_counter;
    obj["save_on_exit"] = save_on_exit;
    obj["log_level"] = strings::to_lower_copy(log::level_name(log_level));
}

void AppConfig::apply_env() {
    if (const char* v = std::getenv("TASKTRACK_FILE")) {
        if (*v) {
            data_file = v;
        }
    }
    if (const char* v = std::getenv("TASKTRACK_AUTOSAVE_SECONDS")) {
        if (auto secs = strings::parse_int(strings::trim_copy(v))) {
            autosave_interval = std::chrono::seconds(*secs);
        } else {
            log::warn(std::string("[AppConfig] Ignoring TASKTRACK_AUTOSAVE_SECONDS='") + v + "'");
        }
    }
    if (const char* v = std::getenv("TASKTRACK_RESTORE_IDS")) {
        restore_id_counter = truthy(v);
    }
    if (const char* v = std::getenv("TASKTRACK_LOG_LEVEL")) {
        log_level = log::parse_level(v).value_or(log_level);
    }
    clamp();
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options]\n"
           "  --file PATH           task file (default: todos.json)\n"
           "  --interval SECONDS    auto-save interval (default: 10)\n"
           "  --config PATH         JSON config file\n"
           "  --log-level LEVEL     error|warn|info|debug\n"
           "  --restore-ids         continue ids after the largest loaded id\n"
           "  --no-save-on-exit     skip the final save at exit\n"
           "  -h, --help            show this help\n";
}

std::optional<CommandLine> parse_command_line(int argc, const char* const* argv, std::ostream& err) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }

    auto value_after = [&](std::size_t& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            err << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return args[++i];
    };

    // The config file sits underneath the environment and the other flags.
    std::optional<std::filesystem::path> config_path;
    if (const char* v = std::getenv("TASKTRACK_CONFIG")) {
        if (*v) {
            config_path = v;
        }
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            auto value = value_after(i, args[i]);
            if (!value) {
                return std::nullopt;
            }
            config_path = *value;
        }
    }

    CommandLine result;
    result.config = config_path ? AppConfig::load_file(*config_path) : AppConfig::defaults();
    result.config.apply_env();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--file") {
            auto value = value_after(i, arg);
            if (!value) {
                return std::nullopt;
            }
            if (value->empty()) {
                err << "--file needs a non-empty path\n";
                return std::nullopt;
            }
            result.config.data_file = *value;
        } else if (arg == "--interval") {
            auto value = value_after(i, arg);
            if (!value) {
                return std::nullopt;
            }
            const auto secs = strings::parse_int(*value);
            if (!secs || *secs < kMinIntervalSeconds || *secs > kMaxIntervalSeconds) {
                err << "Invalid --interval '" << *value << "' (expected " << kMinIntervalSeconds
                    << ".." << kMaxIntervalSeconds << " seconds)\n";
                return std::nullopt;
            }
            result.config.autosave_interval = std::chrono::seconds(*secs);
        } else if (arg == "--log-level") {
            auto value = value_after(i, arg);
            if (!value) {
                return std::nullopt;
            }
            const auto level = log::parse_level(*value);
            if (!level) {
                err << "Invalid --log-level '" << *value << "'\n";
                return std::nullopt;
            }
            result.config.log_level = *level;
        } else if (arg == "--restore-ids") {
            result.config.restore_id_counter = true;
        } else if (arg == "--no-save-on-exit") {
            result.config.save_on_exit = false;
        } else {
            err << "Unknown option '" << arg << "'\n";
            return std::nullopt;
        }
    }
    result.config.clamp();
    return result;
}

}
