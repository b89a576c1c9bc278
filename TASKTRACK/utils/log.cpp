#include "log.hpp"

#include <chrono>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

tasktrack::log::Level& global_level() {
    static tasktrack::log::Level lvl = tasktrack::log::Level::Info;
    return lvl;
}

std::once_flag& env_init_flag() {
    static std::once_flag f;
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool truthy(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

void init_from_env() {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (const char* v = std::getenv("TASKTRACK_LOG_LEVEL")) {
        global_level() = tasktrack::log::parse_level(v).value_or(tasktrack::log::Level::Info);
    }

    const char* file = std::getenv("TASKTRACK_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (truthy(std::getenv("TASKTRACK_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

void init_from_env_once() {
    std::call_once(env_init_flag(), init_from_env);
}

void log_line_impl(tasktrack::log::Level level, const std::string& message) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    if (static_cast<int>(level) > static_cast<int>(global_level())) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << '[' << tasktrack::log::level_name(level) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';
    const std::string line = ss.str();
    std::ostream& os = (level == tasktrack::log::Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace tasktrack::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    return global_level();
}

std::optional<Level> parse_level(std::string_view text) {
    std::string lower(text);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

}
