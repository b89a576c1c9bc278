#include <SDL_log.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/auto_saver.hpp"
#include "core/task_file.hpp"
#include "core/task_store.hpp"
#include "shell/interactive_shell.hpp"
#include "utils/app_config.hpp"
#include "utils/log.hpp"

namespace {

SDL_LogPriority sdl_priority_for(tasktrack::log::Level level) {
    switch (level) {
        case tasktrack::log::Level::Error: return SDL_LOG_PRIORITY_ERROR;
        case tasktrack::log::Level::Warn:  return SDL_LOG_PRIORITY_WARN;
        case tasktrack::log::Level::Info:  return SDL_LOG_PRIORITY_INFO;
        case tasktrack::log::Level::Debug: return SDL_LOG_PRIORITY_DEBUG;
        default:                           return SDL_LOG_PRIORITY_INFO;
    }
}

void restore_id_counter(tasktrack::core::TaskStore& store) {
    int max_id = 0;
    for (const auto& task : store.list()) {
        max_id = std::max(max_id, task.id);
    }
    store.reserve_ids_through(max_id);
    tasktrack::log::info("[Main] Id counter restored to " + std::to_string(store.last_id()));
}

}

int main(int argc, char* argv[]) {
    const std::string program = (argc > 0 && argv[0]) ? argv[0] : "tasktrack";
    auto command_line = tasktrack::parse_command_line(argc, argv, std::cerr);
    if (!command_line) {
        tasktrack::print_usage(std::cerr, program);
        return 1;
    }
    if (command_line->show_help) {
        tasktrack::print_usage(std::cout, program);
        return 0;
    }

    const tasktrack::AppConfig& config = command_line->config;
    tasktrack::log::set_level(config.log_level);
    tasktrack::log::reset_time_origin();
    SDL_LogSetAllPriority(sdl_priority_for(config.log_level));
    tasktrack::log::info("[Main] Starting tasktrack with '" + config.data_file.string() + "'");
    if (tasktrack::log::level() == tasktrack::log::Level::Debug) {
        nlohmann::json effective;
        config.apply_to_json(effective);
        tasktrack::log::debug("[Main] Effective config: " + effective.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    tasktrack::core::TaskStore store;
    tasktrack::core::TaskFile file(config.data_file, config.json_indent);

    std::string load_error;
    const tasktrack::core::LoadResult load_result = file.load(store, &load_error);
    tasktrack::log::info(std::string("[Main] Task file ") + tasktrack::core::to_string(load_result));
    switch (load_result) {
        case tasktrack::core::LoadResult::Loaded:
            std::cout << "To-Do list loaded from file.\n";
            if (config.restore_id_counter) {
                restore_id_counter(store);
            }
            break;
        case tasktrack::core::LoadResult::Missing:
            break;
        case tasktrack::core::LoadResult::Failed:
            std::cout << "Error loading file: " << load_error << "\n";
            break;
    }

    tasktrack::core::AutoSaver saver(
        store, file,
        std::chrono::duration_cast<std::chrono::milliseconds>(config.autosave_interval),
        config.save_on_exit);

    tasktrack::shell::InteractiveShell shell(store, saver, std::cin, std::cout);
    const int exit_code = shell.run();

    tasktrack::log::info("[Main] tasktrack exited cleanly.");
    return exit_code;
}
