#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace tasktrack::core {
class TaskStore;
class AutoSaver;
}

namespace tasktrack::shell {

// Menu loop over a line-oriented stream. Store calls are made between
// prompts, so no store lock is held while waiting for input.
class InteractiveShell {
public:
    InteractiveShell(core::TaskStore& store,
                     core::AutoSaver& saver,
                     std::istream& in,
                     std::ostream& out);

    // Runs until the Exit choice or end of input, then stops the auto-saver
    // and waits for it. Returns the process exit code.
    int run();

private:
    void print_menu() const;
    std::optional<std::string> prompt(const std::string& text) const;
    std::optional<int> prompt_id(const std::string& text) const;

    void create_task();
    void list_tasks() const;
    void update_task();
    void delete_task();
    void shutdown();

    core::TaskStore& store_;
    core::AutoSaver& saver_;
    std::istream& in_;
    std::ostream& out_;
};

}
