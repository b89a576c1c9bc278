#include "shell/interactive_shell.hpp"

#include <istream>
#include <ostream>

#include "core/auto_saver.hpp"
#include "core/task_store.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"
#include "utils/timestamp.hpp"

namespace tasktrack::shell {

InteractiveShell::InteractiveShell(core::TaskStore& store,
                                   core::AutoSaver& saver,
                                   std::istream& in,
                                   std::ostream& out)
    : store_(store), saver_(saver), in_(in), out_(out) {}

int InteractiveShell::run() {
    out_ << "Welcome to the Enhanced To-Do Application with Auto-Save!\n"
         << "----------------------------------------------------------\n";

    while (true) {
        print_menu();
        const auto choice = prompt("Please enter your choice (1-5): ");
        if (!choice) {
            log::info("[Shell] End of input; exiting");
            shutdown();
            return 0;
        }

        if (*choice == "1") {
            create_task();
        } else if (*choice == "2") {
            list_tasks();
        } else if (*choice == "3") {
            update_task();
        } else if (*choice == "4") {
            delete_task();
        } else if (*choice == "5") {
            shutdown();
            return 0;
        } else {
            out_ << "⚠️ Invalid choice. Please enter a valid option (1-5).\n";
        }
    }
}

void InteractiveShell::print_menu() const {
    out_ << "\n🔷 MAIN MENU\n"
         << "1️⃣  ➡  Create a New To-Do\n"
         << "2️⃣  ➡  View All To-Dos\n"
         << "3️⃣  ➡  Update an Existing To-Do\n"
         << "4️⃣  ➡  Delete a To-Do\n"
         << "5️⃣  ➡  Exit\n";
}

std::optional<std::string> InteractiveShell::prompt(const std::string& text) const {
    out_ << text;
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return strings::trim_copy(line);
}

std::optional<int> InteractiveShell::prompt_id(const std::string& text) const {
    const auto line = prompt(text);
    if (!line) {
        return std::nullopt;
    }
    const auto id = strings::parse_int(*line);
    if (!id) {
        out_ << "⚠️ Invalid ID. Please enter a numeric value.\n";
    }
    return id;
}

void InteractiveShell::create_task() {
    out_ << "\n📝 CREATE A NEW TO-DO\n";
    const auto title = prompt("Enter the title of the new to-do: ");
    if (!title) {
        return;
    }
    if (title->empty()) {
        out_ << "⚠️ Title cannot be empty. Please try again.\n";
        return;
    }
    const core::TaskRecord task = store_.create(*title);
    out_ << "✅ To-Do created successfully! (ID " << task.id << ")\n";
}

void InteractiveShell::list_tasks() const {
    out_ << "\n📋 VIEW ALL TO-DOS\n";
    const auto tasks = store_.list();
    if (tasks.empty()) {
        out_ << "No To-Dos found.\n";
        return;
    }
    out_ << "\nTo-Do List:\n";
    for (const auto& task : tasks) {
        out_ << "ID: " << task.id
             << " | Title: " << task.title
             << " | Status: " << (task.completed ? "Completed" : "Incomplete")
             << " | Created At: " << time::format_display(task.created_at) << "\n";
    }
}

void InteractiveShell::update_task() {
    out_ << "\n✏️ UPDATE A TO-DO\n";
    const auto id = prompt_id("Enter the ID of the to-do to update: ");
    if (!id) {
        return;
    }
    const auto new_title = prompt("Enter new title (leave empty to keep the current title): ");
    if (!new_title) {
        return;
    }
    const auto completed = prompt("Mark as completed? (yes/no): ");
    if (!completed) {
        return;
    }
    if (store_.update(*id, *new_title, strings::to_lower_copy(*completed) == "yes")) {
        out_ << "✅ To-Do updated successfully!\n";
    } else {
        out_ << "To-Do not found.\n";
    }
}

void InteractiveShell::delete_task() {
    out_ << "\n🗑️ DELETE A TO-DO\n";
    const auto id = prompt_id("Enter the ID of the to-do to delete: ");
    if (!id) {
        return;
    }
    if (store_.remove(*id)) {
        out_ << "✅ To-Do deleted successfully!\n";
    } else {
        out_ << "To-Do not found.\n";
    }
}

void InteractiveShell::shutdown() {
    out_ << "\n👋 Exiting the application... Goodbye!\n";
    out_.flush();
    saver_.request_shutdown();
    saver_.wait_until_stopped();
}

}
