#include "doctest/doctest.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/task_file.hpp"
#include "core/task_store.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;
using tasktrack::core::LoadResult;
using tasktrack::core::TaskFile;
using tasktrack::core::TaskStore;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

static fs::path fresh_dir(const std::string& name) {
    const fs::path dir = test_root() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

static void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    REQUIRE(out.is_open());
    out << text;
}

TEST_CASE("TaskFile round-trips the task list") {
    tasktrack::log::set_level(tasktrack::log::Level::Warn);
    const fs::path file = fresh_dir("task_file_roundtrip") / "todos.json";

    TaskStore original;
    original.create("Buy milk");
    original.create("Walk dog");
    original.create("Pay bills");
    REQUIRE(original.remove(1));
    REQUIRE(original.update(2, "", true));

    TaskFile task_file(file);
    REQUIRE(task_file.save(original));
    CHECK_FALSE(original.dirty());
    CHECK(fs::exists(file));
    CHECK_FALSE(fs::exists(file.string() + ".tmp"));

    TaskStore loaded;
    REQUIRE(task_file.load(loaded) == LoadResult::Loaded);
    CHECK(loaded.list() == original.list());
    CHECK_FALSE(loaded.dirty());

    // The counter is not persisted, so a fresh store starts over at 1.
    CHECK(loaded.last_id() == 0);
    CHECK(loaded.create("after restart").id == 1);
}

TEST_CASE("TaskFile writes the documented JSON fields") {
    const fs::path file = fresh_dir("task_file_format") / "todos.json";
    TaskStore store;
    store.create("Write report");

    TaskFile task_file(file, -1);
    REQUIRE(task_file.save(store));

    std::ifstream in(file);
    const nlohmann::json doc = nlohmann::json::parse(in);
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 1);
    CHECK(doc[0]["id"] == 1);
    CHECK(doc[0]["title"] == "Write report");
    CHECK(doc[0]["completed"] == false);
    REQUIRE(doc[0]["created_at"].is_string());
    CHECK(doc[0]["created_at"].get<std::string>().back() == 'Z');
}

TEST_CASE("TaskFile treats a missing file as a normal empty start") {
    const fs::path file = fresh_dir("task_file_missing") / "todos.json";
    TaskStore store;
    TaskFile task_file(file);
    std::string error;
    CHECK(task_file.load(store, &error) == LoadResult::Missing);
    CHECK(error.empty());
    CHECK(store.list().empty());
}

TEST_CASE("TaskFile load failures leave the store empty") {
    tasktrack::log::set_level(tasktrack::log::Level::Error);
    const fs::path dir = fresh_dir("task_file_bad");
    const fs::path file = dir / "todos.json";
    TaskFile task_file(file);

    SUBCASE("malformed JSON") {
        write_text(file, "[{\"id\": 1, \"title\": ");
    }
    SUBCASE("top-level object") {
        write_text(file, "{\"id\": 1}");
    }
    SUBCASE("missing title") {
        write_text(file, "[{\"id\": 1, \"completed\": true}]");
    }
    SUBCASE("mistyped id") {
        write_text(file, "[{\"id\": \"one\", \"title\": \"x\"}]");
    }
    SUBCASE("bad timestamp") {
        write_text(file, "[{\"id\": 1, \"title\": \"x\", \"completed\": false, \"created_at\": \"yesterday\"}]");
    }
    SUBCASE("empty file") {
        write_text(file, "");
    }

    TaskStore store;
    std::string error;
    CHECK(task_file.load(store, &error) == LoadResult::Failed);
    CHECK_FALSE(error.empty());
    CHECK(store.list().empty());
}

TEST_CASE("TaskFile accepts null and offset timestamps") {
    const fs::path file = fresh_dir("task_file_lenient") / "todos.json";
    TaskFile task_file(file);

    write_text(file, "null\n");
    TaskStore empty;
    CHECK(task_file.load(empty) == LoadResult::Loaded);
    CHECK(empty.list().empty());

    write_text(file,
               "[{\"id\":4,\"title\":\"Call mom\",\"completed\":true,"
               "\"created_at\":\"2024-05-01T10:00:00.123456789+02:00\"},"
               "{\"id\":6,\"title\":\"No flag\",\"created_at\":\"2024-05-01T08:00:00Z\"}]\n");
    TaskStore store;
    REQUIRE(task_file.load(store) == LoadResult::Loaded);
    const auto tasks = store.list();
    REQUIRE(tasks.size() == 2);
    CHECK(tasks[0].id == 4);
    CHECK(tasks[0].completed);
    CHECK(tasks[1].id == 6);
    CHECK_FALSE(tasks[1].completed);
    CHECK(tasks[1].created_at - tasks[0].created_at < std::chrono::seconds(0));
}

TEST_CASE("TaskFile save failure keeps the store dirty") {
    tasktrack::log::set_level(tasktrack::log::Level::Error);
    const fs::path dir = fresh_dir("task_file_unwritable");
    // A regular file where a directory is expected makes the write fail.
    write_text(dir / "blocker", "not a directory");
    TaskFile task_file(dir / "blocker" / "todos.json");

    TaskStore store;
    store.create("Unsaved");
    CHECK_FALSE(task_file.save(store));
    CHECK(store.dirty());
}

TEST_CASE("TaskFile save replaces previous content") {
    const fs::path file = fresh_dir("task_file_overwrite") / "todos.json";
    TaskFile task_file(file);

    TaskStore store;
    store.create("one");
    store.create("two");
    REQUIRE(task_file.save(store));
    REQUIRE(store.remove(1));
    REQUIRE(store.remove(2));
    REQUIRE(task_file.save(store));

    TaskStore loaded;
    REQUIRE(task_file.load(loaded) == LoadResult::Loaded);
    CHECK(loaded.list().empty());
}

TEST_CASE("TaskFile saves titles with invalid UTF-8 by replacing the bad bytes") {
    const fs::path file = fresh_dir("task_file_latin1") / "todos.json";
    TaskFile task_file(file);

    TaskStore store;
    store.create("Buy milk");
    store.create("Caf\xe9 run");
    REQUIRE(task_file.save(store));
    CHECK_FALSE(store.dirty());

    TaskStore loaded;
    REQUIRE(task_file.load(loaded) == LoadResult::Loaded);
    const auto tasks = loaded.list();
    REQUIRE(tasks.size() == 2);
    CHECK(tasks[0].title == "Buy milk");
    CHECK(tasks[1].title == "Caf\xEF\xBF\xBD run");
}

TEST_CASE("TaskFile reads the year-1 creation time as unset") {
    const fs::path file = fresh_dir("task_file_zero_time") / "todos.json";
    write_text(file,
               "[{\"id\":1,\"title\":\"Old\",\"completed\":false,"
               "\"created_at\":\"0001-01-01T00:00:00Z\"}]\n");
    TaskFile task_file(file);
    TaskStore store;
    REQUIRE(task_file.load(store) == LoadResult::Loaded);
    REQUIRE(store.size() == 1);
    CHECK(store.list()[0].created_at == tasktrack::time::TimePoint{});
}

TEST_CASE("TaskFile rejects creation times outside the clock range") {
    tasktrack::log::set_level(tasktrack::log::Level::Error);
    const fs::path file = fresh_dir("task_file_far_future") / "todos.json";
    write_text(file,
               "[{\"id\":1,\"title\":\"Later\",\"completed\":false,"
               "\"created_at\":\"2300-01-01T00:00:00Z\"}]\n");
    TaskFile task_file(file);
    TaskStore store;
    CHECK(task_file.load(store) == LoadResult::Failed);
    CHECK(store.list().empty());
}
