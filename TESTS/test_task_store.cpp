#include "doctest/doctest.h"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <thread>
#include <vector>

#include "core/task_store.hpp"

using tasktrack::core::TaskRecord;
using tasktrack::core::TaskStore;

TEST_CASE("TaskStore walks through create, delete, create, update") {
    TaskStore store;

    const TaskRecord milk = store.create("Buy milk");
    CHECK(milk.id == 1);
    CHECK_FALSE(milk.completed);

    const TaskRecord dog = store.create("Walk dog");
    CHECK(dog.id == 2);

    REQUIRE(store.remove(1));
    auto tasks = store.list();
    REQUIRE(tasks.size() == 1);
    CHECK(tasks[0].id == 2);

    // Deleted ids are never handed out again.
    const TaskRecord bills = store.create("Pay bills");
    CHECK(bills.id == 3);

    REQUIRE(store.update(2, "", true));
    tasks = store.list();
    REQUIRE(tasks.size() == 2);
    CHECK(tasks[0].id == 2);
    CHECK(tasks[0].title == "Walk dog");
    CHECK(tasks[0].completed);
    CHECK(tasks[1].id == 3);
    CHECK(tasks[1].title == "Pay bills");
}

TEST_CASE("TaskStore ids increase by one and survive deletes") {
    TaskStore store;
    int expected = 1;
    for (int round = 0; round < 5; ++round) {
        const TaskRecord a = store.create("a");
        const TaskRecord b = store.create("b");
        CHECK(a.id == expected);
        CHECK(b.id == expected + 1);
        expected += 2;
        REQUIRE(store.remove(a.id));
    }
    CHECK(store.last_id() == 10);
    CHECK(store.size() == 5);
}

TEST_CASE("TaskStore empty list is not an error") {
    TaskStore store;
    CHECK(store.list().empty());
    CHECK(store.size() == 0);
    CHECK_FALSE(store.dirty());
}

TEST_CASE("TaskStore update with an empty title keeps it but writes completion") {
    TaskStore store;
    store.create("Read book");
    REQUIRE(store.update(1, "", true));
    CHECK(store.list()[0].title == "Read book");
    CHECK(store.list()[0].completed);

    // Completion is overwritten even when going back to false.
    REQUIRE(store.update(1, "Read two books", false));
    CHECK(store.list()[0].title == "Read two books");
    CHECK_FALSE(store.list()[0].completed);
}

TEST_CASE("TaskStore reports not found after delete") {
    TaskStore store;
    store.create("Temporary");
    REQUIRE(store.remove(1));
    CHECK_FALSE(store.update(1, "again", true));
    CHECK_FALSE(store.remove(1));
    CHECK_FALSE(store.update(42, "", false));
}

TEST_CASE("TaskStore delete keeps the order of the remaining tasks") {
    TaskStore store;
    for (const char* title : {"one", "two", "three", "four"}) {
        store.create(title);
    }
    REQUIRE(store.remove(2));
    const auto tasks = store.list();
    REQUIRE(tasks.size() == 3);
    CHECK(tasks[0].title == "one");
    CHECK(tasks[1].title == "three");
    CHECK(tasks[2].title == "four");
}

TEST_CASE("TaskStore stores empty titles as given") {
    TaskStore store;
    const TaskRecord task = store.create("");
    CHECK(task.id == 1);
    CHECK(store.list()[0].title.empty());
}

TEST_CASE("TaskStore dirty flag follows mutations and saves") {
    TaskStore store;
    CHECK_FALSE(store.dirty());

    store.create("x");
    CHECK(store.dirty());

    auto snap = store.snapshot();
    CHECK(store.mark_saved(snap.revision));
    CHECK_FALSE(store.dirty());

    REQUIRE(store.update(1, "y", false));
    CHECK(store.dirty());
    CHECK(store.mark_saved(store.snapshot().revision));

    REQUIRE(store.remove(1));
    CHECK(store.dirty());
    CHECK(store.mark_saved(store.snapshot().revision));

    // Misses leave the flag alone.
    CHECK_FALSE(store.update(1, "z", true));
    CHECK_FALSE(store.remove(1));
    CHECK_FALSE(store.dirty());
}

TEST_CASE("TaskStore keeps changes made after a snapshot dirty") {
    TaskStore store;
    store.create("first");
    const auto snap = store.snapshot();
    store.create("second");

    CHECK_FALSE(store.mark_saved(snap.revision));
    CHECK(store.dirty());
    CHECK(snap.tasks.size() == 1);
}

TEST_CASE("TaskStore replace_all keeps the id counter and clears dirty") {
    TaskStore store;
    std::vector<TaskRecord> loaded(2);
    loaded[0].id = 7;
    loaded[0].title = "seven";
    loaded[1].id = 9;
    loaded[1].title = "nine";
    store.replace_all(loaded);

    CHECK_FALSE(store.dirty());
    CHECK(store.size() == 2);
    CHECK(store.last_id() == 0);
    CHECK(store.create("fresh").id == 1);

    store.reserve_ids_through(9);
    CHECK(store.create("after restore").id == 10);
    store.reserve_ids_through(3);
    CHECK(store.last_id() == 10);
}

TEST_CASE("TaskStore hands out unique ids across threads") {
    TaskStore store;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store]() {
            for (int i = 0; i < kPerThread; ++i) {
                store.create("task");
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    const auto tasks = store.list();
    REQUIRE(tasks.size() == static_cast<std::size_t>(kThreads * kPerThread));
    std::set<int> ids;
    for (const auto& task : tasks) {
        ids.insert(task.id);
    }
    CHECK(ids.size() == tasks.size());
    CHECK(*ids.begin() == 1);
    CHECK(*ids.rbegin() == kThreads * kPerThread);
    // Insertion order matches allocation order.
    CHECK(std::is_sorted(tasks.begin(), tasks.end(),
                         [](const TaskRecord& a, const TaskRecord& b) { return a.id < b.id; }));
}
