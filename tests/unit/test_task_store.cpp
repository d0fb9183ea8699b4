#include <catch2/catch.hpp>
#include "domore/tasks/task_store.hpp"
#include "test_helpers.hpp"

using namespace domore::core;
using namespace domore::tasks;
using domore::testing::TempProject;

namespace {

std::vector<TodoItem> sample_items() {
    TodoItem setup;
    setup.index = 0;
    setup.title = "Set up project";
    setup.description = "Create the folder layout";
    setup.section = "Setup";
    setup.status = TodoStatus::Completed;
    setup.summary = "Created src/ and assets/";

    TodoItem header;
    header.index = 1;
    header.title = "Build header";
    header.section = "Layout";
    header.status = TodoStatus::Active;

    return {setup, header};
}

}  // namespace

TEST_CASE("Missing artifacts read as empty", "[task_store]") {
    TempProject project;
    FileTaskStore store;
    auto sandbox = project.sandbox();

    REQUIRE(store.load_global_context(sandbox).value().empty());
    REQUIRE(store.load_todo_list(sandbox).value().empty());
    REQUIRE(store.load_summaries(sandbox).value().empty());
}

TEST_CASE("Global context round trip", "[task_store]") {
    TempProject project;
    FileTaskStore store;
    auto sandbox = project.sandbox();

    REQUIRE(store.save_global_context(sandbox, "A landing page for developers.").is_ok());
    REQUIRE(project.read("globalContext.txt") == "A landing page for developers.");
    REQUIRE(store.load_global_context(sandbox).value() == "A landing page for developers.");
}

TEST_CASE("Todo list round trip", "[task_store]") {
    TempProject project;
    FileTaskStore store;
    auto sandbox = project.sandbox();

    REQUIRE(store.save_todo_list(sandbox, sample_items()).is_ok());

    auto loaded = store.load_todo_list(sandbox);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().size() == 2);

    const auto& first = loaded.value()[0];
    REQUIRE(first.index == 0);
    REQUIRE(first.title == "Set up project");
    REQUIRE(first.section == "Setup");
    REQUIRE(first.status == TodoStatus::Completed);
    REQUIRE(first.summary == std::optional<std::string>("Created src/ and assets/"));

    REQUIRE(loaded.value()[1].status == TodoStatus::Active);
    REQUIRE_FALSE(loaded.value()[1].summary.has_value());
}

TEST_CASE("Corrupt todo list fails to load", "[task_store]") {
    TempProject project;
    FileTaskStore store;

    SECTION("Not JSON") {
        project.write("todoList.json", "{ items: oops");
    }

    SECTION("Items is not an array") {
        project.write("todoList.json", R"({"items": {"title": "x"}})");
    }

    auto loaded = store.load_todo_list(project.sandbox());
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code == ErrorCode::StoreLoadFailed);
}

TEST_CASE("Summaries are inserted and replaced", "[task_store]") {
    TempProject project;
    FileTaskStore store;
    auto sandbox = project.sandbox();

    REQUIRE(store.save_summary(sandbox, 0, "done setup").is_ok());
    REQUIRE(store.save_summary(sandbox, 2, "styled footer").is_ok());
    REQUIRE(store.save_summary(sandbox, 0, "done setup, again").is_ok());

    auto summaries = store.load_summaries(sandbox);
    REQUIRE(summaries.is_ok());
    REQUIRE(summaries.value().size() == 2);
    REQUIRE(summaries.value().at(0).summary == "done setup, again");
    REQUIRE(summaries.value().at(2).summary == "styled footer");
    REQUIRE(summaries.value().at(2).timestamp != TimePoint{});

    auto raw = Json::parse(project.read("completedItems.json"));
    REQUIRE(raw.contains("0"));
    REQUIRE(raw["2"]["summary"] == "styled footer");
    REQUIRE(raw["2"]["timestamp"].is_string());
}

TEST_CASE("Malformed summary entries are skipped", "[task_store]") {
    TempProject project;
    project.write("completedItems.json", R"({
        "0": {"summary": "ok", "timestamp": "2024-05-01T10:00:00Z"},
        "one": {"summary": "bad key"},
        "3": "not an object"
    })");

    FileTaskStore store;
    auto summaries = store.load_summaries(project.sandbox());
    REQUIRE(summaries.is_ok());
    REQUIRE(summaries.value().size() == 1);
    REQUIRE(summaries.value().at(0).summary == "ok");
}

TEST_CASE("Custom artifact names", "[task_store]") {
    TempProject project;
    TaskConfig config;
    config.global_context_file = ".domore/context.txt";
    FileTaskStore store(config);

    REQUIRE(store.save_global_context(project.sandbox(), "ctx").is_ok());
    REQUIRE(project.read(".domore/context.txt") == "ctx");
}

TEST_CASE("Store without project root", "[task_store]") {
    FileTaskStore store;
    domore::sandbox::ProjectSandbox unset;

    auto saved = store.save_global_context(unset, "ctx");
    REQUIRE(saved.is_err());
    REQUIRE(saved.error().code == ErrorCode::ProjectNotSet);

    auto loaded = store.load_todo_list(unset);
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code == ErrorCode::ProjectNotSet);
}
