#pragma once

#include "domore/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domore::tasks {

using namespace domore::core;

enum class TodoStatus {
    Pending,
    Active,
    Completed
};

inline std::string_view todo_status_to_string(TodoStatus status) {
    switch (status) {
        case TodoStatus::Pending: return "pending";
        case TodoStatus::Active: return "active";
        case TodoStatus::Completed: return "completed";
    }
    return "pending";
}

inline TodoStatus todo_status_from_string(std::string_view str) {
    if (str == "active") return TodoStatus::Active;
    if (str == "completed") return TodoStatus::Completed;
    return TodoStatus::Pending;
}

// One step of the task plan. index is the stable identity used for
// summaries; items are never reordered or removed within a task run.
struct TodoItem {
    ItemIndex index = 0;
    std::string title;
    std::string description;
    std::string section;  // Grouping heading from the generator, may be empty
    TodoStatus status = TodoStatus::Pending;
    std::optional<std::string> summary;

    Json to_json() const {
        Json j{
            {"index", index},
            {"title", title},
            {"description", description},
            {"section", section},
            {"status", std::string(todo_status_to_string(status))}
        };
        if (summary) {
            j["summary"] = *summary;
        }
        return j;
    }

    static TodoItem from_json(const Json& j) {
        TodoItem item;
        item.index = j.value("index", 0);
        item.title = j.value("title", "");
        item.description = j.value("description", "");
        item.section = j.value("section", "");
        item.status = todo_status_from_string(j.value("status", "pending"));
        if (j.contains("summary") && j["summary"].is_string()) {
            item.summary = j["summary"].get<std::string>();
        }
        return item;
    }
};

// Stored record of a completed item
struct CompletedSummary {
    std::string summary;
    TimePoint timestamp;
};

// Item index -> summary; append/update only
using CompletedItemSummaries = std::map<ItemIndex, CompletedSummary>;

}  // namespace domore::tasks
