#include "domore/tasks/task_store.hpp"

#include <spdlog/spdlog.h>

namespace domore::tasks {

FileTaskStore::FileTaskStore(TaskConfig config)
    : config_(std::move(config))
{
}

Result<std::string, Error> FileTaskStore::read_artifact(const ProjectSandbox& sandbox,
                                                        const std::string& name) const {
    auto content = sandbox.read_file(name);
    if (content.is_ok()) {
        return content;
    }

    const Error& err = content.error();
    if (err.code == ErrorCode::FileNotFound) {
        return Result<std::string, Error>::ok("");
    }
    if (err.code == ErrorCode::ProjectNotSet) {
        return content;
    }
    return Result<std::string, Error>::err(ErrorCode::StoreLoadFailed, err.message, name);
}

Result<void, Error> FileTaskStore::write_artifact(const ProjectSandbox& sandbox,
                                                  const std::string& name,
                                                  const std::string& content) const {
    auto written = sandbox.write_file(name, content);
    if (written.is_ok()) {
        spdlog::debug("Saved {}", name);
        return written;
    }

    const Error& err = written.error();
    if (err.code == ErrorCode::ProjectNotSet) {
        return written;
    }
    spdlog::error("Failed to save {}: {}", name, err.message);
    return Result<void, Error>::err(ErrorCode::StoreSaveFailed, err.message, name);
}

Result<void, Error> FileTaskStore::save_global_context(const ProjectSandbox& sandbox,
                                                       const std::string& content) {
    return write_artifact(sandbox, config_.global_context_file, content);
}

Result<std::string, Error> FileTaskStore::load_global_context(const ProjectSandbox& sandbox) {
    return read_artifact(sandbox, config_.global_context_file);
}

Result<void, Error> FileTaskStore::save_todo_list(const ProjectSandbox& sandbox,
                                                  const std::vector<TodoItem>& items) {
    Json list = Json::array();
    for (const auto& item : items) {
        list.push_back(item.to_json());
    }
    Json doc{{"items", list}};
    return write_artifact(sandbox, config_.todo_list_file, doc.dump(2));
}

Result<std::vector<TodoItem>, Error> FileTaskStore::load_todo_list(const ProjectSandbox& sandbox) {
    using R = Result<std::vector<TodoItem>, Error>;

    auto content = read_artifact(sandbox, config_.todo_list_file);
    if (content.is_err()) {
        return R::err(std::move(content).error());
    }
    if (trim(content.value()).empty()) {
        return R::ok({});
    }

    Json doc = Json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return R::err(ErrorCode::StoreLoadFailed, "Invalid todo list", config_.todo_list_file);
    }

    std::vector<TodoItem> items;
    auto it = doc.find("items");
    if (it == doc.end()) {
        return R::ok(std::move(items));
    }
    if (!it->is_array()) {
        return R::err(ErrorCode::StoreLoadFailed, "Todo list items is not an array",
                      config_.todo_list_file);
    }

    try {
        for (const auto& entry : *it) {
            items.push_back(TodoItem::from_json(entry));
        }
    } catch (const Json::exception& e) {
        return R::err(ErrorCode::StoreLoadFailed, e.what(), config_.todo_list_file);
    }

    return R::ok(std::move(items));
}

Result<void, Error> FileTaskStore::save_summary(const ProjectSandbox& sandbox,
                                                ItemIndex index,
                                                const std::string& summary) {
    std::lock_guard<std::mutex> lock(summaries_mutex_);

    auto content = read_artifact(sandbox, config_.summaries_file);
    if (content.is_err()) {
        return Result<void, Error>::err(std::move(content).error());
    }

    Json doc = Json::object();
    if (!trim(content.value()).empty()) {
        doc = Json::parse(content.value(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return Result<void, Error>::err(
                ErrorCode::StoreLoadFailed, "Invalid summaries file", config_.summaries_file);
        }
    }

    doc[std::to_string(index)] = Json{
        {"timestamp", to_iso8601(Clock::now())},
        {"summary", summary}
    };

    return write_artifact(sandbox, config_.summaries_file, doc.dump(2));
}

Result<CompletedItemSummaries, Error> FileTaskStore::load_summaries(const ProjectSandbox& sandbox) {
    using R = Result<CompletedItemSummaries, Error>;

    auto content = read_artifact(sandbox, config_.summaries_file);
    if (content.is_err()) {
        return R::err(std::move(content).error());
    }

    CompletedItemSummaries summaries;
    if (trim(content.value()).empty()) {
        return R::ok(std::move(summaries));
    }

    Json doc = Json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return R::err(ErrorCode::StoreLoadFailed, "Invalid summaries file", config_.summaries_file);
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        ItemIndex index = 0;
        try {
            index = std::stoi(it.key());
        } catch (const std::exception&) {
            spdlog::warn("Ignoring summary with non-numeric key: {}", it.key());
            continue;
        }

        const Json& entry = it.value();
        if (!entry.is_object() || !entry.contains("summary") || !entry["summary"].is_string()) {
            spdlog::warn("Ignoring malformed summary for item {}", index);
            continue;
        }

        CompletedSummary record;
        record.summary = entry["summary"].get<std::string>();
        auto timestamp = from_iso8601(entry.value("timestamp", ""));
        record.timestamp = timestamp.value_or(TimePoint{});
        summaries[index] = std::move(record);
    }

    return R::ok(std::move(summaries));
}

}  // namespace domore::tasks
