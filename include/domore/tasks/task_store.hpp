#pragma once

#include "todo.hpp"
#include "domore/core/config.hpp"
#include "domore/core/result.hpp"
#include "domore/sandbox/project_sandbox.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace domore::tasks {

using sandbox::ProjectSandbox;

// Durable per-project task artifacts. Missing artifacts read as empty.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    virtual Result<void, Error> save_global_context(const ProjectSandbox& sandbox,
                                                    const std::string& content) = 0;
    virtual Result<std::string, Error> load_global_context(const ProjectSandbox& sandbox) = 0;

    virtual Result<void, Error> save_todo_list(const ProjectSandbox& sandbox,
                                               const std::vector<TodoItem>& items) = 0;
    virtual Result<std::vector<TodoItem>, Error> load_todo_list(const ProjectSandbox& sandbox) = 0;

    // Insert or replace the summary for one item
    virtual Result<void, Error> save_summary(const ProjectSandbox& sandbox,
                                             ItemIndex index,
                                             const std::string& summary) = 0;
    virtual Result<CompletedItemSummaries, Error> load_summaries(const ProjectSandbox& sandbox) = 0;
};

// Stores the artifacts as files inside the project sandbox:
//   globalContext.txt    plain text
//   todoList.json        {"items": [...]}
//   completedItems.json  {"<index>": {"summary": ..., "timestamp": ISO-8601}}
class FileTaskStore : public TaskStore {
public:
    explicit FileTaskStore(TaskConfig config = {});

    Result<void, Error> save_global_context(const ProjectSandbox& sandbox,
                                            const std::string& content) override;
    Result<std::string, Error> load_global_context(const ProjectSandbox& sandbox) override;

    Result<void, Error> save_todo_list(const ProjectSandbox& sandbox,
                                       const std::vector<TodoItem>& items) override;
    Result<std::vector<TodoItem>, Error> load_todo_list(const ProjectSandbox& sandbox) override;

    Result<void, Error> save_summary(const ProjectSandbox& sandbox,
                                     ItemIndex index,
                                     const std::string& summary) override;
    Result<CompletedItemSummaries, Error> load_summaries(const ProjectSandbox& sandbox) override;

private:
    Result<std::string, Error> read_artifact(const ProjectSandbox& sandbox,
                                             const std::string& name) const;
    Result<void, Error> write_artifact(const ProjectSandbox& sandbox,
                                       const std::string& name,
                                       const std::string& content) const;

    TaskConfig config_;
    std::mutex summaries_mutex_;
};

}  // namespace domore::tasks
