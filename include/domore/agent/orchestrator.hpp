#pragma once

#include "collaborators.hpp"
#include "response_processor.hpp"
#include "domore/context/context_builder.hpp"
#include "domore/core/config.hpp"
#include "domore/core/result.hpp"
#include "domore/core/types.hpp"
#include "domore/tasks/clarification.hpp"
#include "domore/tasks/task_store.hpp"
#include "domore/tasks/todo.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domore::agent {

using namespace domore::core;

enum class TaskPhase {
    TaskEntry,      // No task yet
    Clarifying,     // Walking the clarification questions
    ContextReady,   // Global context produced; todo list pending or ready
    Executing,      // Working through todo items
    Completed       // Every item completed
};

inline std::string_view task_phase_to_string(TaskPhase phase) {
    switch (phase) {
        case TaskPhase::TaskEntry: return "task_entry";
        case TaskPhase::Clarifying: return "clarifying";
        case TaskPhase::ContextReady: return "context_ready";
        case TaskPhase::Executing: return "executing";
        case TaskPhase::Completed: return "completed";
    }
    return "unknown";
}

// Outcome of one user turn while executing an item
struct TurnResult {
    std::string reply;                         // Last round's text, request stripped
    std::vector<ProcessedResponse> rounds;     // One per model call
    bool file_request_pending = false;         // Round limit hit with a request outstanding
};

// Task state machine for one project:
// clarification -> global context -> todo list -> stepwise execution.
//
// Not thread-safe; one orchestrator drives one project session. Durable
// state goes through the TaskStore; collaborator failures leave the
// collected answers and global context in place so the action can be retried.
class TaskOrchestrator {
public:
    struct Config {
        int max_file_request_rounds = 3;
        int max_prompt_tokens = 120000;
        std::string instructions;  // Empty = built-in file operation instructions

        static Config from(const domore::core::Config& app);
    };

    TaskOrchestrator(
        const Config& config,
        ProjectSandbox sandbox,
        QuestionSource& questions,
        ContextSummarizer& summarizer,
        TodoGenerator& todo_generator,
        ModelClient& model,
        tasks::TaskStore& store,
        ResponseProcessor& processor
    );

    // TaskEntry -> Clarifying
    Result<void, Error> begin(const ProjectId& project_id, const std::string& task_description);

    // Store the answer and advance; at the last question, generate the
    // global context and the todo list
    Result<void, Error> next_question(const std::string& answer);

    // Store the answer and step back
    Result<void, Error> previous_question(const std::string& answer);

    // Retry entry points
    Result<void, Error> generate_context();
    Result<void, Error> generate_todo_list();

    // ContextReady -> Executing; item 0 becomes active
    Result<void, Error> start_execution();

    // One user turn on the active item, including file-request round trips
    Result<TurnResult, Error> send_message(const std::string& text);

    // Store the summary, mark the item completed and move to the next one
    Result<void, Error> complete_active_item(const std::string& summary);

    // Read-only view of any item, with its stored summary
    Result<tasks::TodoItem, Error> review_item(ItemIndex index) const;

    // Make a completed item active again. Summaries of later items are kept
    // as they are even though they may depend on this item's old outcome.
    Result<void, Error> reopen_item(ItemIndex index);

    // Rebuild state from the persisted artifacts
    Result<void, Error> resume();

    // Bounded prompt for the active item
    Result<context::PromptWindow, Error> build_prompt() const;

    // Accessors
    TaskPhase phase() const { return phase_; }
    const ProjectSandbox& sandbox() const { return sandbox_; }
    const std::optional<tasks::ClarificationSession>& session() const { return session_; }
    const std::string& global_context() const { return global_context_; }
    const std::vector<tasks::TodoItem>& items() const { return items_; }
    std::optional<ItemIndex> active_index() const { return active_; }
    const std::vector<Message>& transcript() const { return transcript_; }
    const tasks::CompletedItemSummaries& summaries() const { return summaries_; }

private:
    Result<void, Error> require_phase(TaskPhase expected, std::string_view action) const;
    Error collaborator_error(const Error& cause, const std::string& collaborator) const;

    // Next pending item after `after`, wrapping to the first pending one
    std::optional<ItemIndex> next_pending(ItemIndex after,
                                          const std::vector<tasks::TodoItem>& items) const;

    Config config_;
    ProjectSandbox sandbox_;

    QuestionSource& questions_;
    ContextSummarizer& summarizer_;
    TodoGenerator& todo_generator_;
    ModelClient& model_;
    tasks::TaskStore& store_;
    ResponseProcessor& processor_;

    TaskPhase phase_ = TaskPhase::TaskEntry;
    std::optional<tasks::ClarificationSession> session_;
    std::string global_context_;
    std::vector<tasks::TodoItem> items_;
    std::optional<ItemIndex> active_;
    std::vector<Message> transcript_;
    tasks::CompletedItemSummaries summaries_;
};

}  // namespace domore::agent
