#include "domore/agent/orchestrator.hpp"
#include "domore/agent/prompts.hpp"

#include <spdlog/spdlog.h>

namespace domore::agent {

TaskOrchestrator::Config TaskOrchestrator::Config::from(const domore::core::Config& app) {
    Config config;
    config.max_file_request_rounds = app.file_requests.max_rounds;
    config.max_prompt_tokens = app.tasks.max_prompt_tokens;
    return config;
}

TaskOrchestrator::TaskOrchestrator(
    const Config& config,
    ProjectSandbox sandbox,
    QuestionSource& questions,
    ContextSummarizer& summarizer,
    TodoGenerator& todo_generator,
    ModelClient& model,
    tasks::TaskStore& store,
    ResponseProcessor& processor)
    : config_(config)
    , sandbox_(std::move(sandbox))
    , questions_(questions)
    , summarizer_(summarizer)
    , todo_generator_(todo_generator)
    , model_(model)
    , store_(store)
    , processor_(processor)
{
    if (config_.instructions.empty()) {
        config_.instructions = file_operations_instructions();
    }
}

Result<void, Error> TaskOrchestrator::require_phase(TaskPhase expected, std::string_view action) const {
    if (phase_ != expected) {
        return Result<void, Error>::err(
            ErrorCode::InvalidState,
            std::string(action) + " requires phase " +
                std::string(task_phase_to_string(expected)) + ", current phase is " +
                std::string(task_phase_to_string(phase_))
        );
    }
    return Result<void, Error>::ok();
}

Error TaskOrchestrator::collaborator_error(const Error& cause, const std::string& collaborator) const {
    spdlog::warn("{} failed: {}", collaborator, cause.full_message());
    Error err{ErrorCode::CollaboratorFailure, cause.message, collaborator};
    err.with_source("TaskOrchestrator");
    return err;
}

Result<void, Error> TaskOrchestrator::begin(const ProjectId& project_id,
                                            const std::string& task_description) {
    if (phase_ == TaskPhase::Executing || phase_ == TaskPhase::ContextReady) {
        return Result<void, Error>::err(
            ErrorCode::InvalidState,
            "A task is already in progress"
        );
    }

    std::string task = trim(task_description);
    if (task.empty()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Task description must not be empty"
        );
    }

    auto questions = questions_.questions_for(task);
    if (questions.is_err()) {
        return Result<void, Error>::err(collaborator_error(questions.error(), "QuestionSource"));
    }

    session_.emplace(project_id, task, std::move(questions).value());
    global_context_.clear();
    items_.clear();
    active_.reset();
    transcript_.clear();
    summaries_.clear();
    phase_ = TaskPhase::Clarifying;

    spdlog::info("Task started for project {}: {} clarification question(s)",
                 project_id, session_->questions().size());
    return Result<void, Error>::ok();
}

Result<void, Error> TaskOrchestrator::next_question(const std::string& answer) {
    auto check = require_phase(TaskPhase::Clarifying, "next_question");
    if (check.is_err()) {
        return check;
    }

    bool finished = session_->next(answer);
    if (!finished) {
        return Result<void, Error>::ok();
    }

    auto context = generate_context();
    if (context.is_err()) {
        return context;
    }
    return generate_todo_list();
}

Result<void, Error> TaskOrchestrator::previous_question(const std::string& answer) {
    auto check = require_phase(TaskPhase::Clarifying, "previous_question");
    if (check.is_err()) {
        return check;
    }

    session_->previous(answer);
    return Result<void, Error>::ok();
}

Result<void, Error> TaskOrchestrator::generate_context() {
    auto check = require_phase(TaskPhase::Clarifying, "generate_context");
    if (check.is_err()) {
        return check;
    }

    auto document = summarizer_.summarize(*session_);
    if (document.is_err()) {
        return Result<void, Error>::err(collaborator_error(document.error(), "ContextSummarizer"));
    }

    auto saved = store_.save_global_context(sandbox_, document.value());
    if (saved.is_err()) {
        return saved;
    }

    global_context_ = std::move(document).value();
    phase_ = TaskPhase::ContextReady;
    spdlog::info("Global context generated ({} chars)", global_context_.size());
    return Result<void, Error>::ok();
}

Result<void, Error> TaskOrchestrator::generate_todo_list() {
    auto check = require_phase(TaskPhase::ContextReady, "generate_todo_list");
    if (check.is_err()) {
        return check;
    }

    auto generated = todo_generator_.generate(global_context_);
    if (generated.is_err()) {
        return Result<void, Error>::err(collaborator_error(generated.error(), "TodoGenerator"));
    }

    std::vector<tasks::TodoItem> items = std::move(generated).value();
    if (items.empty()) {
        return Result<void, Error>::err(collaborator_error(
            Error{ErrorCode::CollaboratorFailure, "Todo generator returned no items"},
            "TodoGenerator"));
    }

    // Identity is the position in the generated list
    for (size_t i = 0; i < items.size(); ++i) {
        items[i].index = static_cast<ItemIndex>(i);
        items[i].status = tasks::TodoStatus::Pending;
        items[i].summary.reset();
    }

    auto saved = store_.save_todo_list(sandbox_, items);
    if (saved.is_err()) {
        return saved;
    }

    items_ = std::move(items);
    session_.reset();
    spdlog::info("Todo list generated: {} item(s)", items_.size());
    return Result<void, Error>::ok();
}

Result<void, Error> TaskOrchestrator::start_execution() {
    auto check = require_phase(TaskPhase::ContextReady, "start_execution");
    if (check.is_err()) {
        return check;
    }

    if (items_.empty()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidState,
            "No todo list to execute"
        );
    }

    auto items = items_;
    for (auto& item : items) {
        item.status = tasks::TodoStatus::Pending;
    }
    items[0].status = tasks::TodoStatus::Active;

    auto saved = store_.save_todo_list(sandbox_, items);
    if (saved.is_err()) {
        return saved;
    }

    items_ = std::move(items);
    active_ = 0;
    transcript_.clear();
    phase_ = TaskPhase::Executing;
    return Result<void, Error>::ok();
}

Result<context::PromptWindow, Error> TaskOrchestrator::build_prompt() const {
    if (phase_ != TaskPhase::Executing || !active_) {
        return Result<context::PromptWindow, Error>::err(
            ErrorCode::InvalidState,
            "No active todo item"
        );
    }

    TaskConfig task_config;
    task_config.max_prompt_tokens = config_.max_prompt_tokens;

    context::ContextBuilder builder(task_config);
    builder.with_instructions(config_.instructions)
           .with_global_context(global_context_)
           .with_summaries(summaries_)
           .with_todo_items(items_)
           .with_current_item(items_[static_cast<size_t>(*active_)])
           .with_transcript(transcript_);

    return builder.build();
}

Result<TurnResult, Error> TaskOrchestrator::send_message(const std::string& text) {
    auto check = require_phase(TaskPhase::Executing, "send_message");
    if (check.is_err()) {
        return Result<TurnResult, Error>::err(std::move(check).error());
    }

    // Restored on failure so the same message can be sent again
    const size_t transcript_size = transcript_.size();
    auto rollback = [this, transcript_size](Error err) {
        transcript_.resize(transcript_size);
        return Result<TurnResult, Error>::err(std::move(err));
    };

    transcript_.push_back(Message::user(text));

    TurnResult turn;
    int round = 0;
    while (true) {
        ++round;

        auto prompt = build_prompt();
        if (prompt.is_err()) {
            return rollback(std::move(prompt).error());
        }

        auto reply = model_.complete(prompt.value());
        if (reply.is_err()) {
            return rollback(collaborator_error(reply.error(), "ModelClient"));
        }

        auto processed = processor_.process(reply.value(), sandbox_);
        if (processed.is_err()) {
            return rollback(std::move(processed).error());
        }

        ProcessedResponse response = std::move(processed).value();
        if (!response.file_request) {
            transcript_.push_back(Message::assistant(reply.value()));
            turn.reply = reply.value();
            turn.rounds.push_back(std::move(response));
            break;
        }

        std::string stripped = files::strip_request(reply.value(), *response.file_request);
        transcript_.push_back(Message::assistant(stripped));
        transcript_.push_back(Message::user(files::format_file_contents(*response.file_outcome)));
        turn.reply = stripped;
        turn.rounds.push_back(std::move(response));

        if (round >= config_.max_file_request_rounds) {
            spdlog::warn("File request round limit ({}) reached", config_.max_file_request_rounds);
            turn.file_request_pending = true;
            break;
        }
        spdlog::debug("File request round {} fulfilled, calling model again", round);
    }

    return Result<TurnResult, Error>::ok(std::move(turn));
}

std::optional<ItemIndex> TaskOrchestrator::next_pending(ItemIndex after,
                                                        const std::vector<tasks::TodoItem>& items) const {
    for (const auto& item : items) {
        if (item.index > after && item.status == tasks::TodoStatus::Pending) {
            return item.index;
        }
    }
    for (const auto& item : items) {
        if (item.status == tasks::TodoStatus::Pending) {
            return item.index;
        }
    }
    return std::nullopt;
}

Result<void, Error> TaskOrchestrator::complete_active_item(const std::string& summary) {
    auto check = require_phase(TaskPhase::Executing, "complete_active_item");
    if (check.is_err()) {
        return check;
    }
    if (!active_) {
        return Result<void, Error>::err(ErrorCode::InvalidState, "No active todo item");
    }

    std::string trimmed = trim(summary);
    if (trimmed.empty()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Summary must not be empty"
        );
    }

    const ItemIndex index = *active_;

    auto items = items_;
    auto& current = items[static_cast<size_t>(index)];
    current.status = tasks::TodoStatus::Completed;
    current.summary = trimmed;

    auto next = next_pending(index, items);
    if (next) {
        items[static_cast<size_t>(*next)].status = tasks::TodoStatus::Active;
    }

    auto saved_summary = store_.save_summary(sandbox_, index, trimmed);
    if (saved_summary.is_err()) {
        return saved_summary;
    }

    auto saved_list = store_.save_todo_list(sandbox_, items);
    if (saved_list.is_err()) {
        return saved_list;
    }

    items_ = std::move(items);
    summaries_[index] = tasks::CompletedSummary{trimmed, Clock::now()};
    transcript_.clear();
    active_ = next;

    if (!next) {
        phase_ = TaskPhase::Completed;
        spdlog::info("Item {} completed; all items done", index);
    } else {
        spdlog::info("Item {} completed; item {} is now active", index, *next);
    }
    return Result<void, Error>::ok();
}

Result<tasks::TodoItem, Error> TaskOrchestrator::review_item(ItemIndex index) const {
    if (index < 0 || static_cast<size_t>(index) >= items_.size()) {
        return Result<tasks::TodoItem, Error>::err(
            ErrorCode::InvalidArgument,
            "No todo item with index " + std::to_string(index)
        );
    }

    tasks::TodoItem item = items_[static_cast<size_t>(index)];
    auto it = summaries_.find(index);
    if (it != summaries_.end()) {
        item.summary = it->second.summary;
    }
    return Result<tasks::TodoItem, Error>::ok(std::move(item));
}

Result<void, Error> TaskOrchestrator::reopen_item(ItemIndex index) {
    if (phase_ != TaskPhase::Executing && phase_ != TaskPhase::Completed) {
        return Result<void, Error>::err(
            ErrorCode::InvalidState,
            "reopen_item requires an executing or completed task"
        );
    }
    if (index < 0 || static_cast<size_t>(index) >= items_.size()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "No todo item with index " + std::to_string(index)
        );
    }
    if (items_[static_cast<size_t>(index)].status != tasks::TodoStatus::Completed) {
        return Result<void, Error>::err(
            ErrorCode::InvalidState,
            "Only a completed item can be reopened"
        );
    }

    auto items = items_;
    if (active_) {
        items[static_cast<size_t>(*active_)].status = tasks::TodoStatus::Pending;
    }
    items[static_cast<size_t>(index)].status = tasks::TodoStatus::Active;

    auto saved = store_.save_todo_list(sandbox_, items);
    if (saved.is_err()) {
        return saved;
    }

    int later = 0;
    for (const auto& [i, record] : summaries_) {
        if (i > index) {
            ++later;
        }
    }
    if (later > 0) {
        spdlog::warn("Reopened item {}; {} later summary(ies) are kept and may be stale", index, later);
    }
    if (!transcript_.empty()) {
        spdlog::info("Discarding transcript of item {}", *active_);
    }

    items_ = std::move(items);
    active_ = index;
    transcript_.clear();
    phase_ = TaskPhase::Executing;
    return Result<void, Error>::ok();
}

Result<void, Error> TaskOrchestrator::resume() {
    if (!sandbox_.has_root()) {
        return Result<void, Error>::err(ErrorCode::ProjectNotSet, "Project folder not set");
    }

    auto context = store_.load_global_context(sandbox_);
    if (context.is_err()) {
        return Result<void, Error>::err(std::move(context).error());
    }
    auto items = store_.load_todo_list(sandbox_);
    if (items.is_err()) {
        return Result<void, Error>::err(std::move(items).error());
    }
    auto summaries = store_.load_summaries(sandbox_);
    if (summaries.is_err()) {
        return Result<void, Error>::err(std::move(summaries).error());
    }

    session_.reset();
    transcript_.clear();
    global_context_ = std::move(context).value();
    items_ = std::move(items).value();
    summaries_ = std::move(summaries).value();
    active_.reset();

    if (items_.empty()) {
        phase_ = trim(global_context_).empty() ? TaskPhase::TaskEntry : TaskPhase::ContextReady;
        spdlog::info("Resumed project without todo list, phase {}", task_phase_to_string(phase_));
        return Result<void, Error>::ok();
    }

    for (size_t i = 0; i < items_.size(); ++i) {
        auto& item = items_[i];
        item.index = static_cast<ItemIndex>(i);
        auto it = summaries_.find(item.index);
        if (it != summaries_.end()) {
            item.summary = it->second.summary;
        }
        if (item.status == tasks::TodoStatus::Active) {
            if (active_) {
                item.status = tasks::TodoStatus::Pending;
            } else {
                active_ = item.index;
            }
        }
    }

    for (auto it = summaries_.begin(); it != summaries_.end();) {
        if (it->first < 0 || static_cast<size_t>(it->first) >= items_.size()) {
            spdlog::warn("Ignoring summary for unknown item {}", it->first);
            it = summaries_.erase(it);
        } else {
            ++it;
        }
    }

    bool started = active_.has_value();
    for (const auto& item : items_) {
        if (item.status == tasks::TodoStatus::Completed) {
            started = true;
        }
    }
    if (!started) {
        phase_ = TaskPhase::ContextReady;
        spdlog::info("Resumed project with {} item(s), execution not started", items_.size());
        return Result<void, Error>::ok();
    }

    if (!active_) {
        active_ = next_pending(-1, items_);
        if (active_) {
            items_[static_cast<size_t>(*active_)].status = tasks::TodoStatus::Active;
        }
    }

    phase_ = active_ ? TaskPhase::Executing : TaskPhase::Completed;
    spdlog::info("Resumed project: {} item(s), {} summary(ies), phase {}",
                 items_.size(), summaries_.size(), task_phase_to_string(phase_));
    return Result<void, Error>::ok();
}

}  // namespace domore::agent
