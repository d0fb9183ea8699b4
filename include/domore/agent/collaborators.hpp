#pragma once

#include "domore/context/context_builder.hpp"
#include "domore/core/result.hpp"
#include "domore/tasks/clarification.hpp"
#include "domore/tasks/todo.hpp"

#include <string>
#include <vector>

namespace domore::agent {

using namespace domore::core;

// External collaborators consumed by the orchestrator. Each call may fail;
// implementations report failures as Result errors, not exceptions.

// Supplies clarification questions (and optional hints) for a new task
class QuestionSource {
public:
    virtual ~QuestionSource() = default;

    virtual Result<std::vector<tasks::ClarificationQuestion>, Error> questions_for(
        const std::string& task_description
    ) = 0;
};

// Turns the collected answers into the global context document
class ContextSummarizer {
public:
    virtual ~ContextSummarizer() = default;

    virtual Result<std::string, Error> summarize(const tasks::ClarificationSession& session) = 0;
};

// Decomposes the global context into ordered todo items
class TodoGenerator {
public:
    virtual ~TodoGenerator() = default;

    virtual Result<std::vector<tasks::TodoItem>, Error> generate(const std::string& global_context) = 0;
};

// The language model: receives a bounded prompt, returns agent text
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual Result<std::string, Error> complete(const context::PromptWindow& prompt) = 0;
};

}  // namespace domore::agent
