#pragma once

#include "domore/core/config.hpp"
#include "domore/core/result.hpp"
#include "domore/core/types.hpp"
#include "domore/tasks/todo.hpp"

#include <optional>
#include <string>
#include <vector>

namespace domore::context {

using namespace domore::core;

// What one model call receives
struct PromptWindow {
    std::string system_prompt;
    std::vector<Message> messages;

    int estimated_tokens = 0;
};

// Assembles the bounded prompt for the active todo item.
//
// Finished items contribute only their stored summary, never their
// transcript, so prompt size grows with the number of items rather than
// with the length of the whole conversation.
class ContextBuilder {
public:
    explicit ContextBuilder(const TaskConfig& config);

    ContextBuilder& with_instructions(const std::string& instructions);
    ContextBuilder& with_global_context(const std::string& global_context);

    // Summaries of items with index < current item's index are included
    ContextBuilder& with_summaries(const tasks::CompletedItemSummaries& summaries);

    ContextBuilder& with_todo_items(const std::vector<tasks::TodoItem>& items);
    ContextBuilder& with_current_item(const tasks::TodoItem& item);

    // Transcript of the active item only
    ContextBuilder& with_transcript(const std::vector<Message>& messages);

    Result<PromptWindow, Error> build();

    int estimated_tokens() const;

private:
    TaskConfig config_;

    std::string instructions_;
    std::string global_context_;
    tasks::CompletedItemSummaries summaries_;
    std::vector<tasks::TodoItem> items_;
    std::optional<tasks::TodoItem> current_item_;
    std::vector<Message> transcript_;

    std::string render_system_prompt() const;

    int estimate_tokens(const std::string& text) const;
    int estimate_message_tokens(const Message& msg) const;
};

}  // namespace domore::context
