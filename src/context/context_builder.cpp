#include "domore/context/context_builder.hpp"

#include <sstream>

namespace domore::context {

namespace {

const tasks::TodoItem* find_item(const std::vector<tasks::TodoItem>& items, ItemIndex index) {
    for (const auto& item : items) {
        if (item.index == index) {
            return &item;
        }
    }
    return nullptr;
}

}  // namespace

ContextBuilder::ContextBuilder(const TaskConfig& config)
    : config_(config)
{
}

ContextBuilder& ContextBuilder::with_instructions(const std::string& instructions) {
    instructions_ = instructions;
    return *this;
}

ContextBuilder& ContextBuilder::with_global_context(const std::string& global_context) {
    global_context_ = global_context;
    return *this;
}

ContextBuilder& ContextBuilder::with_summaries(const tasks::CompletedItemSummaries& summaries) {
    summaries_ = summaries;
    return *this;
}

ContextBuilder& ContextBuilder::with_todo_items(const std::vector<tasks::TodoItem>& items) {
    items_ = items;
    return *this;
}

ContextBuilder& ContextBuilder::with_current_item(const tasks::TodoItem& item) {
    current_item_ = item;
    return *this;
}

ContextBuilder& ContextBuilder::with_transcript(const std::vector<Message>& messages) {
    transcript_ = messages;
    return *this;
}

std::string ContextBuilder::render_system_prompt() const {
    std::ostringstream system;
    system << instructions_;

    if (!global_context_.empty()) {
        system << "\n\n## Global Context\n" << global_context_;
    }

    if (!items_.empty()) {
        system << "\n\n## Task Progress\n";
        for (const auto& item : items_) {
            system << "- [" << tasks::todo_status_to_string(item.status) << "] "
                   << item.index + 1 << ". " << item.title << "\n";
        }
    }

    std::ostringstream completed;
    for (const auto& [index, record] : summaries_) {
        if (current_item_ && index >= current_item_->index) {
            break;
        }
        completed << "### Item " << index + 1;
        if (const auto* item = find_item(items_, index)) {
            completed << ": " << item->title;
        }
        completed << "\n" << record.summary << "\n\n";
    }
    if (!completed.str().empty()) {
        system << "\n\n## Completed Items\n" << completed.str();
    }

    if (current_item_) {
        system << "\n\n## Current Item\n";
        if (!current_item_->section.empty()) {
            system << "Section: " << current_item_->section << "\n";
        }
        system << current_item_->index + 1 << ". " << current_item_->title << "\n";
        if (!current_item_->description.empty()) {
            system << current_item_->description << "\n";
        }
    }

    return system.str();
}

int ContextBuilder::estimate_tokens(const std::string& text) const {
    // Rough estimate: ~3.5 characters per token
    return static_cast<int>(text.length() / 3.5);
}

int ContextBuilder::estimate_message_tokens(const Message& msg) const {
    return 3 + estimate_tokens(msg.content);  // Role overhead
}

int ContextBuilder::estimated_tokens() const {
    int tokens = estimate_tokens(render_system_prompt());
    for (const auto& msg : transcript_) {
        tokens += estimate_message_tokens(msg);
    }
    return tokens;
}

Result<PromptWindow, Error> ContextBuilder::build() {
    PromptWindow window;
    window.system_prompt = render_system_prompt();
    window.messages = transcript_;

    window.estimated_tokens = estimate_tokens(window.system_prompt);
    for (const auto& msg : window.messages) {
        window.estimated_tokens += estimate_message_tokens(msg);
    }

    if (window.estimated_tokens > config_.max_prompt_tokens) {
        return Result<PromptWindow, Error>::err(
            ErrorCode::ContextTooLarge,
            "Prompt exceeds maximum tokens: " +
                std::to_string(window.estimated_tokens) + " > " +
                std::to_string(config_.max_prompt_tokens)
        );
    }

    return Result<PromptWindow, Error>::ok(std::move(window));
}

}  // namespace domore::context
