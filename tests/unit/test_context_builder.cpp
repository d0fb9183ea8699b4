#include <catch2/catch.hpp>
#include "domore/context/context_builder.hpp"

using namespace domore::core;
using namespace domore::context;
using namespace domore::tasks;

namespace {

std::vector<TodoItem> three_items() {
    std::vector<TodoItem> items(3);
    items[0].index = 0;
    items[0].title = "Set up project";
    items[0].status = TodoStatus::Completed;
    items[1].index = 1;
    items[1].title = "Build header";
    items[1].description = "Logo left, navigation right";
    items[1].section = "Layout";
    items[1].status = TodoStatus::Active;
    items[2].index = 2;
    items[2].title = "Build footer";
    return items;
}

CompletedItemSummaries summaries_for(std::initializer_list<std::pair<ItemIndex, std::string>> entries) {
    CompletedItemSummaries summaries;
    for (const auto& [index, text] : entries) {
        summaries[index] = CompletedSummary{text, Clock::now()};
    }
    return summaries;
}

}  // namespace

TEST_CASE("System prompt sections", "[context]") {
    auto items = three_items();

    ContextBuilder builder(TaskConfig{});
    builder.with_instructions("You edit files.")
           .with_global_context("A landing page for developers.")
           .with_todo_items(items)
           .with_summaries(summaries_for({{0, "done setup"}}))
           .with_current_item(items[1]);

    auto window = builder.build();
    REQUIRE(window.is_ok());

    const std::string& prompt = window.value().system_prompt;
    REQUIRE(prompt.rfind("You edit files.", 0) == 0);
    REQUIRE(prompt.find("## Global Context\nA landing page for developers.") != std::string::npos);
    REQUIRE(prompt.find("- [completed] 1. Set up project") != std::string::npos);
    REQUIRE(prompt.find("- [active] 2. Build header") != std::string::npos);
    REQUIRE(prompt.find("- [pending] 3. Build footer") != std::string::npos);
    REQUIRE(prompt.find("### Item 1: Set up project\ndone setup") != std::string::npos);
    REQUIRE(prompt.find("## Current Item\nSection: Layout\n2. Build header\nLogo left, navigation right")
            != std::string::npos);

    REQUIRE(prompt.find("## Global Context") < prompt.find("## Task Progress"));
    REQUIRE(prompt.find("## Completed Items") < prompt.find("## Current Item"));
}

TEST_CASE("Only summaries of earlier items are included", "[context]") {
    auto items = three_items();

    ContextBuilder builder(TaskConfig{});
    builder.with_todo_items(items)
           .with_summaries(summaries_for({{0, "done setup"}, {2, "footer from an earlier run"}}))
           .with_current_item(items[1]);

    auto prompt = builder.build().value().system_prompt;
    REQUIRE(prompt.find("done setup") != std::string::npos);
    REQUIRE(prompt.find("footer from an earlier run") == std::string::npos);
}

TEST_CASE("Empty sections are omitted", "[context]") {
    ContextBuilder builder(TaskConfig{});
    builder.with_instructions("Base instructions");

    auto prompt = builder.build().value().system_prompt;
    REQUIRE(prompt == "Base instructions");
}

TEST_CASE("Transcript is passed through", "[context]") {
    auto items = three_items();
    std::vector<Message> transcript{
        Message::user("Make the header sticky"),
        Message::assistant("Done, see header.css")
    };

    ContextBuilder builder(TaskConfig{});
    builder.with_current_item(items[1]).with_transcript(transcript);

    auto window = builder.build();
    REQUIRE(window.value().messages.size() == 2);
    REQUIRE(window.value().messages[0].content == "Make the header sticky");
    REQUIRE(window.value().messages[1].role == Role::Assistant);
    REQUIRE(role_to_string(window.value().messages[0].role) == "user");
    REQUIRE(window.value().estimated_tokens == builder.estimated_tokens());
}

TEST_CASE("Prompt over the token limit is rejected", "[context]") {
    TaskConfig config;
    config.max_prompt_tokens = 100;

    ContextBuilder builder(config);
    builder.with_global_context(std::string(1000, 'x'));

    REQUIRE(builder.estimated_tokens() > 100);

    auto window = builder.build();
    REQUIRE(window.is_err());
    REQUIRE(window.error().code == ErrorCode::ContextTooLarge);
}
