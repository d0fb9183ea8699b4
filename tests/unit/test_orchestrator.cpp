#include <catch2/catch.hpp>
#include "domore/agent/orchestrator.hpp"
#include "test_helpers.hpp"

#include <deque>

using namespace domore::core;
using namespace domore::agent;
using namespace domore::tasks;
using domore::testing::TempProject;

namespace {

class ScriptedQuestions : public QuestionSource {
public:
    std::vector<ClarificationQuestion> questions{
        {"Who is the audience?", std::nullopt},
        {"Which colors?", std::nullopt}
    };
    bool fail = false;

    Result<std::vector<ClarificationQuestion>, Error> questions_for(const std::string&) override {
        if (fail) {
            return Result<std::vector<ClarificationQuestion>, Error>::err(ErrorCode::Unknown, "timed out");
        }
        return Result<std::vector<ClarificationQuestion>, Error>::ok(questions);
    }
};

class ScriptedSummarizer : public ContextSummarizer {
public:
    bool fail = false;
    std::vector<std::string> last_answers;

    Result<std::string, Error> summarize(const ClarificationSession& session) override {
        last_answers = session.answers();
        if (fail) {
            return Result<std::string, Error>::err(ErrorCode::Unknown, "timed out");
        }
        std::string audience = session.answers().empty() ? "everyone" : session.answers()[0];
        return Result<std::string, Error>::ok("Landing page for " + audience);
    }
};

class ScriptedTodos : public TodoGenerator {
public:
    bool fail = false;
    bool empty = false;

    Result<std::vector<TodoItem>, Error> generate(const std::string&) override {
        if (fail) {
            return Result<std::vector<TodoItem>, Error>::err(ErrorCode::Unknown, "timed out");
        }
        std::vector<TodoItem> items;
        if (!empty) {
            for (const char* title : {"Set up project", "Build header", "Build footer"}) {
                TodoItem item;
                item.index = 42;  // Reassigned by position
                item.title = title;
                item.status = TodoStatus::Completed;
                items.push_back(item);
            }
        }
        return Result<std::vector<TodoItem>, Error>::ok(std::move(items));
    }
};

// Replays queued replies; an empty queue fails the call
class ScriptedModel : public ModelClient {
public:
    std::deque<std::string> replies;
    std::vector<domore::context::PromptWindow> prompts;

    Result<std::string, Error> complete(const domore::context::PromptWindow& prompt) override {
        prompts.push_back(prompt);
        if (replies.empty()) {
            return Result<std::string, Error>::err(ErrorCode::Unknown, "no reply");
        }
        std::string reply = replies.front();
        replies.pop_front();
        return Result<std::string, Error>::ok(std::move(reply));
    }
};

std::string all_content(const domore::context::PromptWindow& prompt) {
    std::string text = prompt.system_prompt;
    for (const auto& msg : prompt.messages) {
        text += "\n" + msg.content;
    }
    return text;
}

struct Harness {
    TempProject project;
    ScriptedQuestions questions;
    ScriptedSummarizer summarizer;
    ScriptedTodos todos;
    ScriptedModel model;
    FileTaskStore store;
    domore::commands::CommandExecutor executor;
    domore::files::FileRequestHandler file_requests;
    domore::sandbox::ProjectLocks locks;
    ResponseProcessor processor{executor, file_requests, locks};

    std::unique_ptr<TaskOrchestrator> make(TaskOrchestrator::Config config = {}) {
        return std::make_unique<TaskOrchestrator>(config, project.sandbox(), questions, summarizer,
                                                  todos, model, store, processor);
    }

    // Walks clarification and starts execution
    std::unique_ptr<TaskOrchestrator> executing(TaskOrchestrator::Config config = {}) {
        auto orchestrator = make(config);
        REQUIRE(orchestrator->begin("proj-1", "Build a landing page").is_ok());
        REQUIRE(orchestrator->next_question("developers").is_ok());
        REQUIRE(orchestrator->next_question("blue").is_ok());
        REQUIRE(orchestrator->start_execution().is_ok());
        return orchestrator;
    }
};

}  // namespace

TEST_CASE("Clarification produces context and todo list", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    REQUIRE(orchestrator->phase() == TaskPhase::TaskEntry);
    REQUIRE(orchestrator->begin("proj-1", "  Build a landing page ").is_ok());
    REQUIRE(orchestrator->phase() == TaskPhase::Clarifying);
    REQUIRE(orchestrator->session()->task_description() == "Build a landing page");

    REQUIRE(orchestrator->next_question("developers").is_ok());
    REQUIRE(orchestrator->phase() == TaskPhase::Clarifying);
    REQUIRE(orchestrator->previous_question("green").is_ok());
    REQUIRE(orchestrator->session()->current_index() == 0);
    REQUIRE(orchestrator->next_question("developers").is_ok());
    REQUIRE(orchestrator->session()->current_answer() == "green");
    REQUIRE(orchestrator->next_question("blue").is_ok());

    REQUIRE(h.summarizer.last_answers == std::vector<std::string>{"developers", "blue"});
    REQUIRE(orchestrator->phase() == TaskPhase::ContextReady);
    REQUIRE(orchestrator->global_context() == "Landing page for developers");
    REQUIRE(h.project.read("globalContext.txt") == "Landing page for developers");

    const auto& items = orchestrator->items();
    REQUIRE(items.size() == 3);
    for (size_t i = 0; i < items.size(); ++i) {
        REQUIRE(items[i].index == static_cast<ItemIndex>(i));
        REQUIRE(items[i].status == TodoStatus::Pending);
    }
    REQUIRE_FALSE(orchestrator->session().has_value());
    REQUIRE(h.project.exists("todoList.json"));
}

TEST_CASE("Begin rejects empty tasks and failing question sources", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    auto empty = orchestrator->begin("proj-1", "   ");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == ErrorCode::InvalidArgument);

    h.questions.fail = true;
    auto failed = orchestrator->begin("proj-1", "Build a landing page");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ErrorCode::CollaboratorFailure);
    REQUIRE(orchestrator->phase() == TaskPhase::TaskEntry);
}

TEST_CASE("Task without clarification questions", "[orchestrator]") {
    Harness h;
    h.questions.questions.clear();
    auto orchestrator = h.make();

    REQUIRE(orchestrator->begin("proj-1", "Tidy up").is_ok());
    REQUIRE(orchestrator->next_question("").is_ok());
    REQUIRE(orchestrator->phase() == TaskPhase::ContextReady);
    REQUIRE(orchestrator->items().size() == 3);
}

TEST_CASE("Summarizer failure keeps the answers for a retry", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    REQUIRE(orchestrator->begin("proj-1", "Build a landing page").is_ok());
    REQUIRE(orchestrator->next_question("developers").is_ok());

    h.summarizer.fail = true;
    auto failed = orchestrator->next_question("blue");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ErrorCode::CollaboratorFailure);
    REQUIRE(orchestrator->phase() == TaskPhase::Clarifying);
    REQUIRE(orchestrator->session()->answers() == std::vector<std::string>{"developers", "blue"});
    REQUIRE_FALSE(h.project.exists("globalContext.txt"));

    h.summarizer.fail = false;
    REQUIRE(orchestrator->generate_context().is_ok());
    REQUIRE(orchestrator->generate_todo_list().is_ok());
    REQUIRE(orchestrator->items().size() == 3);
}

TEST_CASE("Todo generator failure keeps the global context", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make();
    REQUIRE(orchestrator->begin("proj-1", "Build a landing page").is_ok());
    REQUIRE(orchestrator->next_question("developers").is_ok());

    SECTION("Error result") {
        h.todos.fail = true;
    }

    SECTION("Empty list") {
        h.todos.empty = true;
    }

    auto failed = orchestrator->next_question("blue");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ErrorCode::CollaboratorFailure);
    REQUIRE(orchestrator->phase() == TaskPhase::ContextReady);
    REQUIRE(orchestrator->global_context() == "Landing page for developers");
    REQUIRE(orchestrator->items().empty());

    h.todos.fail = false;
    h.todos.empty = false;
    REQUIRE(orchestrator->generate_todo_list().is_ok());
    REQUIRE(orchestrator->start_execution().is_ok());
}

TEST_CASE("Start execution activates the first item", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();

    REQUIRE(orchestrator->phase() == TaskPhase::Executing);
    REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(0));
    REQUIRE(orchestrator->items()[0].status == TodoStatus::Active);
    REQUIRE(orchestrator->items()[1].status == TodoStatus::Pending);

    auto wrong = orchestrator->start_execution();
    REQUIRE(wrong.is_err());
    REQUIRE(wrong.error().code == ErrorCode::InvalidState);
}

TEST_CASE("Completed item contributes only its summary", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();

    h.model.replies.push_back("Scaffolding created in the project root.");
    auto turn = orchestrator->send_message("Please scaffold the project");
    REQUIRE(turn.is_ok());
    REQUIRE(turn.value().reply == "Scaffolding created in the project root.");
    REQUIRE(orchestrator->transcript().size() == 2);

    REQUIRE(orchestrator->complete_active_item("done setup").is_ok());
    REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(1));
    REQUIRE(orchestrator->items()[0].status == TodoStatus::Completed);
    REQUIRE(orchestrator->items()[1].status == TodoStatus::Active);
    REQUIRE(orchestrator->transcript().empty());

    auto prompt = orchestrator->build_prompt();
    REQUIRE(prompt.is_ok());
    std::string content = all_content(prompt.value());
    REQUIRE(content.find("done setup") != std::string::npos);
    REQUIRE(content.find("Please scaffold the project") == std::string::npos);
    REQUIRE(content.find("Scaffolding created") == std::string::npos);

    auto stored = h.store.load_summaries(h.project.sandbox());
    REQUIRE(stored.value().at(0).summary == "done setup");
}

TEST_CASE("Completing every item finishes the task", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();

    auto empty = orchestrator->complete_active_item("  ");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == ErrorCode::InvalidArgument);

    REQUIRE(orchestrator->complete_active_item("one").is_ok());
    REQUIRE(orchestrator->complete_active_item("two").is_ok());
    REQUIRE(orchestrator->complete_active_item("three").is_ok());

    REQUIRE(orchestrator->phase() == TaskPhase::Completed);
    REQUIRE_FALSE(orchestrator->active_index().has_value());
    REQUIRE(orchestrator->summaries().size() == 3);
    REQUIRE(orchestrator->review_item(1).value().summary == std::optional<std::string>("two"));

    auto missing = orchestrator->review_item(7);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("File requests are fulfilled before the reply", "[orchestrator]") {
    Harness h;
    h.project.write("index.html", "<h1>Hello</h1>");
    auto orchestrator = h.executing();

    h.model.replies.push_back("Let me look at the page.\n{\"files\": [\"index.html\"]}");
    h.model.replies.push_back("The heading says Hello.");

    auto turn = orchestrator->send_message("What does the page say?");
    REQUIRE(turn.is_ok());
    REQUIRE(turn.value().rounds.size() == 2);
    REQUIRE(turn.value().reply == "The heading says Hello.");
    REQUIRE_FALSE(turn.value().file_request_pending);

    REQUIRE(h.model.prompts.size() == 2);
    std::string second = all_content(h.model.prompts[1]);
    REQUIRE(second.find("### index.html") != std::string::npos);
    REQUIRE(second.find("<h1>Hello</h1>") != std::string::npos);

    // user, assistant (request stripped), file contents, assistant
    REQUIRE(orchestrator->transcript().size() == 4);
    REQUIRE(orchestrator->transcript()[1].content == "Let me look at the page.\n");
}

TEST_CASE("File request rounds are bounded", "[orchestrator]") {
    Harness h;
    h.project.write("a.txt", "alpha");
    TaskOrchestrator::Config config;
    config.max_file_request_rounds = 2;
    auto orchestrator = h.executing(config);

    for (int i = 0; i < 5; ++i) {
        h.model.replies.push_back("{\"files\": [\"a.txt\"]}");
    }

    auto turn = orchestrator->send_message("Read it again and again");
    REQUIRE(turn.is_ok());
    REQUIRE(turn.value().rounds.size() == 2);
    REQUIRE(turn.value().file_request_pending);
    REQUIRE(h.model.prompts.size() == 2);
}

TEST_CASE("Round limit and token budget come from the configuration", "[orchestrator]") {
    domore::core::Config app;
    app.file_requests.max_rounds = 5;
    app.tasks.max_prompt_tokens = 2000;

    auto config = TaskOrchestrator::Config::from(app);
    REQUIRE(config.max_file_request_rounds == 5);
    REQUIRE(config.max_prompt_tokens == 2000);
    REQUIRE(config.instructions.empty());
}

TEST_CASE("Model failure rolls the turn back", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();

    auto failed = orchestrator->send_message("Hello?");
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ErrorCode::CollaboratorFailure);
    REQUIRE(orchestrator->transcript().empty());
    REQUIRE(orchestrator->phase() == TaskPhase::Executing);

    h.model.replies.push_back("Hi.");
    REQUIRE(orchestrator->send_message("Hello?").is_ok());
    REQUIRE(orchestrator->transcript().size() == 2);
}

TEST_CASE("Commands in replies change the project", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();

    h.model.replies.push_back(
        "Creating the stylesheet.\n"
        "```json\n"
        "{\"command\": \"Create\", \"fileName\": \"css/site.css\", \"content\": \"body { color: blue; }\"}\n"
        "```");

    auto turn = orchestrator->send_message("Add a stylesheet");
    REQUIRE(turn.is_ok());
    REQUIRE(turn.value().rounds[0].command_results.size() == 1);
    REQUIRE(turn.value().rounds[0].all_succeeded());
    REQUIRE(h.project.read("css/site.css") == "body { color: blue; }");
}

TEST_CASE("Reopen a completed item", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.executing();
    REQUIRE(orchestrator->complete_active_item("one").is_ok());
    REQUIRE(orchestrator->complete_active_item("two").is_ok());

    auto not_completed = orchestrator->reopen_item(2);
    REQUIRE(not_completed.is_err());
    REQUIRE(not_completed.error().code == ErrorCode::InvalidState);

    REQUIRE(orchestrator->reopen_item(0).is_ok());
    REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(0));
    REQUIRE(orchestrator->items()[0].status == TodoStatus::Active);
    REQUIRE(orchestrator->items()[2].status == TodoStatus::Pending);
    REQUIRE(orchestrator->summaries().count(1) == 1);

    REQUIRE(orchestrator->complete_active_item("one, revised").is_ok());
    REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(2));
    REQUIRE(orchestrator->summaries().at(0).summary == "one, revised");
}

TEST_CASE("Resume rebuilds state from the store", "[orchestrator]") {
    Harness h;

    SECTION("Nothing stored") {
        auto orchestrator = h.make();
        REQUIRE(orchestrator->resume().is_ok());
        REQUIRE(orchestrator->phase() == TaskPhase::TaskEntry);
    }

    SECTION("Context and list, not started") {
        {
            auto first = h.make();
            REQUIRE(first->begin("proj-1", "Build a landing page").is_ok());
            REQUIRE(first->next_question("developers").is_ok());
            REQUIRE(first->next_question("blue").is_ok());
        }

        auto orchestrator = h.make();
        REQUIRE(orchestrator->resume().is_ok());
        REQUIRE(orchestrator->phase() == TaskPhase::ContextReady);
        REQUIRE(orchestrator->items().size() == 3);
        REQUIRE(orchestrator->start_execution().is_ok());
    }

    SECTION("Mid execution") {
        {
            auto first = h.executing();
            REQUIRE(first->complete_active_item("done setup").is_ok());
        }

        auto orchestrator = h.make();
        REQUIRE(orchestrator->resume().is_ok());
        REQUIRE(orchestrator->phase() == TaskPhase::Executing);
        REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(1));
        REQUIRE(orchestrator->global_context() == "Landing page for developers");
        REQUIRE(orchestrator->items()[0].summary == std::optional<std::string>("done setup"));

        auto prompt = orchestrator->build_prompt();
        REQUIRE(all_content(prompt.value()).find("done setup") != std::string::npos);
    }

    SECTION("Stray summaries and duplicate active items") {
        h.project.write("todoList.json", R"({"items": [
            {"title": "A", "status": "active"},
            {"title": "B", "status": "active"}
        ]})");
        h.project.write("completedItems.json",
                        R"({"9": {"summary": "unknown item", "timestamp": "2024-05-01T10:00:00Z"}})");

        auto orchestrator = h.make();
        REQUIRE(orchestrator->resume().is_ok());
        REQUIRE(orchestrator->active_index() == std::optional<ItemIndex>(0));
        REQUIRE(orchestrator->items()[1].status == TodoStatus::Pending);
        REQUIRE(orchestrator->summaries().empty());
    }

    SECTION("All items completed") {
        {
            auto first = h.executing();
            REQUIRE(first->complete_active_item("one").is_ok());
            REQUIRE(first->complete_active_item("two").is_ok());
            REQUIRE(first->complete_active_item("three").is_ok());
        }

        auto orchestrator = h.make();
        REQUIRE(orchestrator->resume().is_ok());
        REQUIRE(orchestrator->phase() == TaskPhase::Completed);
        REQUIRE(orchestrator->reopen_item(1).is_ok());
        REQUIRE(orchestrator->phase() == TaskPhase::Executing);
    }
}

TEST_CASE("Actions in the wrong phase are rejected", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.make();

    REQUIRE(orchestrator->next_question("x").error().code == ErrorCode::InvalidState);
    REQUIRE(orchestrator->generate_todo_list().error().code == ErrorCode::InvalidState);
    REQUIRE(orchestrator->send_message("x").error().code == ErrorCode::InvalidState);
    REQUIRE(orchestrator->complete_active_item("x").error().code == ErrorCode::InvalidState);
    REQUIRE(orchestrator->build_prompt().error().code == ErrorCode::InvalidState);
}
