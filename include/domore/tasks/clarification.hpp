#pragma once

#include "domore/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace domore::tasks {

using namespace domore::core;

struct ClarificationQuestion {
    std::string text;
    std::optional<std::string> hint;
};

struct QuestionAnswer {
    std::string question;
    std::string answer;
};

// Cursor over the clarification questions of one task.
// Answers are indexed by question position and default to empty.
class ClarificationSession {
public:
    ClarificationSession() = default;
    ClarificationSession(ProjectId project_id, std::string task_description,
                         std::vector<ClarificationQuestion> questions);

    const ProjectId& project_id() const { return project_id_; }
    const std::string& task_description() const { return task_description_; }
    const std::vector<ClarificationQuestion>& questions() const { return questions_; }
    const std::vector<std::string>& answers() const { return answers_; }

    size_t current_index() const { return current_index_; }
    bool empty() const { return questions_.empty(); }
    bool at_last() const;

    // Question under the cursor; nullptr when there are no questions
    const ClarificationQuestion* current_question() const;
    const std::string& current_answer() const;

    // Store the trimmed answer at the cursor, then advance.
    // Returns true when this was the last question; the cursor stays put.
    bool next(const std::string& answer);

    // Store the trimmed answer at the cursor, then step back (floor 0)
    void previous(const std::string& answer);

    std::vector<QuestionAnswer> exchanges() const;

    Json to_json() const;

private:
    void store_answer(const std::string& answer);

    ProjectId project_id_;
    std::string task_description_;
    std::vector<ClarificationQuestion> questions_;
    std::vector<std::string> answers_;
    size_t current_index_ = 0;
};

}  // namespace domore::tasks
