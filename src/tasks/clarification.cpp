#include "domore/tasks/clarification.hpp"

namespace domore::tasks {

ClarificationSession::ClarificationSession(ProjectId project_id, std::string task_description,
                                           std::vector<ClarificationQuestion> questions)
    : project_id_(std::move(project_id))
    , task_description_(std::move(task_description))
    , questions_(std::move(questions))
    , answers_(questions_.size())
{
}

bool ClarificationSession::at_last() const {
    return questions_.empty() || current_index_ + 1 >= questions_.size();
}

const ClarificationQuestion* ClarificationSession::current_question() const {
    if (questions_.empty()) {
        return nullptr;
    }
    return &questions_[current_index_];
}

const std::string& ClarificationSession::current_answer() const {
    static const std::string empty;
    if (answers_.empty()) {
        return empty;
    }
    return answers_[current_index_];
}

void ClarificationSession::store_answer(const std::string& answer) {
    if (!answers_.empty()) {
        answers_[current_index_] = trim(answer);
    }
}

bool ClarificationSession::next(const std::string& answer) {
    store_answer(answer);
    if (at_last()) {
        return true;
    }
    ++current_index_;
    return false;
}

void ClarificationSession::previous(const std::string& answer) {
    store_answer(answer);
    if (current_index_ > 0) {
        --current_index_;
    }
}

std::vector<QuestionAnswer> ClarificationSession::exchanges() const {
    std::vector<QuestionAnswer> result;
    result.reserve(questions_.size());
    for (size_t i = 0; i < questions_.size(); ++i) {
        result.push_back({questions_[i].text, answers_[i]});
    }
    return result;
}

Json ClarificationSession::to_json() const {
    Json qa = Json::array();
    for (const auto& exchange : exchanges()) {
        qa.push_back({{"question", exchange.question}, {"answer", exchange.answer}});
    }
    return Json{
        {"projectId", project_id_},
        {"taskDescription", task_description_},
        {"questionsAndAnswers", qa}
    };
}

}  // namespace domore::tasks
