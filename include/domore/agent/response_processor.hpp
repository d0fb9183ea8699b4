#pragma once

#include "domore/commands/command_executor.hpp"
#include "domore/files/file_request.hpp"
#include "domore/sandbox/project_locks.hpp"

#include <optional>
#include <string>
#include <vector>

namespace domore::agent {

using namespace domore::core;
using sandbox::ProjectSandbox;

struct ProcessedResponse {
    // Response text with the raw file request removed and the formatted
    // file contents appended
    std::string visible_text;

    std::vector<commands::CommandResult> command_results;  // Parse order
    std::optional<files::FileRequest> file_request;
    std::optional<files::FileReadOutcome> file_outcome;

    bool all_succeeded() const;
    bool has_file_request() const { return file_request.has_value(); }

    Json to_json() const;
};

// Turns one agent response into side effects: commands are executed in
// order, then a file request (if any) is fulfilled. Responses for the same
// project are serialized on the project lock.
class ResponseProcessor {
public:
    ResponseProcessor(commands::CommandExecutor& executor,
                      files::FileRequestHandler& file_requests,
                      sandbox::ProjectLocks& locks);

    Result<ProcessedResponse, Error> process(const std::string& text, const ProjectSandbox& sandbox);

private:
    commands::CommandExecutor& executor_;
    files::FileRequestHandler& file_requests_;
    sandbox::ProjectLocks& locks_;
};

}  // namespace domore::agent
