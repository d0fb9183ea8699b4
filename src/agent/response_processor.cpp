#include "domore/agent/response_processor.hpp"
#include "domore/commands/command_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace domore::agent {

bool ProcessedResponse::all_succeeded() const {
    return std::all_of(command_results.begin(), command_results.end(),
                       [](const commands::CommandResult& r) { return r.success; });
}

Json ProcessedResponse::to_json() const {
    Json results = Json::array();
    for (const auto& result : command_results) {
        results.push_back(result.to_json());
    }

    Json j{
        {"visible_text", visible_text},
        {"command_results", results}
    };
    if (file_request) {
        j["file_request"] = file_request->files;
    }
    if (file_outcome) {
        Json entries = Json::array();
        for (const auto& entry : file_outcome->entries()) {
            entries.push_back({{"path", entry.path}, {entry.ok() ? "content" : "error", entry.text}});
        }
        j["file_outcome"] = entries;
    }
    return j;
}

ResponseProcessor::ResponseProcessor(commands::CommandExecutor& executor,
                                     files::FileRequestHandler& file_requests,
                                     sandbox::ProjectLocks& locks)
    : executor_(executor)
    , file_requests_(file_requests)
    , locks_(locks)
{
}

Result<ProcessedResponse, Error> ResponseProcessor::process(const std::string& text,
                                                            const ProjectSandbox& sandbox) {
    if (!sandbox.has_root()) {
        return Result<ProcessedResponse, Error>::err(
            ErrorCode::ProjectNotSet,
            "Project folder not set"
        );
    }

    auto lock = locks_.acquire(sandbox);

    ProcessedResponse response;

    auto parsed = commands::parse_commands(text);
    response.command_results = executor_.execute_all(parsed, sandbox);

    response.file_request = files::detect_file_request(text);
    if (response.file_request) {
        auto outcome = file_requests_.fulfil(*response.file_request, sandbox);
        if (outcome.is_err()) {
            return Result<ProcessedResponse, Error>::err(std::move(outcome).error());
        }
        response.visible_text = files::inject_file_contents(text, *response.file_request, outcome.value());
        response.file_outcome = std::move(outcome).value();
    } else {
        response.visible_text = text;
    }

    if (!response.command_results.empty()) {
        auto failed = std::count_if(response.command_results.begin(), response.command_results.end(),
                                    [](const commands::CommandResult& r) { return !r.success; });
        spdlog::info("Processed response: {} command(s), {} failed",
                     response.command_results.size(), failed);
    }

    return Result<ProcessedResponse, Error>::ok(std::move(response));
}

}  // namespace domore::agent
