#pragma once

#include "command.hpp"
#include "domore/sandbox/project_sandbox.hpp"

#include <mutex>
#include <vector>

namespace domore::files {
class DescriptionService;
}

namespace domore::commands {

using sandbox::ProjectSandbox;

// Applies parsed commands against a project sandbox.
// Every command yields exactly one CommandResult; a failure never stops the
// commands after it.
class CommandExecutor {
public:
    // descriptions may be null, which disables description enrichment
    explicit CommandExecutor(files::DescriptionService* descriptions = nullptr);

    CommandResult execute(const Command& command, const ProjectSandbox& sandbox);

    // Sequential, in order; results correspond one-to-one with commands
    std::vector<CommandResult> execute_all(const std::vector<Command>& commands,
                                           const ProjectSandbox& sandbox);

    struct Stats {
        int total = 0;
        int succeeded = 0;
        int failed = 0;
    };
    Stats get_stats() const;
    void reset_stats();

private:
    Result<void, Error> apply(const CreateCommand& cmd, const ProjectSandbox& sandbox);
    Result<void, Error> apply(const ModifyCommand& cmd, const ProjectSandbox& sandbox);
    Result<void, Error> apply(const DeleteCommand& cmd, const ProjectSandbox& sandbox);

    void record_execution(bool success);

    files::DescriptionService* descriptions_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace domore::commands
