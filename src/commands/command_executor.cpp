#include "domore/commands/command_executor.hpp"
#include "domore/files/description_service.hpp"

#include <spdlog/spdlog.h>

namespace domore::commands {

namespace {

Result<void, Error> malformed(CommandKind kind, const std::string& message) {
    return Result<void, Error>::err(
        ErrorCode::MalformedCommand,
        message,
        std::string(command_kind_to_string(kind))
    );
}

}  // namespace

CommandExecutor::CommandExecutor(files::DescriptionService* descriptions)
    : descriptions_(descriptions)
{
}

CommandResult CommandExecutor::execute(const Command& command, const ProjectSandbox& sandbox) {
    auto outcome = std::visit([this, &sandbox](const auto& cmd) {
        return apply(cmd, sandbox);
    }, command);

    record_execution(outcome.is_ok());

    if (outcome.is_err()) {
        spdlog::warn("{} {} failed: {}",
                     command_kind_to_string(kind_of(command)),
                     file_name_of(command),
                     outcome.error().message);
        return CommandResult::failed(command, std::move(outcome).error());
    }

    spdlog::info("{} {}", command_kind_to_string(kind_of(command)), file_name_of(command));
    return CommandResult::succeeded(command);
}

std::vector<CommandResult> CommandExecutor::execute_all(const std::vector<Command>& commands,
                                                        const ProjectSandbox& sandbox) {
    std::vector<CommandResult> results;
    results.reserve(commands.size());
    for (const auto& command : commands) {
        results.push_back(execute(command, sandbox));
    }
    return results;
}

Result<void, Error> CommandExecutor::apply(const CreateCommand& cmd, const ProjectSandbox& sandbox) {
    if (!cmd.file_name || cmd.file_name->empty() || !cmd.content) {
        return malformed(CommandKind::Create, "Missing fileName or content");
    }

    auto written = sandbox.write_file(*cmd.file_name, *cmd.content);
    if (written.is_err()) {
        return written;
    }

    if (cmd.description && descriptions_) {
        descriptions_->enqueue(sandbox, *cmd.file_name, cmd.description);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> CommandExecutor::apply(const ModifyCommand& cmd, const ProjectSandbox& sandbox) {
    if (!cmd.file_name || cmd.file_name->empty() ||
        !cmd.old_content || cmd.old_content->empty() || !cmd.new_content) {
        return malformed(CommandKind::Modify, "Missing fileName, oldContent or newContent");
    }

    auto current = sandbox.read_file(*cmd.file_name);
    if (current.is_err()) {
        return Result<void, Error>::err(std::move(current).error());
    }

    std::string content = std::move(current).value();
    auto pos = content.find(*cmd.old_content);
    if (pos == std::string::npos) {
        return Result<void, Error>::err(
            ErrorCode::PatternNotFound,
            "Pattern not found in file",
            *cmd.file_name
        );
    }

    std::string updated = content;
    updated.replace(pos, cmd.old_content->size(), *cmd.new_content);
    // Replacing a pattern with itself leaves the file as it was
    if (updated == content) {
        return Result<void, Error>::err(
            ErrorCode::PatternNotFound,
            "Pattern not found in file",
            *cmd.file_name
        );
    }

    auto written = sandbox.write_file(*cmd.file_name, updated);
    if (written.is_err()) {
        return written;
    }

    if (descriptions_) {
        descriptions_->enqueue(sandbox, *cmd.file_name);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> CommandExecutor::apply(const DeleteCommand& cmd, const ProjectSandbox& sandbox) {
    if (!cmd.file_name || cmd.file_name->empty()) {
        return malformed(CommandKind::Delete, "Missing fileName");
    }

    auto removed = sandbox.remove_file(*cmd.file_name);
    if (removed.is_err()) {
        return removed;
    }

    if (descriptions_) {
        descriptions_->forget(sandbox, *cmd.file_name);
    }
    return Result<void, Error>::ok();
}

void CommandExecutor::record_execution(bool success) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total++;
    if (success) {
        stats_.succeeded++;
    } else {
        stats_.failed++;
    }
}

CommandExecutor::Stats CommandExecutor::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void CommandExecutor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

}  // namespace domore::commands
