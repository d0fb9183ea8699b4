#include "domore/commands/command_parser.hpp"
#include "domore/core/json_scanner.hpp"

#include <spdlog/spdlog.h>

namespace domore::commands {

namespace {

// Non-string values count as absent
std::optional<std::string> string_field(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

std::optional<Command> command_from_json(const Json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto kind_name = string_field(j, "command");
    if (!kind_name) {
        return std::nullopt;
    }

    auto kind = command_kind_from_string(*kind_name);
    if (!kind) {
        spdlog::warn("Ignoring unknown command kind: {}", *kind_name);
        return std::nullopt;
    }

    switch (*kind) {
        case CommandKind::Create:
            return Command{CreateCommand{
                .file_name = string_field(j, "fileName"),
                .content = string_field(j, "content"),
                .description = string_field(j, "description"),
            }};
        case CommandKind::Modify:
            return Command{ModifyCommand{
                .file_name = string_field(j, "fileName"),
                .old_content = string_field(j, "oldContent"),
                .new_content = string_field(j, "newContent"),
            }};
        case CommandKind::Delete:
            return Command{DeleteCommand{
                .file_name = string_field(j, "fileName"),
            }};
    }
    return std::nullopt;
}

std::vector<Command> parse_commands(std::string_view text) {
    std::vector<Command> commands;

    for (const auto& candidate : find_json_objects(text)) {
        auto command = command_from_json(candidate.value);
        if (!command) {
            spdlog::debug("Skipping object without command at offset {}", candidate.offset);
            continue;
        }

        commands.push_back(std::move(*command));
    }

    spdlog::debug("Parsed {} command(s)", commands.size());
    return commands;
}

}  // namespace domore::commands
