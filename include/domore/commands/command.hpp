#pragma once

#include "domore/core/errors.hpp"
#include "domore/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace domore::commands {

using namespace domore::core;

// Optional fields distinguish "absent" from "empty string": an empty Create
// content is valid, a missing one is not.

struct CreateCommand {
    std::optional<std::string> file_name;
    std::optional<std::string> content;
    std::optional<std::string> description;
};

struct ModifyCommand {
    std::optional<std::string> file_name;
    std::optional<std::string> old_content;
    std::optional<std::string> new_content;
};

struct DeleteCommand {
    std::optional<std::string> file_name;
};

using Command = std::variant<CreateCommand, ModifyCommand, DeleteCommand>;

enum class CommandKind {
    Create,
    Modify,
    Delete
};

inline std::string_view command_kind_to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::Create: return "Create";
        case CommandKind::Modify: return "Modify";
        case CommandKind::Delete: return "Delete";
    }
    return "Unknown";
}

inline std::optional<CommandKind> command_kind_from_string(std::string_view str) {
    if (str == "Create") return CommandKind::Create;
    if (str == "Modify") return CommandKind::Modify;
    if (str == "Delete") return CommandKind::Delete;
    return std::nullopt;
}

// CommandKind follows the variant's alternative order
inline CommandKind kind_of(const Command& command) {
    return static_cast<CommandKind>(command.index());
}

// fileName of any command, empty when absent
inline std::string file_name_of(const Command& command) {
    return std::visit([](const auto& c) { return c.file_name.value_or(""); }, command);
}

// Wire form, as the agent writes it
Json command_to_json(const Command& command);

struct CommandResult {
    Command command;
    bool success = false;
    std::optional<Error> error;

    static CommandResult succeeded(Command cmd) {
        return CommandResult{std::move(cmd), true, std::nullopt};
    }

    static CommandResult failed(Command cmd, Error err) {
        return CommandResult{std::move(cmd), false, std::move(err)};
    }

    // {"command": "Create", "fileName": ..., "success": ..., "error": ...}
    Json to_json() const;
};

}  // namespace domore::commands
