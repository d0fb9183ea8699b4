#pragma once

#include "command.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace domore::commands {

// Extract every Create/Modify/Delete command embedded in agent text, in
// order of appearance. Candidates are bare JSON objects or objects inside a
// ```json fence; objects inside other fences are code, not commands.
// Candidates without a known "command" discriminator are skipped and logged.
// Pure: no I/O.
std::vector<Command> parse_commands(std::string_view text);

// Convert one JSON object; nullopt when it carries no known command kind
std::optional<Command> command_from_json(const Json& j);

}  // namespace domore::commands
