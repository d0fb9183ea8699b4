#include "domore/commands/command.hpp"

#include <type_traits>

namespace domore::commands {

Json command_to_json(const Command& command) {
    Json j;
    j["command"] = std::string(command_kind_to_string(kind_of(command)));

    auto put = [&j](const char* key, const std::optional<std::string>& value) {
        if (value) {
            j[key] = *value;
        }
    };

    std::visit([&put](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        put("fileName", c.file_name);
        if constexpr (std::is_same_v<T, CreateCommand>) {
            put("content", c.content);
            put("description", c.description);
        } else if constexpr (std::is_same_v<T, ModifyCommand>) {
            put("oldContent", c.old_content);
            put("newContent", c.new_content);
        }
    }, command);

    return j;
}

Json CommandResult::to_json() const {
    Json j{
        {"command", std::string(command_kind_to_string(kind_of(command)))},
        {"fileName", file_name_of(command)},
        {"success", success}
    };
    if (error) {
        j["error"] = error->message;
    }
    return j;
}

}  // namespace domore::commands
