#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace domore::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Common type aliases
using ProjectId = std::string;
using ItemIndex = int;

// Message roles in an item transcript
enum class Role {
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

struct Message {
    Role role;
    std::string content;
    TimePoint timestamp;

    Message() : role(Role::User), timestamp(Clock::now()) {}

    Message(Role r, std::string c)
        : role(r), content(std::move(c)), timestamp(Clock::now()) {}

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }
};

// UTC timestamp in ISO-8601 form, e.g. 2024-05-01T12:30:00Z
inline std::string to_iso8601(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// Parse the form produced by to_iso8601; fractional seconds are ignored
inline std::optional<TimePoint> from_iso8601(const std::string& str) {
    std::tm tm{};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    return Clock::from_time_t(timegm(&tm));
}

// Trim ASCII whitespace from both ends
inline std::string trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(begin, end - begin + 1));
}

}  // namespace domore::core
