#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace domore::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    InvalidState = 4,
    InternalError = 5,

    // Sandbox errors (100-199)
    SandboxViolation = 100,
    ProjectNotSet = 101,

    // Command errors (200-299)
    MalformedCommand = 200,
    PatternNotFound = 201,

    // File system errors (300-399)
    FileNotFound = 300,
    FileReadFailed = 301,
    FileWriteFailed = 302,
    FileDeleteFailed = 303,
    FileTooLarge = 304,

    // Collaborator errors (400-499)
    CollaboratorFailure = 400,

    // Persistence errors (500-599)
    StoreLoadFailed = 500,
    StoreSaveFailed = 501,

    // Context errors (600-699)
    ContextTooLarge = 600,

    // Configuration errors (700-799)
    ConfigNotFound = 700,
    ConfigParseFailed = 701,
    ConfigValidationFailed = 702,
};

inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";

        case ErrorCode::SandboxViolation: return "Security violation - path outside project folder";
        case ErrorCode::ProjectNotSet: return "Project folder not set";

        case ErrorCode::MalformedCommand: return "Malformed command";
        case ErrorCode::PatternNotFound: return "Pattern not found in file";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
        case ErrorCode::FileDeleteFailed: return "Failed to delete file";
        case ErrorCode::FileTooLarge: return "File too large";

        case ErrorCode::CollaboratorFailure: return "Collaborator call failed";

        case ErrorCode::StoreLoadFailed: return "Failed to load task artifact";
        case ErrorCode::StoreSaveFailed: return "Failed to save task artifact";

        case ErrorCode::ContextTooLarge: return "Context too large";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
    }
    return "Unknown error code";
}

// Errors a caller can fix by retrying the same action later
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::CollaboratorFailure:
        case ErrorCode::StoreSaveFailed:
        case ErrorCode::FileWriteFailed:
            return true;
        default:
            return false;
    }
}

// Errors produced by the path containment check
inline bool is_security_error(ErrorCode code) {
    return code == ErrorCode::SandboxViolation;
}

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // File path, command kind, collaborator name
    std::optional<std::string> source;   // Component that produced the error

    Error() : code(ErrorCode::Unknown), message(std::string(error_code_message(ErrorCode::Unknown))) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    Error& with_source(std::string src) {
        source = std::move(src);
        return *this;
    }

    bool is_retriable() const { return domore::core::is_retriable(code); }
    bool is_security_error() const { return domore::core::is_security_error(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace domore::core
