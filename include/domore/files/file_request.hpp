#pragma once

#include "domore/core/config.hpp"
#include "domore/core/result.hpp"
#include "domore/core/thread_pool.hpp"
#include "domore/sandbox/project_sandbox.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domore::files {

using namespace domore::core;
using sandbox::ProjectSandbox;

// Agent-issued {"files": [...]} request found in response text
struct FileRequest {
    std::vector<std::string> files;
    size_t offset = 0;  // Where the raw object starts in the text
    size_t length = 0;  // Length of the raw object
};

// The first JSON object carrying a "files" key decides. A non-array value,
// an empty array, or an array without string entries yields no request.
std::optional<FileRequest> detect_file_request(std::string_view text);

// Requested path -> content or human-readable error.
// Keys keep request order; a duplicate path overwrites its entry in place.
class FileReadOutcome {
public:
    struct Entry {
        std::string path;
        std::string text;                   // File content, or the error message
        std::optional<ErrorCode> error;     // Set when text is an error message

        bool ok() const { return !error.has_value(); }
    };

    void set_content(const std::string& path, std::string content);
    void set_error(const std::string& path, ErrorCode code, std::string message);

    const Entry* find(std::string_view path) const;
    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Ordered {path: text} object
    nlohmann::ordered_json to_json() const;

private:
    void put(Entry entry);

    std::vector<Entry> entries_;
};

// Reads every requested path through the sandbox. Individual failures become
// entries; only a missing project root fails the whole call.
class FileRequestHandler {
public:
    explicit FileRequestHandler(FileRequestConfig config = {});
    ~FileRequestHandler();

    FileRequestHandler(const FileRequestHandler&) = delete;
    FileRequestHandler& operator=(const FileRequestHandler&) = delete;

    Result<FileReadOutcome, Error> fulfil(const FileRequest& request,
                                          const ProjectSandbox& sandbox) const;

    const FileRequestConfig& config() const { return config_; }

private:
    FileRequestConfig config_;
    std::unique_ptr<ThreadPool> pool_;  // Only when parallel_reads > 1
};

// Fence language for a path, empty when the extension renders as plain text
std::string fence_language(std::string_view path);

// "## FILE CONTENTS" section for reinjection into the agent's context
std::string format_file_contents(const FileReadOutcome& outcome);

// Text with the raw request object removed
std::string strip_request(std::string_view text, const FileRequest& request);

// Stripped text followed by the formatted file section
std::string inject_file_contents(std::string_view text, const FileRequest& request,
                                 const FileReadOutcome& outcome);

}  // namespace domore::files
