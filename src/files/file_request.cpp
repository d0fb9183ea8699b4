#include "domore/files/file_request.hpp"
#include "domore/core/json_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <future>

namespace domore::files {

namespace {

constexpr std::array<std::string_view, 19> kCodeExtensions = {
    "js", "jsx", "ts", "tsx", "py", "java", "c", "cpp", "h", "cs",
    "html", "css", "scss", "json", "xml", "yaml", "yml", "md", "sh"
};

FileReadOutcome::Entry read_one(const ProjectSandbox& sandbox, const std::string& path) {
    auto content = sandbox.read_file(path);
    if (content.is_ok()) {
        spdlog::debug("Read requested file: {}", path);
        return {path, std::move(content).value(), std::nullopt};
    }

    const Error& err = content.error();
    switch (err.code) {
        case ErrorCode::SandboxViolation:
            return {path, "Error: Security violation - cannot access files outside project folder",
                    err.code};
        case ErrorCode::FileNotFound:
            return {path, "Error: File not found: " + path, err.code};
        case ErrorCode::FileTooLarge:
            return {path, "Error: File too large: " + path, err.code};
        default:
            spdlog::warn("Error reading file {}: {}", path, err.message);
            return {path, "Error reading file: " + err.message, err.code};
    }
}

}  // namespace

std::optional<FileRequest> detect_file_request(std::string_view text) {
    for (const auto& candidate : find_json_objects(text)) {
        auto it = candidate.value.find("files");
        if (it == candidate.value.end()) {
            continue;
        }

        if (!it->is_array()) {
            spdlog::debug("File request at offset {} has non-array files", candidate.offset);
            return std::nullopt;
        }

        FileRequest request;
        request.offset = candidate.offset;
        request.length = candidate.length;
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                request.files.push_back(entry.get<std::string>());
            }
        }

        if (request.files.empty()) {
            return std::nullopt;
        }

        spdlog::debug("Detected file request for {} file(s)", request.files.size());
        return request;
    }

    return std::nullopt;
}

// FileReadOutcome

void FileReadOutcome::put(Entry entry) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.path == entry.path; });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
}

void FileReadOutcome::set_content(const std::string& path, std::string content) {
    put(Entry{path, std::move(content), std::nullopt});
}

void FileReadOutcome::set_error(const std::string& path, ErrorCode code, std::string message) {
    put(Entry{path, std::move(message), code});
}

const FileReadOutcome::Entry* FileReadOutcome::find(std::string_view path) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.path == path; });
    return it != entries_.end() ? &*it : nullptr;
}

nlohmann::ordered_json FileReadOutcome::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& entry : entries_) {
        j[entry.path] = entry.text;
    }
    return j;
}

// FileRequestHandler

FileRequestHandler::FileRequestHandler(FileRequestConfig config)
    : config_(config)
{
    if (config_.parallel_reads > 1) {
        pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.parallel_reads));
    }
}

FileRequestHandler::~FileRequestHandler() = default;

Result<FileReadOutcome, Error> FileRequestHandler::fulfil(const FileRequest& request,
                                                          const ProjectSandbox& sandbox) const {
    if (!sandbox.has_root()) {
        return Result<FileReadOutcome, Error>::err(
            ErrorCode::ProjectNotSet,
            "Project folder not set"
        );
    }

    FileReadOutcome outcome;

    if (pool_ && request.files.size() > 1) {
        std::vector<std::future<FileReadOutcome::Entry>> pending;
        pending.reserve(request.files.size());
        for (const auto& path : request.files) {
            pending.push_back(pool_->submit([&sandbox, path] { return read_one(sandbox, path); }));
        }
        // Aggregate in request order regardless of completion order
        for (auto& future : pending) {
            auto entry = future.get();
            if (entry.ok()) {
                outcome.set_content(entry.path, std::move(entry.text));
            } else {
                outcome.set_error(entry.path, *entry.error, std::move(entry.text));
            }
        }
    } else {
        for (const auto& path : request.files) {
            auto entry = read_one(sandbox, path);
            if (entry.ok()) {
                outcome.set_content(entry.path, std::move(entry.text));
            } else {
                outcome.set_error(entry.path, *entry.error, std::move(entry.text));
            }
        }
    }

    spdlog::info("Fulfilled file request: {} file(s)", outcome.size());
    return Result<FileReadOutcome, Error>::ok(std::move(outcome));
}

std::string fence_language(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);

    auto dot = name.find_last_of('.');
    // No extension, or a dotfile such as ".env"
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }

    std::string ext(name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto known : kCodeExtensions) {
        if (ext == known) {
            return ext;
        }
    }
    return {};
}

std::string format_file_contents(const FileReadOutcome& outcome) {
    std::string out = "\n\n## FILE CONTENTS\n\n";

    for (const auto& entry : outcome.entries()) {
        out += "### " + entry.path + "\n\n";

        std::string language = fence_language(entry.path);
        if (!language.empty()) {
            out += "```" + language + "\n" + entry.text + "\n```\n\n";
        } else {
            out += entry.text + "\n\n";
        }
    }

    return out;
}

std::string strip_request(std::string_view text, const FileRequest& request) {
    if (request.offset > text.size()) {
        return std::string(text);
    }
    std::string out(text.substr(0, request.offset));
    size_t end = std::min(text.size(), request.offset + request.length);
    out.append(text.substr(end));
    return out;
}

std::string inject_file_contents(std::string_view text, const FileRequest& request,
                                 const FileReadOutcome& outcome) {
    return strip_request(text, request) + format_file_contents(outcome);
}

}  // namespace domore::files
