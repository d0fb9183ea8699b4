#include "domore/sandbox/project_sandbox.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace domore::sandbox {

namespace {

constexpr const char* kViolationMessage =
    "Security violation - cannot access files outside project folder";

Error violation(const std::string& relative_path) {
    spdlog::warn("Security violation: path outside project folder: {}", relative_path);
    return Error{ErrorCode::SandboxViolation, kViolationMessage, relative_path};
}

bool has_drive_prefix(const std::string& path) {
    return path.size() >= 2 &&
           std::isalpha(static_cast<unsigned char>(path[0])) &&
           path[1] == ':';
}

}  // namespace

std::string normalize_separators(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

ProjectSandbox::ProjectSandbox(const fs::path& root, SandboxConfig config)
    : config_(config)
{
    if (root.empty()) {
        return;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        spdlog::error("Cannot make project root absolute: {} ({})", root.string(), ec.message());
        return;
    }

    fs::path normal = absolute.lexically_normal();
    // "/a/b/" normalizes with an empty trailing filename; drop it
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }

    root_ = normal;
    root_key_ = normalize_separators(normal.generic_string());
}

Result<fs::path, Error> ProjectSandbox::resolve(std::string_view relative_path) const {
    if (!root_) {
        return Result<fs::path, Error>::err(
            ErrorCode::ProjectNotSet,
            "Project folder not set",
            std::string(relative_path)
        );
    }

    std::string rel = normalize_separators(relative_path);
    if (trim(rel).empty()) {
        return Result<fs::path, Error>::err(
            ErrorCode::InvalidArgument,
            "Empty file path"
        );
    }

    fs::path rel_path(rel);
    if (rel_path.is_absolute() || rel_path.has_root_name() ||
        rel_path.has_root_directory() || has_drive_prefix(rel)) {
        return Result<fs::path, Error>::err(violation(rel));
    }

    for (const auto& part : rel_path) {
        if (part == "..") {
            return Result<fs::path, Error>::err(violation(rel));
        }
    }

    fs::path joined = (*root_ / rel_path).lexically_normal();
    std::string joined_key = normalize_separators(joined.generic_string());

    std::string prefix = root_key_;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }

    if (joined_key != root_key_ && joined_key.rfind(prefix, 0) != 0) {
        return Result<fs::path, Error>::err(violation(rel));
    }

    return Result<fs::path, Error>::ok(std::move(joined));
}

Result<std::string, Error> ProjectSandbox::read_file(std::string_view relative_path) const {
    auto resolved = resolve(relative_path);
    if (resolved.is_err()) {
        return Result<std::string, Error>::err(std::move(resolved).error());
    }
    const fs::path& path = resolved.value();
    std::string rel(relative_path);

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<std::string, Error>::err(
            ErrorCode::FileNotFound,
            "File not found: " + rel,
            rel
        );
    }

    if (!fs::is_regular_file(status)) {
        return Result<std::string, Error>::err(
            ErrorCode::FileReadFailed,
            "Not a regular file: " + rel,
            rel
        );
    }

    auto size = fs::file_size(path, ec);
    if (!ec && size > config_.max_file_bytes()) {
        return Result<std::string, Error>::err(
            ErrorCode::FileTooLarge,
            "File too large: " + rel,
            rel
        );
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string, Error>::err(
            ErrorCode::FileReadFailed,
            "Failed to open file: " + rel,
            rel
        );
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string, Error>::err(
            ErrorCode::FileReadFailed,
            "I/O error while reading: " + rel,
            rel
        );
    }

    return Result<std::string, Error>::ok(ss.str());
}

Result<void, Error> ProjectSandbox::write_file(std::string_view relative_path,
                                               const std::string& content) const {
    auto resolved = resolve(relative_path);
    if (resolved.is_err()) {
        return Result<void, Error>::err(std::move(resolved).error());
    }
    const fs::path& path = resolved.value();
    std::string rel(relative_path);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "Path is a directory: " + rel,
            rel
        );
    }

    if (config_.create_parent_directories && path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to create parent directories: " + ec.message(),
                rel
            );
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "Failed to open file for writing: " + rel,
            rel
        );
    }

    file << content;
    file.flush();
    if (!file) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "I/O error while writing: " + rel,
            rel
        );
    }

    spdlog::debug("Wrote {} bytes to {}", content.size(), rel);
    return Result<void, Error>::ok();
}

Result<void, Error> ProjectSandbox::remove_file(std::string_view relative_path) const {
    auto resolved = resolve(relative_path);
    if (resolved.is_err()) {
        return Result<void, Error>::err(std::move(resolved).error());
    }
    const fs::path& path = resolved.value();
    std::string rel(relative_path);

    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<void, Error>::err(
            ErrorCode::FileNotFound,
            "File not found: " + rel,
            rel
        );
    }

    if (fs::is_directory(status)) {
        return Result<void, Error>::err(
            ErrorCode::FileDeleteFailed,
            "Refusing to delete a directory: " + rel,
            rel
        );
    }

    if (!fs::remove(path, ec) || ec) {
        return Result<void, Error>::err(
            ErrorCode::FileDeleteFailed,
            "Failed to delete file: " + (ec ? ec.message() : rel),
            rel
        );
    }

    spdlog::debug("Deleted {}", rel);
    return Result<void, Error>::ok();
}

bool ProjectSandbox::exists(std::string_view relative_path) const {
    auto resolved = resolve(relative_path);
    if (resolved.is_err()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(resolved.value(), ec);
}

}  // namespace domore::sandbox
