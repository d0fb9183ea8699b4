#pragma once

#include "domore/core/config.hpp"
#include "domore/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace domore::sandbox {

using namespace domore::core;
namespace fs = std::filesystem;

// The single directory every file operation of the core is confined to.
//
// A ProjectSandbox is a plain value: it is passed explicitly to every
// operation that touches the filesystem, so independent projects (and
// tests) never share state. A default-constructed sandbox has no root and
// fails every resolution with ErrorCode::ProjectNotSet.
class ProjectSandbox {
public:
    ProjectSandbox() = default;
    explicit ProjectSandbox(const fs::path& root, SandboxConfig config = {});

    bool has_root() const { return root_.has_value(); }

    // Normalized absolute root; empty path when unset
    fs::path root() const { return root_.value_or(fs::path{}); }

    // Root as a '/'-separated string, used for prefix checks and lock keys
    const std::string& root_key() const { return root_key_; }

    const SandboxConfig& config() const { return config_; }

    // Map a project-relative path to a contained absolute path.
    // Applied before any filesystem call; never throws.
    Result<fs::path, Error> resolve(std::string_view relative_path) const;

    // Sandbox-aware file operations
    Result<std::string, Error> read_file(std::string_view relative_path) const;
    Result<void, Error> write_file(std::string_view relative_path, const std::string& content) const;
    Result<void, Error> remove_file(std::string_view relative_path) const;
    bool exists(std::string_view relative_path) const;

private:
    std::optional<fs::path> root_;
    std::string root_key_;
    SandboxConfig config_;
};

// Replace '\' with '/' so Windows-style agent paths are checked uniformly
std::string normalize_separators(std::string_view path);

}  // namespace domore::sandbox
