#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace domore::core {

namespace fs = std::filesystem;

// Project sandbox configuration
struct SandboxConfig {
    int max_file_size_mb = 10;
    bool create_parent_directories = true;

    std::uintmax_t max_file_bytes() const {
        return static_cast<std::uintmax_t>(max_file_size_mb) * 1024 * 1024;
    }
};

// File request configuration
struct FileRequestConfig {
    int parallel_reads = 1;  // 1 = read sequentially on the calling thread
    int max_rounds = 3;      // File-request round trips per user turn
};

// Task artifact configuration
struct TaskConfig {
    std::string global_context_file = "globalContext.txt";
    std::string todo_list_file = "todoList.json";
    std::string summaries_file = "completedItems.json";
    int max_prompt_tokens = 120000;
};

// File description enrichment configuration
struct DescriptionConfig {
    bool enabled = true;
    int worker_threads = 1;
    std::string store_file = ".file-descriptions.json";
    std::vector<std::string> skip_extensions;

    DescriptionConfig() {
        skip_extensions = {".ttf", ".png", ".jpg", ".jpeg", ".gif", ".svg", ".ico",
                           ".pdf", ".mp3", ".mp4", ".wav", ".zip", ".exe", ".dll"};
    }
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_file;               // Empty = console only
};

// Main configuration
struct Config {
    SandboxConfig sandbox;
    FileRequestConfig file_requests;
    TaskConfig tasks;
    DescriptionConfig descriptions;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if the file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Default config path (~/.domore/config.yaml)
    static fs::path default_path();

    void expand_paths();

    Result<void, Error> validate() const;
};

// Expand ~ and ${VAR} / $VAR references
std::string expand_path(const std::string& path);

}  // namespace domore::core
