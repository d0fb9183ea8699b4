#include "domore/core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <regex>

namespace domore::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path("~/.domore/config.yaml"));
}

void Config::expand_paths() {
    if (!observability.log_file.empty()) {
        observability.log_file = expand_path(observability.log_file.string());
    }
}

Result<void, Error> Config::validate() const {
    if (sandbox.max_file_size_mb <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "sandbox.max_file_size_mb must be positive"
        );
    }

    if (file_requests.parallel_reads < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "file_requests.parallel_reads must be at least 1"
        );
    }

    if (file_requests.max_rounds < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "file_requests.max_rounds must be at least 1"
        );
    }

    if (tasks.global_context_file.empty() || tasks.todo_list_file.empty() ||
        tasks.summaries_file.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "tasks artifact file names must not be empty"
        );
    }

    if (tasks.max_prompt_tokens <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "tasks.max_prompt_tokens must be positive"
        );
    }

    if (descriptions.enabled && descriptions.worker_threads < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "descriptions.worker_threads must be at least 1"
        );
    }

    if (spdlog::level::from_str(observability.log_level) == spdlog::level::off &&
        observability.log_level != "off") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "observability.log_level is not a known level: " + observability.log_level
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path.string());

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto node = root["sandbox"]) {
            config.sandbox.max_file_size_mb = node["max_file_size_mb"].as<int>(config.sandbox.max_file_size_mb);
            config.sandbox.create_parent_directories = node["create_parent_directories"].as<bool>(config.sandbox.create_parent_directories);
        }

        if (auto node = root["file_requests"]) {
            config.file_requests.parallel_reads = node["parallel_reads"].as<int>(config.file_requests.parallel_reads);
            config.file_requests.max_rounds = node["max_rounds"].as<int>(config.file_requests.max_rounds);
        }

        if (auto node = root["tasks"]) {
            config.tasks.global_context_file = node["global_context_file"].as<std::string>(config.tasks.global_context_file);
            config.tasks.todo_list_file = node["todo_list_file"].as<std::string>(config.tasks.todo_list_file);
            config.tasks.summaries_file = node["summaries_file"].as<std::string>(config.tasks.summaries_file);
            config.tasks.max_prompt_tokens = node["max_prompt_tokens"].as<int>(config.tasks.max_prompt_tokens);
        }

        if (auto node = root["descriptions"]) {
            config.descriptions.enabled = node["enabled"].as<bool>(config.descriptions.enabled);
            config.descriptions.worker_threads = node["worker_threads"].as<int>(config.descriptions.worker_threads);
            config.descriptions.store_file = node["store_file"].as<std::string>(config.descriptions.store_file);

            if (auto exts = node["skip_extensions"]) {
                config.descriptions.skip_extensions.clear();
                for (const auto& ext : exts) {
                    config.descriptions.skip_extensions.push_back(ext.as<std::string>());
                }
            }
        }

        if (auto node = root["observability"]) {
            config.observability.log_level = node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_file = node["log_file"].as<std::string>(config.observability.log_file.string());
        }

        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    if (result.error().code != ErrorCode::ConfigNotFound) {
        spdlog::warn("Ignoring configuration: {}", result.error().full_message());
    }

    Config config;
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path(path.string());

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "sandbox" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_file_size_mb" << YAML::Value << sandbox.max_file_size_mb;
        out << YAML::Key << "create_parent_directories" << YAML::Value << sandbox.create_parent_directories;
        out << YAML::EndMap;

        out << YAML::Key << "file_requests" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "parallel_reads" << YAML::Value << file_requests.parallel_reads;
        out << YAML::Key << "max_rounds" << YAML::Value << file_requests.max_rounds;
        out << YAML::EndMap;

        out << YAML::Key << "tasks" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "global_context_file" << YAML::Value << tasks.global_context_file;
        out << YAML::Key << "todo_list_file" << YAML::Value << tasks.todo_list_file;
        out << YAML::Key << "summaries_file" << YAML::Value << tasks.summaries_file;
        out << YAML::Key << "max_prompt_tokens" << YAML::Value << tasks.max_prompt_tokens;
        out << YAML::EndMap;

        out << YAML::Key << "descriptions" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << descriptions.enabled;
        out << YAML::Key << "worker_threads" << YAML::Value << descriptions.worker_threads;
        out << YAML::Key << "store_file" << YAML::Value << descriptions.store_file;
        out << YAML::Key << "skip_extensions" << YAML::Value << YAML::Flow << descriptions.skip_extensions;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_file" << YAML::Value << observability.log_file.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace domore::core
