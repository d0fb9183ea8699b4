#include "domore/agent/response_processor.hpp"
#include "domore/commands/command_executor.hpp"
#include "domore/core/config.hpp"
#include "domore/files/file_request.hpp"
#include "domore/sandbox/project_locks.hpp"
#include "domore/sandbox/project_sandbox.hpp"
#include "domore/tasks/task_store.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace domore;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr
        << "Usage:\n"
        << "  domore apply  --project DIR [--config FILE] [FILE|-]\n"
        << "  domore read   --project DIR [--config FILE] PATH...\n"
        << "  domore status --project DIR [--config FILE]\n"
        << "\n"
        << "  apply   execute the commands and file request in an agent response\n"
        << "  read    print project files the way a file request returns them\n"
        << "  status  print the persisted todo list and completed summaries\n";
}

struct Options {
    std::string command;
    std::string project;
    std::string config_path;
    std::vector<std::string> positional;
};

// Logs go to stderr (and optionally a file) so stdout carries only results
void setup_logging(const core::ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_file.string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << config.log_file << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("domore", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_default_logger(logger);
}

core::Result<std::string, core::Error> read_input(const std::string& source) {
    std::ostringstream ss;
    if (source.empty() || source == "-") {
        ss << std::cin.rdbuf();
        return core::Result<std::string, core::Error>::ok(ss.str());
    }

    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return core::Result<std::string, core::Error>::err(
            core::ErrorCode::FileNotFound, "Cannot open input: " + source, source);
    }
    ss << file.rdbuf();
    return core::Result<std::string, core::Error>::ok(ss.str());
}

int run_apply(const core::Config& config, const sandbox::ProjectSandbox& project,
              const Options& options) {
    if (options.positional.size() > 1) {
        print_usage();
        return kExitUsage;
    }

    auto input = read_input(options.positional.empty() ? "-" : options.positional[0]);
    if (input.is_err()) {
        spdlog::error("{}", input.error().full_message());
        return kExitUsage;
    }

    commands::CommandExecutor executor;
    files::FileRequestHandler file_requests(config.file_requests);
    sandbox::ProjectLocks locks;
    agent::ResponseProcessor processor(executor, file_requests, locks);

    auto processed = processor.process(input.value(), project);
    if (processed.is_err()) {
        spdlog::error("{}", processed.error().full_message());
        return kExitFailed;
    }

    const auto& response = processed.value();
    std::cout << response.visible_text << "\n";

    core::Json results = core::Json::array();
    for (const auto& result : response.command_results) {
        results.push_back(result.to_json());
    }
    std::cout << results.dump(2) << "\n";

    return response.all_succeeded() ? kExitOk : kExitFailed;
}

int run_read(const core::Config& config, const sandbox::ProjectSandbox& project,
             const Options& options) {
    if (options.positional.empty()) {
        print_usage();
        return kExitUsage;
    }

    files::FileRequest request;
    request.files = options.positional;

    files::FileRequestHandler handler(config.file_requests);
    auto outcome = handler.fulfil(request, project);
    if (outcome.is_err()) {
        spdlog::error("{}", outcome.error().full_message());
        return kExitFailed;
    }

    std::cout << files::format_file_contents(outcome.value());

    for (const auto& entry : outcome.value().entries()) {
        if (!entry.ok()) {
            return kExitFailed;
        }
    }
    return kExitOk;
}

int run_status(const core::Config& config, const sandbox::ProjectSandbox& project) {
    tasks::FileTaskStore store(config.tasks);

    auto context = store.load_global_context(project);
    auto items = store.load_todo_list(project);
    auto summaries = store.load_summaries(project);
    for (const core::Error* err : {context.is_err() ? &context.error() : nullptr,
                                   items.is_err() ? &items.error() : nullptr,
                                   summaries.is_err() ? &summaries.error() : nullptr}) {
        if (err) {
            spdlog::error("{}", err->full_message());
            return kExitFailed;
        }
    }

    std::cout << "Project: " << project.root().string() << "\n";
    std::cout << "Global context: "
              << (core::trim(context.value()).empty() ? "none" : std::to_string(context.value().size()) + " chars")
              << "\n";

    if (items.value().empty()) {
        std::cout << "No todo list\n";
        return kExitOk;
    }

    std::cout << "\nTodo list:\n";
    for (const auto& item : items.value()) {
        std::cout << "  [" << tasks::todo_status_to_string(item.status) << "] "
                  << item.index + 1 << ". " << item.title << "\n";
        auto it = summaries.value().find(item.index);
        if (it != summaries.value().end()) {
            std::cout << "      " << it->second.summary
                      << " (" << core::to_iso8601(it->second.timestamp) << ")\n";
        }
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-p" || a == "--project") && i + 1 < argc) {
            options.project = argv[++i];
        } else if ((a == "-c" || a == "--config") && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return kExitOk;
        } else if (options.command.empty()) {
            options.command = a;
        } else {
            options.positional.push_back(a);
        }
    }

    if (options.command.empty() || options.project.empty()) {
        print_usage();
        return kExitUsage;
    }

    core::Config config;
    if (!options.config_path.empty()) {
        auto loaded = core::Config::load(core::expand_path(options.config_path));
        if (loaded.is_err()) {
            std::cerr << loaded.error().full_message() << "\n";
            return kExitUsage;
        }
        config = std::move(loaded).value();
    } else {
        config = core::Config::load_or_default(core::Config::default_path());
    }
    config.expand_paths();

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << valid.error().full_message() << "\n";
        return kExitUsage;
    }

    setup_logging(config.observability);

    sandbox::ProjectSandbox project(core::expand_path(options.project), config.sandbox);
    if (!project.has_root()) {
        spdlog::error("Invalid project folder: {}", options.project);
        return kExitUsage;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(project.root(), ec)) {
        spdlog::error("Project folder does not exist: {}", project.root().string());
        return kExitUsage;
    }

    if (options.command == "apply") {
        return run_apply(config, project, options);
    }
    if (options.command == "read") {
        return run_read(config, project, options);
    }
    if (options.command == "status") {
        return run_status(config, project);
    }

    std::cerr << "Unknown command: " << options.command << "\n";
    print_usage();
    return kExitUsage;
}
