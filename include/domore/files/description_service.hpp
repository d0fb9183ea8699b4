#pragma once

#include "domore/core/config.hpp"
#include "domore/core/result.hpp"
#include "domore/core/thread_pool.hpp"
#include "domore/sandbox/project_sandbox.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace domore::files {

using namespace domore::core;
using sandbox::ProjectSandbox;

// External collaborator producing a short natural-language summary of a file
class DescriptionGenerator {
public:
    virtual ~DescriptionGenerator() = default;

    virtual Result<std::string, Error> describe(
        const std::string& relative_path,
        const std::string& content,
        const std::optional<std::string>& hint
    ) = 0;
};

// Per-project path -> description map, stored as JSON inside the sandbox
class DescriptionStore {
public:
    explicit DescriptionStore(std::string store_file = ".file-descriptions.json");

    Result<std::map<std::string, std::string>, Error> load(const ProjectSandbox& sandbox) const;
    Result<std::optional<std::string>, Error> get(const ProjectSandbox& sandbox,
                                                  const std::string& path) const;
    Result<void, Error> put(const ProjectSandbox& sandbox, const std::string& path,
                            const std::string& description);
    Result<void, Error> remove(const ProjectSandbox& sandbox, const std::string& path);

    const std::string& store_file() const { return store_file_; }

private:
    Result<void, Error> save(const ProjectSandbox& sandbox,
                             const std::map<std::string, std::string>& entries) const;

    std::string store_file_;
    mutable std::mutex mutex_;  // Serializes read-modify-write of the store file
};

// Best-effort description enrichment.
//
// enqueue() hands the work to a background pool and returns at once; the
// write path never waits on it. Failures are logged and counted, never
// propagated. Requests for one path are ordered: only the most recent
// enqueue() or forget() for a path may change its stored description.
class DescriptionService {
public:
    DescriptionService(DescriptionGenerator& generator, DescriptionConfig config = {});
    ~DescriptionService();

    DescriptionService(const DescriptionService&) = delete;
    DescriptionService& operator=(const DescriptionService&) = delete;

    // Generate (or regenerate) the description of a file
    void enqueue(const ProjectSandbox& sandbox, const std::string& path,
                 std::optional<std::string> hint = std::nullopt);

    // Drop the stored description of a deleted file
    void forget(const ProjectSandbox& sandbox, const std::string& path);

    // True when the extension is never described (binary assets)
    bool should_skip(const std::string& path) const;

    // Block until no task is queued or running
    void wait_idle();

    DescriptionStore& store() { return store_; }

    struct Stats {
        int submitted = 0;
        int generated = 0;
        int skipped = 0;
        int failed = 0;
        int superseded = 0;  // Finished after a newer request for the same path
    };
    Stats get_stats() const;

private:
    void run(const ProjectSandbox& sandbox, const std::string& path,
             const std::optional<std::string>& hint, uint64_t generation);

    // Bump and return the generation of a path
    uint64_t next_generation(const std::string& key);

    static std::string path_key(const ProjectSandbox& sandbox, const std::string& path);
    void record_failure(const std::string& path, const Error& error);

    DescriptionGenerator& generator_;
    DescriptionConfig config_;
    DescriptionStore store_;
    std::unique_ptr<ThreadPool> pool_;

    // Store writes happen under this lock after checking the generation
    std::mutex sequence_mutex_;
    std::map<std::string, uint64_t> generations_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace domore::files
