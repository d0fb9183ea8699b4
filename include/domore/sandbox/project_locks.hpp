#pragma once

#include "project_sandbox.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace domore::sandbox {

// One mutex per project root. Responses for the same project are processed
// one at a time; different projects proceed independently.
class ProjectLocks {
public:
    ProjectLocks() = default;

    ProjectLocks(const ProjectLocks&) = delete;
    ProjectLocks& operator=(const ProjectLocks&) = delete;

    // Blocks until the project's lock is held. A sandbox without a root
    // shares a single lock keyed by the empty string.
    std::unique_lock<std::mutex> acquire(const ProjectSandbox& sandbox);

    size_t size() const;

private:
    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace domore::sandbox
