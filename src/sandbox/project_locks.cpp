#include "domore/sandbox/project_locks.hpp"

namespace domore::sandbox {

std::unique_lock<std::mutex> ProjectLocks::acquire(const ProjectSandbox& sandbox) {
    std::shared_ptr<std::mutex> project_mutex;

    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto& entry = locks_[sandbox.root_key()];
        if (!entry) {
            entry = std::make_shared<std::mutex>();
        }
        project_mutex = entry;
    }

    // Entries are never erased, so the mutex outlives the returned lock
    return std::unique_lock<std::mutex>(*project_mutex);
}

size_t ProjectLocks::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return locks_.size();
}

}  // namespace domore::sandbox
