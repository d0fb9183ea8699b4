#include "domore/files/description_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace domore::files {

// DescriptionStore

DescriptionStore::DescriptionStore(std::string store_file)
    : store_file_(std::move(store_file))
{
}

Result<std::map<std::string, std::string>, Error>
DescriptionStore::load(const ProjectSandbox& sandbox) const {
    using R = Result<std::map<std::string, std::string>, Error>;

    auto content = sandbox.read_file(store_file_);
    if (content.is_err()) {
        if (content.error().code == ErrorCode::FileNotFound) {
            return R::ok({});
        }
        return R::err(ErrorCode::StoreLoadFailed, content.error().message, store_file_);
    }

    Json j = Json::parse(content.value(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return R::err(ErrorCode::StoreLoadFailed, "Invalid description store", store_file_);
    }

    std::map<std::string, std::string> entries;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            entries[it.key()] = it.value().get<std::string>();
        }
    }
    return R::ok(std::move(entries));
}

Result<void, Error> DescriptionStore::save(const ProjectSandbox& sandbox,
                                           const std::map<std::string, std::string>& entries) const {
    Json j = Json::object();
    for (const auto& [path, description] : entries) {
        j[path] = description;
    }

    auto written = sandbox.write_file(store_file_, j.dump(2));
    if (written.is_err()) {
        return Result<void, Error>::err(
            ErrorCode::StoreSaveFailed,
            written.error().message,
            store_file_
        );
    }
    return Result<void, Error>::ok();
}

Result<std::optional<std::string>, Error>
DescriptionStore::get(const ProjectSandbox& sandbox, const std::string& path) const {
    using R = Result<std::optional<std::string>, Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load(sandbox);
    if (entries.is_err()) {
        return R::err(std::move(entries).error());
    }

    auto it = entries.value().find(sandbox::normalize_separators(path));
    if (it == entries.value().end()) {
        return R::ok(std::nullopt);
    }
    return R::ok(it->second);
}

Result<void, Error> DescriptionStore::put(const ProjectSandbox& sandbox, const std::string& path,
                                          const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load(sandbox);
    if (entries.is_err()) {
        return Result<void, Error>::err(std::move(entries).error());
    }

    entries.value()[sandbox::normalize_separators(path)] = description;
    return save(sandbox, entries.value());
}

Result<void, Error> DescriptionStore::remove(const ProjectSandbox& sandbox, const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = load(sandbox);
    if (entries.is_err()) {
        return Result<void, Error>::err(std::move(entries).error());
    }

    if (entries.value().erase(sandbox::normalize_separators(path)) == 0) {
        return Result<void, Error>::ok();
    }
    return save(sandbox, entries.value());
}

// DescriptionService

DescriptionService::DescriptionService(DescriptionGenerator& generator, DescriptionConfig config)
    : generator_(generator)
    , config_(std::move(config))
    , store_(config_.store_file)
{
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, config_.worker_threads)));
}

DescriptionService::~DescriptionService() {
    // Drain queued work before the generator reference goes away
    pool_->shutdown();
}

bool DescriptionService::should_skip(const std::string& path) const {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos) {
        return false;
    }

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(config_.skip_extensions.begin(), config_.skip_extensions.end(), ext)
        != config_.skip_extensions.end();
}

std::string DescriptionService::path_key(const ProjectSandbox& sandbox, const std::string& path) {
    return sandbox.root_key() + "|" + sandbox::normalize_separators(path);
}

uint64_t DescriptionService::next_generation(const std::string& key) {
    std::lock_guard<std::mutex> lock(sequence_mutex_);
    return ++generations_[key];
}

void DescriptionService::enqueue(const ProjectSandbox& sandbox, const std::string& path,
                                 std::optional<std::string> hint) {
    if (!config_.enabled || should_skip(path)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.skipped++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.submitted++;
    }

    const uint64_t generation = next_generation(path_key(sandbox, path));

    try {
        pool_->submit([this, sandbox, path, hint = std::move(hint), generation] {
            run(sandbox, path, hint, generation);
        });
    } catch (const std::exception& e) {
        record_failure(path, Error::from_exception(e));
    }
}

void DescriptionService::forget(const ProjectSandbox& sandbox, const std::string& path) {
    if (!config_.enabled) {
        return;
    }

    const std::string key = path_key(sandbox, path);
    const uint64_t generation = next_generation(key);

    try {
        pool_->submit([this, sandbox, path, key, generation] {
            std::lock_guard<std::mutex> lock(sequence_mutex_);
            if (generations_[key] != generation) {
                return;
            }
            auto removed = store_.remove(sandbox, path);
            if (removed.is_err()) {
                record_failure(path, removed.error());
            }
        });
    } catch (const std::exception& e) {
        record_failure(path, Error::from_exception(e));
    }
}

void DescriptionService::run(const ProjectSandbox& sandbox, const std::string& path,
                             const std::optional<std::string>& hint, uint64_t generation) {
    auto content = sandbox.read_file(path);
    if (content.is_err()) {
        record_failure(path, content.error());
        return;
    }

    Result<std::string, Error> description = Result<std::string, Error>::err(ErrorCode::Unknown);
    try {
        description = generator_.describe(path, content.value(), hint);
    } catch (const std::exception& e) {
        description = Result<std::string, Error>::err(
            ErrorCode::CollaboratorFailure, e.what(), "describe");
    }

    if (description.is_err()) {
        record_failure(path, description.error());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sequence_mutex_);
        if (generations_[path_key(sandbox, path)] != generation) {
            spdlog::debug("Dropping outdated description for {}", path);
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.superseded++;
            return;
        }

        auto stored = store_.put(sandbox, path, description.value());
        if (stored.is_err()) {
            record_failure(path, stored.error());
            return;
        }
    }

    spdlog::debug("Stored description for {}", path);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.generated++;
}

void DescriptionService::record_failure(const std::string& path, const Error& error) {
    spdlog::warn("Description generation failed for {}: {}", path, error.full_message());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.failed++;
}

void DescriptionService::wait_idle() {
    pool_->wait_idle();
}

DescriptionService::Stats DescriptionService::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace domore::files
