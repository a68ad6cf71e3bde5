#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>
#include <codegraph/detect/change_detector.h>

namespace codegraph::detect {

Result<std::optional<TimePoint>> statModificationTime(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        const int err = errno;
        if (err == ENOENT) {
            return std::optional<TimePoint>{};
        }
        const ErrorCode code = err == EACCES ? ErrorCode::PermissionDenied : ErrorCode::IOError;
        return Error{code, "stat failed for '" + path + "': " + std::strerror(err)};
    }
    auto since = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    return std::optional<TimePoint>(
        TimePoint(std::chrono::duration_cast<TimePoint::duration>(since)));
}

ChangeDetector::ChangeDetector(store::GraphStore& store, FileDiscovery& discovery, StatFunction stat)
    : store_(store), discovery_(discovery), stat_(std::move(stat)) {}

Result<ChangeSet> ChangeDetector::detectChanges(const store::Repository& repo) {
    auto current = discovery_.discover(repo.path);
    if (!current)
        return current.error();

    ChangeSet changes;
    if (!repo.lastIndexed) {
        changes.fullAnalysis = true;
        changes.newFiles = std::move(current).value();
        spdlog::info("Repository '{}' has no previous index: {} files to analyze", repo.name,
                     changes.newFiles.size());
        return changes;
    }

    auto stored = store_.getFilesByRepository(repo.id);
    if (!stored)
        return stored.error();

    std::unordered_map<std::string, FileId> storedPaths;
    for (const auto& f : stored.value()) {
        storedPaths.emplace(f.path, f.id);
    }
    const std::unordered_set<std::string> currentPaths(current.value().begin(),
                                                       current.value().end());

    const std::filesystem::path root(repo.path);
    for (const auto& path : current.value()) {
        auto storedIt = storedPaths.find(path);
        if (storedIt == storedPaths.end()) {
            changes.newFiles.push_back(path);
            continue;
        }

        auto mtime = stat_((root / path).string());
        if (!mtime) {
            spdlog::error("Change detection aborted for '{}': {}", repo.name,
                          mtime.error().message);
            return mtime.error();
        }
        if (!mtime.value()) {
            spdlog::debug("'{}' vanished during change detection", path);
            changes.deletedFileIds.push_back(storedIt->second);
            continue;
        }
        if (*mtime.value() > *repo.lastIndexed) {
            changes.changedFiles.push_back(path);
        }
    }

    for (const auto& f : stored.value()) {
        if (currentPaths.find(f.path) == currentPaths.end()) {
            changes.deletedFileIds.push_back(f.id);
        }
    }

    spdlog::info("Repository '{}': {} new, {} changed, {} deleted files", repo.name,
                 changes.newFiles.size(), changes.changedFiles.size(),
                 changes.deletedFileIds.size());
    return changes;
}

} // namespace codegraph::detect
