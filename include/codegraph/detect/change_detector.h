#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <codegraph/core/types.h>
#include <codegraph/detect/file_discovery.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::detect {

/**
 * @brief Files to (re-)ingest or drop since the last indexing run
 *
 * The three sets are disjoint.
 */
struct ChangeSet {
    std::vector<std::string> newFiles;     ///< On disk, not in the store
    std::vector<std::string> changedFiles; ///< In both, modified after last_indexed
    std::vector<FileId> deletedFileIds;    ///< In the store, gone from disk
    bool fullAnalysis = false;             ///< No previous index: everything is new

    bool empty() const { return newFiles.empty() && changedFiles.empty() && deletedFileIds.empty(); }
};

/**
 * @brief Modification time lookup
 *
 * Returns std::nullopt when the file no longer exists; any other failure is
 * an error naming the path.
 */
using StatFunction = std::function<Result<std::optional<TimePoint>>(const std::string& path)>;

/// stat(2)-backed modification time lookup
Result<std::optional<TimePoint>> statModificationTime(const std::string& path);

/**
 * @brief Classifies repository files as new, changed or deleted
 *
 * Pure detection: nothing is written to the store.
 */
class ChangeDetector {
public:
    ChangeDetector(store::GraphStore& store, FileDiscovery& discovery,
                   StatFunction stat = statModificationTime);

    Result<ChangeSet> detectChanges(const store::Repository& repo);

private:
    store::GraphStore& store_;
    FileDiscovery& discovery_;
    StatFunction stat_;
};

} // namespace codegraph::detect
