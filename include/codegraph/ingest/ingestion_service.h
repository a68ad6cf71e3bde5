#pragma once

#include <cstddef>
#include <vector>
#include <codegraph/core/config.h>
#include <codegraph/core/statistics.h>
#include <codegraph/core/types.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::ingest {

/**
 * @brief Row counts reported by an ingestion call
 */
struct IngestCounts {
    size_t files = 0;
    size_t symbols = 0;              ///< Symbol rows written
    size_t symbolDuplicates = 0;     ///< Collapsed before writing
    size_t dependenciesCreated = 0;
    size_t dependenciesUpdated = 0;
    size_t dependencyDuplicates = 0;
    size_t dependenciesRecovered = 0; ///< Rows read back after a key conflict
    size_t fileDependencies = 0;
    size_t fileDependencyDuplicates = 0;

    IngestCounts& operator+=(const IngestCounts& other);
};

struct IngestResult {
    std::vector<store::File> files;
    std::vector<store::Symbol> symbols;
    std::vector<store::Dependency> dependencies;
    IngestCounts counts;
};

/**
 * @brief Batched, deduplicating writer in front of a GraphStore
 *
 * Every batch is deduplicated before it reaches the store. A dependency batch
 * that still hits a unique-key conflict is recovered by reading the persisted
 * rows back by key; any other store error is returned to the caller.
 */
class IngestionService {
public:
    IngestionService(store::GraphStore& store, config::IngestionConfig config,
                     AnalysisStatistics* statistics = nullptr);

    /**
     * @brief Write files, then symbols, then edges for one repository
     *
     * Files get @p repoId; symbols and edges must already carry their file
     * and symbol ids.
     */
    Result<IngestResult> ingest(RepositoryId repoId, std::vector<store::File> files,
                                const std::vector<store::Symbol>& symbols,
                                const std::vector<store::Dependency>& dependencies);

    Result<std::vector<store::File>> upsertFiles(const std::vector<store::File>& files,
                                                 IngestCounts& counts);

    Result<std::vector<store::Symbol>> ingestSymbols(const std::vector<store::Symbol>& symbols,
                                                     IngestCounts& counts);

    Result<std::vector<store::Dependency>>
    ingestDependencies(const std::vector<store::Dependency>& dependencies, IngestCounts& counts);

    Result<size_t> ingestFileDependencies(const std::vector<store::FileDependency>& dependencies,
                                          IngestCounts& counts);

private:
    store::GraphStore& store_;
    config::IngestionConfig config_;
    AnalysisStatistics* statistics_;

    Result<std::vector<store::Dependency>>
    writeDependencyBatch(const std::vector<store::Dependency>& batch, IngestCounts& counts);
};

} // namespace codegraph::ingest
