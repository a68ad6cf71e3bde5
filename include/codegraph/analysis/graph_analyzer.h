#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <codegraph/cache/result_cache.h>
#include <codegraph/core/config.h>
#include <codegraph/core/statistics.h>
#include <codegraph/core/types.h>
#include <codegraph/detect/change_detector.h>
#include <codegraph/detect/file_discovery.h>
#include <codegraph/ingest/ingestion_service.h>
#include <codegraph/ingest/parsed_types.h>
#include <codegraph/resolve/resolution_pass.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::analysis {

/**
 * @brief Counts reported by one analysis run
 */
struct AnalysisResult {
    store::Repository repository;
    bool fullAnalysis = false;
    size_t filesNew = 0;
    size_t filesChanged = 0;
    size_t filesDeleted = 0;
    size_t filesParsed = 0;
    size_t parseFailures = 0;
    store::FileCleanupCounts cleanup;
    ingest::IngestCounts ingest;
    size_t edgesBuilt = 0;
    size_t symbolsLinked = 0;
    resolve::ResolutionCounts resolution;
    size_t cacheEntriesInvalidated = 0;
    std::vector<std::string> errors; ///< One message per skipped file
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Incremental analysis of one repository
 *
 * Detects changes, drops stale rows, parses new and changed files on a
 * bounded worker pool and writes files, symbols, parent links, edges and file
 * edges chunk by chunk, then runs the resolution pass and stamps last_indexed.
 * Callers must not analyze the same repository concurrently.
 */
class GraphAnalyzer {
public:
    GraphAnalyzer(store::GraphStore& store, ingest::SourceParser& parser,
                  detect::FileDiscovery& discovery, config::GraphConfig config,
                  cache::ResultCache* cache = nullptr, AnalysisStatistics* statistics = nullptr,
                  detect::StatFunction stat = detect::statModificationTime);

    /**
     * @param forceFull Clear all stored data of the repository and analyze every file
     */
    Result<AnalysisResult> analyzeRepository(const std::string& path, const std::string& name,
                                             bool forceFull = false);

private:
    struct ParsedSource;

    store::GraphStore& store_;
    ingest::SourceParser& parser_;
    detect::FileDiscovery& discovery_;
    config::GraphConfig config_;
    cache::ResultCache* cache_;
    AnalysisStatistics* statistics_;
    detect::StatFunction stat_;

    Result<ParsedSource> parseFile(const std::string& root, const std::string& relativePath);

    /**
     * @param fileEdgeSources Receives the imports and raw edges of each ingested file
     */
    Result<void> ingestChunk(const store::Repository& repo, std::vector<ParsedSource>& chunk,
                             ingest::IngestionService& ingestion,
                             std::vector<ingest::ParsedFile>& fileEdgeSources,
                             AnalysisResult& result);
};

} // namespace codegraph::analysis
