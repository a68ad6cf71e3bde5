#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <codegraph/ingest/deduplication.h>
#include <codegraph/ingest/ingestion_service.h>

namespace codegraph::ingest {

namespace {

template <typename T> std::vector<T> sliceBatch(const std::vector<T>& items, size_t offset, size_t n) {
    auto begin = items.begin() + static_cast<std::ptrdiff_t>(offset);
    auto end = items.begin() + static_cast<std::ptrdiff_t>(std::min(items.size(), offset + n));
    return std::vector<T>(begin, end);
}

} // namespace

IngestCounts& IngestCounts::operator+=(const IngestCounts& other) {
    files += other.files;
    symbols += other.symbols;
    symbolDuplicates += other.symbolDuplicates;
    dependenciesCreated += other.dependenciesCreated;
    dependenciesUpdated += other.dependenciesUpdated;
    dependencyDuplicates += other.dependencyDuplicates;
    dependenciesRecovered += other.dependenciesRecovered;
    fileDependencies += other.fileDependencies;
    fileDependencyDuplicates += other.fileDependencyDuplicates;
    return *this;
}

IngestionService::IngestionService(store::GraphStore& store, config::IngestionConfig config,
                                   AnalysisStatistics* statistics)
    : store_(store), config_(config), statistics_(statistics) {
    config_.symbolBatchSize = std::max<size_t>(1, config_.symbolBatchSize);
    config_.dependencyBatchSize = std::max<size_t>(1, config_.dependencyBatchSize);
    config_.fileDependencyBatchSize = std::max<size_t>(1, config_.fileDependencyBatchSize);
}

Result<IngestResult> IngestionService::ingest(RepositoryId repoId, std::vector<store::File> files,
                                              const std::vector<store::Symbol>& symbols,
                                              const std::vector<store::Dependency>& dependencies) {
    IngestResult result;
    for (auto& f : files) {
        f.repoId = repoId;
    }

    auto storedFiles = upsertFiles(files, result.counts);
    if (!storedFiles)
        return storedFiles.error();
    result.files = std::move(storedFiles).value();

    auto storedSymbols = ingestSymbols(symbols, result.counts);
    if (!storedSymbols)
        return storedSymbols.error();
    result.symbols = std::move(storedSymbols).value();

    auto storedDeps = ingestDependencies(dependencies, result.counts);
    if (!storedDeps)
        return storedDeps.error();
    result.dependencies = std::move(storedDeps).value();

    spdlog::info("Ingested repository {}: {} files, {} symbols, {} edges created, {} updated",
                 repoId, result.counts.files, result.counts.symbols,
                 result.counts.dependenciesCreated, result.counts.dependenciesUpdated);
    return result;
}

Result<std::vector<store::File>> IngestionService::upsertFiles(const std::vector<store::File>& files,
                                                               IngestCounts& counts) {
    auto stored = store_.upsertFiles(files);
    if (!stored) {
        spdlog::error("File upsert failed: {}", stored.error().message);
        return stored.error();
    }
    counts.files += stored.value().size();
    return stored;
}

Result<std::vector<store::Symbol>>
IngestionService::ingestSymbols(const std::vector<store::Symbol>& symbols, IngestCounts& counts) {
    auto unique = deduplicateSymbols(symbols);
    if (unique.size() < symbols.size()) {
        const size_t removed = symbols.size() - unique.size();
        counts.symbolDuplicates += removed;
        spdlog::info("Removed {} duplicate symbols before insertion ({} remain)", removed,
                     unique.size());
    }

    std::vector<store::Symbol> out;
    out.reserve(unique.size());
    for (size_t offset = 0; offset < unique.size(); offset += config_.symbolBatchSize) {
        auto batch = sliceBatch(unique, offset, config_.symbolBatchSize);
        auto stored = store_.upsertSymbols(batch);
        if (!stored) {
            spdlog::error("Symbol batch at offset {} failed: {}", offset, stored.error().message);
            return stored.error();
        }
        auto& rows = stored.value();
        counts.symbols += rows.size();
        out.insert(out.end(), std::make_move_iterator(rows.begin()),
                   std::make_move_iterator(rows.end()));
    }
    return out;
}

Result<std::vector<store::Dependency>>
IngestionService::ingestDependencies(const std::vector<store::Dependency>& dependencies,
                                     IngestCounts& counts) {
    auto unique = deduplicateDependencies(dependencies);
    if (unique.size() < dependencies.size()) {
        const size_t removed = dependencies.size() - unique.size();
        counts.dependencyDuplicates += removed;
        spdlog::debug("Removed {} duplicate dependencies before insertion", removed);
    }

    std::vector<store::Dependency> out;
    out.reserve(unique.size());
    for (size_t offset = 0; offset < unique.size(); offset += config_.dependencyBatchSize) {
        auto batch = sliceBatch(unique, offset, config_.dependencyBatchSize);
        auto rows = writeDependencyBatch(batch, counts);
        if (!rows)
            return rows.error();
        auto& written = rows.value();
        out.insert(out.end(), std::make_move_iterator(written.begin()),
                   std::make_move_iterator(written.end()));
    }
    return out;
}

Result<std::vector<store::Dependency>>
IngestionService::writeDependencyBatch(const std::vector<store::Dependency>& batch,
                                       IngestCounts& counts) {
    auto upserted = store_.upsertDependencies(batch);
    if (upserted) {
        auto& r = upserted.value();
        counts.dependenciesCreated += r.created;
        counts.dependenciesUpdated += r.updated;
        return std::move(r.rows);
    }

    if (upserted.error().code != ErrorCode::ConstraintViolation) {
        spdlog::error("Dependency batch of {} failed: {}", batch.size(), upserted.error().message);
        return upserted.error();
    }

    // Another writer persisted some of these keys first; return what is stored
    spdlog::debug("Dependency batch of {} hit a key conflict, reading back by key: {}",
                  batch.size(), upserted.error().message);
    auto existing = store_.findDependenciesByKeys(batch);
    if (!existing) {
        spdlog::error("Reading back conflicting dependencies failed: {}",
                      existing.error().message);
        return existing.error();
    }
    counts.dependenciesRecovered += existing.value().size();
    if (statistics_) {
        statistics_->recoveredConflicts.fetch_add(1);
    }
    return existing;
}

Result<size_t>
IngestionService::ingestFileDependencies(const std::vector<store::FileDependency>& dependencies,
                                         IngestCounts& counts) {
    auto unique = deduplicateFileDependencies(dependencies);
    counts.fileDependencyDuplicates += dependencies.size() - unique.size();

    size_t written = 0;
    for (size_t offset = 0; offset < unique.size(); offset += config_.fileDependencyBatchSize) {
        auto batch = sliceBatch(unique, offset, config_.fileDependencyBatchSize);
        auto n = store_.upsertFileDependencies(batch);
        if (!n) {
            spdlog::error("File dependency batch at offset {} failed: {}", offset,
                          n.error().message);
            return n.error();
        }
        written += n.value();
    }
    counts.fileDependencies += written;
    return written;
}

} // namespace codegraph::ingest
