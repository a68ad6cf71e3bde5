#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <codegraph/analysis/graph_analyzer.h>
#include <codegraph/crypto/hasher.h>
#include <codegraph/detect/language.h>
#include <codegraph/ingest/edge_builder.h>
#include <codegraph/ingest/file_dependency_builder.h>
#include <codegraph/ingest/hierarchy_linker.h>

namespace codegraph::analysis {

namespace fs = std::filesystem;

struct GraphAnalyzer::ParsedSource {
    std::string path;
    store::File file;
    ingest::ParseResult result;
    bool vanished = false;
    std::optional<std::string> parseError;
};

namespace {

constexpr const char* kTraversePattern = "traverse:";

std::string normalizeRoot(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec)
        abs = fs::path(path);
    std::string out = abs.lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

Result<std::string> readContents(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open '" + path.string() + "'"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, "Failed reading '" + path.string() + "'"};
    }
    return buffer.str();
}

store::Symbol toSymbol(const ingest::ParsedSymbol& parsed, FileId fileId) {
    store::Symbol s;
    s.fileId = fileId;
    s.name = parsed.name;
    s.qualifiedName = parsed.qualifiedName;
    s.kind = parsed.kind;
    s.startLine = parsed.startLine;
    s.endLine = std::max(parsed.endLine, parsed.startLine);
    s.isExported = parsed.isExported;
    s.signature = parsed.signature;
    s.description = parsed.description;
    return s;
}

} // namespace

GraphAnalyzer::GraphAnalyzer(store::GraphStore& store, ingest::SourceParser& parser,
                             detect::FileDiscovery& discovery, config::GraphConfig config,
                             cache::ResultCache* cache, AnalysisStatistics* statistics,
                             detect::StatFunction stat)
    : store_(store), parser_(parser), discovery_(discovery), config_(std::move(config)),
      cache_(cache), statistics_(statistics), stat_(std::move(stat)) {
    config_.analysis.parseConcurrency = std::max<size_t>(1, config_.analysis.parseConcurrency);
    config_.analysis.parseChunkSize = std::max<size_t>(1, config_.analysis.parseChunkSize);
}

Result<GraphAnalyzer::ParsedSource> GraphAnalyzer::parseFile(const std::string& root,
                                                             const std::string& relativePath) {
    ParsedSource source;
    source.path = relativePath;
    const fs::path absolute = fs::path(root) / relativePath;

    auto mtime = stat_(absolute.string());
    if (!mtime)
        return mtime.error();
    if (!mtime.value()) {
        source.vanished = true;
        return source;
    }

    auto contents = readContents(absolute);
    if (!contents) {
        // Removed between stat and open
        std::error_code ec;
        if (!fs::exists(absolute, ec) && !ec) {
            source.vanished = true;
            return source;
        }
        return contents.error();
    }

    source.file.path = relativePath;
    source.file.language = detect::getLanguageFromExtension(relativePath);
    source.file.size = static_cast<int64_t>(contents.value().size());
    source.file.lastModified = mtime.value();
    source.file.isTest = detect::isTestPath(relativePath);
    source.file.isGenerated = detect::isGeneratedPath(relativePath);
    try {
        source.file.contentHash = crypto::SHA256Hasher::hash(std::string_view(contents.value()));
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError,
                     "Hashing '" + relativePath + "' failed: " + e.what()};
    }

    try {
        auto parsed = parser_.parse(relativePath, contents.value());
        if (!parsed) {
            source.parseError = parsed.error().message;
        } else {
            source.result = std::move(parsed).value();
        }
    } catch (const std::exception& e) {
        source.parseError = std::string("parser threw: ") + e.what();
    }
    return source;
}

Result<void> GraphAnalyzer::ingestChunk(const store::Repository& repo,
                                        std::vector<ParsedSource>& chunk,
                                        ingest::IngestionService& ingestion,
                                        std::vector<ingest::ParsedFile>& fileEdgeSources,
                                        AnalysisResult& result) {
    std::vector<store::File> files;
    files.reserve(chunk.size());
    for (auto& source : chunk) {
        source.file.repoId = repo.id;
        files.push_back(source.file);
    }
    if (files.empty())
        return {};

    auto storedFiles = ingestion.upsertFiles(files, result.ingest);
    if (!storedFiles)
        return storedFiles.error();

    std::vector<store::Symbol> symbols;
    for (size_t i = 0; i < chunk.size(); ++i) {
        const FileId fileId = storedFiles.value()[i].id;
        for (const auto& parsed : chunk[i].result.symbols) {
            symbols.push_back(toSymbol(parsed, fileId));
        }
    }

    auto storedSymbols = ingestion.ingestSymbols(symbols, result.ingest);
    if (!storedSymbols)
        return storedSymbols.error();

    ingest::SymbolHierarchyLinker linker(store_);
    auto linked = linker.linkSymbols(storedSymbols.value());
    if (!linked)
        return linked.error();
    result.symbolsLinked += linked.value();

    std::unordered_map<FileId, std::vector<store::Symbol>> symbolsByFile;
    for (const auto& s : storedSymbols.value()) {
        symbolsByFile[s.fileId].push_back(s);
    }

    const ingest::EdgeBuilder edgeBuilder(statistics_);
    std::vector<store::Dependency> edges;
    for (size_t i = 0; i < chunk.size(); ++i) {
        const auto& fileSymbols = symbolsByFile[storedFiles.value()[i].id];
        auto built = edgeBuilder.build(chunk[i].result.dependencies, fileSymbols);
        edges.insert(edges.end(), std::make_move_iterator(built.begin()),
                     std::make_move_iterator(built.end()));
    }
    result.edgesBuilt += edges.size();

    auto storedEdges = ingestion.ingestDependencies(edges, result.ingest);
    if (!storedEdges)
        return storedEdges.error();

    for (auto& source : chunk) {
        ingest::ParsedFile pf;
        pf.path = source.path;
        pf.result.imports = std::move(source.result.imports);
        pf.result.dependencies = std::move(source.result.dependencies);
        fileEdgeSources.push_back(std::move(pf));
    }
    return {};
}

Result<AnalysisResult> GraphAnalyzer::analyzeRepository(const std::string& path,
                                                        const std::string& name, bool forceFull) {
    const auto started = std::chrono::steady_clock::now();
    const TimePoint runStamp = std::chrono::system_clock::now();
    const std::string root = normalizeRoot(path);

    AnalysisResult result;

    // 1. Repository
    auto repo = store_.getOrCreateRepository(name, root);
    if (!repo)
        return repo.error();
    store::Repository repository = std::move(repo).value();

    if (forceFull) {
        auto cleared = store_.clearRepositoryData(repository.id);
        if (!cleared)
            return cleared.error();
        repository.lastIndexed.reset();
        spdlog::info("Forced full analysis of '{}': cleared stored data", repository.name);
    }

    // 2. Change detection
    detect::ChangeDetector detector(store_, discovery_, stat_);
    auto detected = detector.detectChanges(repository);
    if (!detected)
        return detected.error();
    detect::ChangeSet changes = std::move(detected).value();
    result.fullAnalysis = changes.fullAnalysis;
    result.filesNew = changes.newFiles.size();
    result.filesChanged = changes.changedFiles.size();

    if (changes.fullAnalysis && !forceFull) {
        // Rows left by an interrupted first run are not trusted
        auto cleared = store_.clearRepositoryData(repository.id);
        if (!cleared)
            return cleared.error();
    }

    // 3. Deleted files
    if (!changes.deletedFileIds.empty()) {
        auto deleted = store_.deleteFiles(changes.deletedFileIds);
        if (!deleted)
            return deleted.error();
        result.filesDeleted = deleted.value();
        spdlog::info("Removed {} deleted files from '{}'", result.filesDeleted, repository.name);
    }

    // 4. Stale data of changed files
    if (!changes.changedFiles.empty()) {
        auto stored = store_.getFilesByRepository(repository.id);
        if (!stored)
            return stored.error();
        std::unordered_map<std::string, FileId> idsByPath;
        for (const auto& f : stored.value()) {
            idsByPath.emplace(f.path, f.id);
        }
        std::vector<FileId> changedIds;
        for (const auto& p : changes.changedFiles) {
            if (auto it = idsByPath.find(p); it != idsByPath.end()) {
                changedIds.push_back(it->second);
            }
        }
        auto cleaned = store_.cleanupFileData(changedIds);
        if (!cleaned)
            return cleaned.error();
        result.cleanup = cleaned.value();
        spdlog::info("Cleaned {} changed files: {} symbols, {} edges, {} file edges removed",
                     changedIds.size(), result.cleanup.symbols, result.cleanup.dependencies,
                     result.cleanup.fileDependencies);
    }

    // 5-9. Parse in chunks on the worker pool, ingesting each chunk while the next parses
    std::vector<std::string> toParse = std::move(changes.newFiles);
    toParse.insert(toParse.end(), changes.changedFiles.begin(), changes.changedFiles.end());

    ingest::IngestionService ingestion(store_, config_.ingestion, statistics_);
    std::vector<ingest::ParsedFile> fileEdgeSources;
    const size_t chunkSize = config_.analysis.parseChunkSize;

    {
        boost::asio::thread_pool pool(config_.analysis.parseConcurrency);
        using Pending = std::vector<std::future<Result<ParsedSource>>>;

        auto submit = [&](size_t begin) {
            Pending futures;
            const size_t end = std::min(toParse.size(), begin + chunkSize);
            for (size_t i = begin; i < end; ++i) {
                auto task = std::make_shared<std::packaged_task<Result<ParsedSource>()>>(
                    [this, &root, relative = toParse[i]]() { return parseFile(root, relative); });
                futures.push_back(task->get_future());
                boost::asio::post(pool, [task]() { (*task)(); });
            }
            return futures;
        };

        Pending pending = submit(0);
        for (size_t begin = 0; begin < toParse.size(); begin += chunkSize) {
            Pending current = std::move(pending);
            if (begin + chunkSize < toParse.size()) {
                pending = submit(begin + chunkSize);
            }

            std::vector<ParsedSource> chunk;
            chunk.reserve(current.size());
            for (auto& future : current) {
                auto parsed = future.get();
                if (!parsed) {
                    spdlog::error("Analysis of '{}' aborted: {}", repository.name,
                                  parsed.error().message);
                    return parsed.error();
                }
                ParsedSource source = std::move(parsed).value();
                if (source.vanished) {
                    spdlog::debug("'{}' disappeared before parsing", source.path);
                    continue;
                }
                if (source.parseError) {
                    spdlog::warn("Skipping '{}': {}", source.path, *source.parseError);
                    result.errors.push_back(source.path + ": " + *source.parseError);
                    ++result.parseFailures;
                    if (statistics_)
                        statistics_->parseFailures++;
                    continue;
                }
                if (!source.result.errors.empty()) {
                    spdlog::debug("'{}' parsed with {} recoverable errors", source.path,
                                  source.result.errors.size());
                }
                ++result.filesParsed;
                chunk.push_back(std::move(source));
            }

            auto ingested = ingestChunk(repository, chunk, ingestion, fileEdgeSources, result);
            if (!ingested) {
                spdlog::error("Ingestion for '{}' failed: {}", repository.name,
                              ingested.error().message);
                return ingested.error();
            }
        }
        pool.join();
    }
    spdlog::info("Parsed {} files of '{}' ({} failed): {} symbols, {} edges", result.filesParsed,
                 repository.name, result.parseFailures, result.ingest.symbols, result.edgesBuilt);

    // 10. File edges from imports and external calls
    auto repoFiles = store_.getFilesByRepository(repository.id);
    if (!repoFiles)
        return repoFiles.error();
    const ingest::FileDependencyBuilder fileDeps(repoFiles.value());
    {
        auto written = ingestion.ingestFileDependencies(fileDeps.fromParsedFiles(fileEdgeSources),
                                                        result.ingest);
        if (!written)
            return written.error();
    }

    // 11. Resolution and orphan cleanup
    resolve::ResolutionPass resolution(store_, config_.analysis.resolutionTimeout);
    auto resolved = resolution.run(repository.id);
    if (!resolved)
        return resolved.error();
    result.resolution = resolved.value();

    // Cross-file file edges exist only once edges are bound
    {
        auto deps = store_.getDependenciesByRepository(repository.id);
        if (!deps)
            return deps.error();
        auto symbols = store_.getSymbolsByRepository(repository.id);
        if (!symbols)
            return symbols.error();
        auto written = ingestion.ingestFileDependencies(
            fileDeps.fromSymbolEdges(deps.value(), symbols.value()), result.ingest);
        if (!written)
            return written.error();
    }

    // 12. Stamp
    auto stamped = store_.updateLastIndexed(repository.id, runStamp);
    if (!stamped)
        return stamped.error();
    repository.lastIndexed = runStamp;

    // 13. Cached traversals may reference removed or rebound edges
    if (cache_) {
        result.cacheEntriesInvalidated = cache_->invalidatePattern(kTraversePattern);
    }

    result.repository = std::move(repository);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Analysis of '{}' finished in {} ms: {} new, {} changed, {} deleted files, "
                 "{} edges resolved, {} orphans removed",
                 result.repository.name, result.duration.count(), result.filesNew,
                 result.filesChanged, result.filesDeleted, result.resolution.resolved,
                 result.resolution.orphans.total());
    return result;
}

} // namespace codegraph::analysis
