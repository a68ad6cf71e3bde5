#pragma once

#include <vector>
#include <codegraph/store/entities.h>

namespace codegraph::ingest {

/**
 * @brief Whether @p candidate carries more information than @p current
 *
 * Compared in order: signature, exported flag, description, qualified name.
 */
bool isMoreComplete(const store::Symbol& candidate, const store::Symbol& current);

/**
 * @brief Collapse symbols sharing (fileId, name, kind, startLine)
 *
 * The most complete variant survives, at the position of the first occurrence.
 */
std::vector<store::Symbol> deduplicateSymbols(const std::vector<store::Symbol>& symbols);

/**
 * @brief Keep the first edge per (from, to, kind, line); unresolved edges also key on the
 * qualified name
 */
std::vector<store::Dependency> deduplicateDependencies(const std::vector<store::Dependency>& deps);

/**
 * @brief Keep the first file edge per (fromFileId, toFileId, kind)
 */
std::vector<store::FileDependency>
deduplicateFileDependencies(const std::vector<store::FileDependency>& deps);

} // namespace codegraph::ingest
