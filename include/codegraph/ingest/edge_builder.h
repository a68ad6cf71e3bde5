#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <codegraph/core/statistics.h>
#include <codegraph/ingest/parsed_types.h>
#include <codegraph/store/entities.h>

namespace codegraph::ingest {

/**
 * @brief Turns name-based parser edges of one file into id-based Dependency rows
 *
 * The source symbol is looked up by name in the file, preferring the symbol
 * whose line range contains the edge. A target that names exactly one symbol
 * of the same file is bound on the spot; every other target is left for the
 * resolution pass with its text as the qualified name.
 */
class EdgeBuilder {
public:
    explicit EdgeBuilder(AnalysisStatistics* statistics = nullptr) : statistics_(statistics) {}

    /**
     * @param fileSymbols Stored symbols of the file the edges were parsed from
     */
    std::vector<store::Dependency> build(const std::vector<ParsedDependency>& edges,
                                         const std::vector<store::Symbol>& fileSymbols) const;

    /**
     * @brief Parse a parameter-types payload
     * @return ValidationError unless it is a JSON array of strings
     */
    static Result<std::vector<std::string>> parseParameterTypes(std::string_view payload);

    /// Last meaningful segment of a dotted name: "Cart.add" -> "add", "A.<lambda>" -> "A"
    static std::string extractMemberName(std::string_view name);

private:
    AnalysisStatistics* statistics_;

    const store::Symbol* findSource(const ParsedDependency& edge,
                                    const std::vector<store::Symbol>& fileSymbols) const;
    const store::Symbol* findLocalTarget(const ParsedDependency& edge,
                                         const std::vector<store::Symbol>& fileSymbols) const;
};

} // namespace codegraph::ingest
