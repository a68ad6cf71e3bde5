#pragma once

#include <string>
#include <vector>
#include <codegraph/core/types.h>

namespace codegraph::detect {

/**
 * @brief Enumerates the source files currently present in a repository
 */
class FileDiscovery {
public:
    virtual ~FileDiscovery() = default;

    /**
     * @return Paths relative to @p root with forward slashes, sorted
     */
    virtual Result<std::vector<std::string>> discover(const std::string& root) = 0;
};

/**
 * @brief Recursive filesystem walk keeping files with a supported source extension
 *
 * Dependency, VCS and build output directories are not entered.
 */
class FilesystemDiscovery : public FileDiscovery {
public:
    Result<std::vector<std::string>> discover(const std::string& root) override;

    static bool isSkippedDirectory(const std::string& name);
};

} // namespace codegraph::detect
