#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <system_error>
#include <codegraph/detect/file_discovery.h>
#include <codegraph/detect/language.h>

namespace codegraph::detect {

namespace fs = std::filesystem;

bool FilesystemDiscovery::isSkippedDirectory(const std::string& name) {
    static const std::array<const char*, 6> kSkipped = {".git", "node_modules", "vendor",
                                                        "dist", "build",        ".cache"};
    return std::any_of(kSkipped.begin(), kSkipped.end(),
                       [&](const char* skipped) { return name == skipped; });
}

Result<std::vector<std::string>> FilesystemDiscovery::discover(const std::string& root) {
    std::error_code ec;
    const fs::path rootPath(root);
    if (!fs::is_directory(rootPath, ec) || ec) {
        return Error{ErrorCode::FileNotFound, "Repository root is not a directory: " + root};
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(rootPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Failed to open directory '" + root + "': " + ec.message()};
    }
    const fs::recursive_directory_iterator end;

    while (it != end) {
        std::error_code entryEc;
        const auto& entry = *it;
        if (entry.is_directory(entryEc) && !entryEc) {
            if (isSkippedDirectory(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(entryEc) && !entryEc) {
            auto rel = entry.path().lexically_relative(rootPath).generic_string();
            if (isSupportedSource(rel)) {
                files.push_back(std::move(rel));
            }
        } else if (entryEc) {
            spdlog::warn("Skipping inaccessible entry '{}': {}", entry.path().string(),
                         entryEc.message());
        }

        it.increment(ec);
        if (ec) {
            spdlog::error("Directory walk under '{}' failed: {}", root, ec.message());
            return Error{ErrorCode::IOError,
                         "Failed to walk '" + root + "': " + ec.message()};
        }
    }

    std::sort(files.begin(), files.end());
    spdlog::debug("Discovered {} source files under {}", files.size(), root);
    return files;
}

} // namespace codegraph::detect
