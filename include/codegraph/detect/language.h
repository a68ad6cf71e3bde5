#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::detect {

/**
 * @brief Language name for a path by extension ("typescript", "python", ...)
 */
std::optional<std::string> getLanguageFromExtension(std::string_view path);

/// True when the path has an extension of a supported source language
bool isSupportedSource(std::string_view path);

/// Extensions tried when resolving an extension-less relative import
const std::vector<std::string>& importResolutionExtensions();

/// Path patterns of test files: test/, tests/, __tests__/, .test., .spec., _test.
bool isTestPath(std::string_view path);

/// Path patterns of generated or bundled output: generated, .min., dist/, build/, .d.ts
bool isGeneratedPath(std::string_view path);

} // namespace codegraph::detect
