#include <algorithm>
#include <initializer_list>
#include <cctype>
#include <unordered_map>
#include <codegraph/detect/language.h>

namespace codegraph::detect {

namespace {

const std::unordered_map<std::string, std::string> EXTENSION_LANGUAGE_MAP = {
    {".ts", "typescript"},  {".tsx", "typescript"}, {".mts", "typescript"},
    {".cts", "typescript"}, {".js", "javascript"},  {".jsx", "javascript"},
    {".mjs", "javascript"}, {".cjs", "javascript"}, {".vue", "vue"},
    {".py", "python"},      {".php", "php"},        {".cs", "csharp"},
    {".gd", "gdscript"},    {".java", "java"},      {".go", "go"},
    {".rs", "rust"},        {".rb", "ruby"},        {".c", "c"},
    {".h", "c"},            {".cc", "cpp"},         {".cpp", "cpp"},
    {".cxx", "cpp"},        {".hpp", "cpp"},        {".hh", "cpp"},
};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

std::string extensionOf(std::string_view path) {
    auto slash = path.find_last_of('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0)
        return {};
    return lowercase(name.substr(dot));
}

bool containsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

// Matches a directory segment either at the start of a relative path or after a '/'
bool hasDirectory(std::string_view path, std::string_view dir) {
    if (path.substr(0, dir.size()) == dir)
        return true;
    std::string withSlash = "/" + std::string(dir);
    return path.find(withSlash) != std::string_view::npos;
}

} // namespace

std::optional<std::string> getLanguageFromExtension(std::string_view path) {
    auto it = EXTENSION_LANGUAGE_MAP.find(extensionOf(path));
    if (it == EXTENSION_LANGUAGE_MAP.end())
        return std::nullopt;
    return it->second;
}

bool isSupportedSource(std::string_view path) {
    return getLanguageFromExtension(path).has_value();
}

const std::vector<std::string>& importResolutionExtensions() {
    static const std::vector<std::string> extensions = {".ts",  ".tsx", ".js",  ".jsx", ".mjs",
                                                        ".cjs", ".vue", ".py",  ".php", ".cs",
                                                        ".gd"};
    return extensions;
}

bool isTestPath(std::string_view path) {
    const std::string p = lowercase(path);
    return hasDirectory(p, "test/") || hasDirectory(p, "tests/") ||
           hasDirectory(p, "__tests__/") || containsAny(p, {".test.", ".spec.", "_test."});
}

bool isGeneratedPath(std::string_view path) {
    const std::string p = lowercase(path);
    if (p.size() >= 5 && p.compare(p.size() - 5, 5, ".d.ts") == 0)
        return true;
    return containsAny(p, {"generated", ".min."}) || hasDirectory(p, "dist/") ||
           hasDirectory(p, "build/");
}

} // namespace codegraph::detect
