#include <gtest/gtest.h>
#include <codegraph/detect/language.h>

using namespace codegraph::detect;

TEST(LanguageTest, MapsExtensions) {
    EXPECT_EQ(getLanguageFromExtension("src/a.ts"), "typescript");
    EXPECT_EQ(getLanguageFromExtension("src/App.TSX"), "typescript");
    EXPECT_EQ(getLanguageFromExtension("lib/util.mjs"), "javascript");
    EXPECT_EQ(getLanguageFromExtension("tools/build.py"), "python");
    EXPECT_EQ(getLanguageFromExtension("Game/player.gd"), "gdscript");
    EXPECT_EQ(getLanguageFromExtension("App/Program.cs"), "csharp");
    EXPECT_EQ(getLanguageFromExtension("web/index.php"), "php");

    EXPECT_FALSE(getLanguageFromExtension("README.md").has_value());
    EXPECT_FALSE(getLanguageFromExtension("Makefile").has_value());
    EXPECT_FALSE(getLanguageFromExtension(".ts").has_value());
    EXPECT_FALSE(getLanguageFromExtension("dir.ts/file").has_value());
}

TEST(LanguageTest, SupportedSources) {
    EXPECT_TRUE(isSupportedSource("a/b/c.vue"));
    EXPECT_FALSE(isSupportedSource("a/b/c.json"));
}

TEST(LanguageTest, ImportExtensionsPreferTypeScript) {
    const auto& exts = importResolutionExtensions();
    ASSERT_FALSE(exts.empty());
    EXPECT_EQ(exts.front(), ".ts");
}

TEST(LanguageTest, TestPaths) {
    EXPECT_TRUE(isTestPath("tests/cart.ts"));
    EXPECT_TRUE(isTestPath("src/__tests__/cart.ts"));
    EXPECT_TRUE(isTestPath("src/cart.test.ts"));
    EXPECT_TRUE(isTestPath("src/cart.spec.js"));
    EXPECT_TRUE(isTestPath("pkg/cart_test.py"));
    EXPECT_FALSE(isTestPath("src/contest/cart.ts"));
    EXPECT_FALSE(isTestPath("src/cart.ts"));
}

TEST(LanguageTest, GeneratedPaths) {
    EXPECT_TRUE(isGeneratedPath("types/index.d.ts"));
    EXPECT_TRUE(isGeneratedPath("public/app.min.js"));
    EXPECT_TRUE(isGeneratedPath("dist/app.js"));
    EXPECT_TRUE(isGeneratedPath("packages/ui/build/app.js"));
    EXPECT_TRUE(isGeneratedPath("src/generated/api.ts"));
    EXPECT_FALSE(isGeneratedPath("src/builder.ts"));
}
