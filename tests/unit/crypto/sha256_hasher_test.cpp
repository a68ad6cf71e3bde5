#include <gtest/gtest.h>
#include <span>
#include <codegraph/crypto/hasher.h>
#include "../../utils/test_helpers.h"

using namespace codegraph;
using namespace codegraph::crypto;
using namespace codegraph::test;

class SHA256HasherTest : public CodegraphTest {
protected:
    std::unique_ptr<SHA256Hasher> hasher;

    void SetUp() override {
        CodegraphTest::SetUp();
        hasher = std::make_unique<SHA256Hasher>();
    }

    static std::span<const std::byte> bytes(std::string_view s) {
        return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
    }
};

TEST_F(SHA256HasherTest, EmptyInput) {
    hasher->init();
    EXPECT_EQ(hasher->finalize(), TestVectors::EMPTY_SHA256);
}

TEST_F(SHA256HasherTest, KnownTestVector) {
    hasher->init();
    hasher->update(bytes("abc"));
    EXPECT_EQ(hasher->finalize(), TestVectors::ABC_SHA256);
    EXPECT_EQ(SHA256Hasher::hash(std::string_view("abc")), TestVectors::ABC_SHA256);
}

TEST_F(SHA256HasherTest, StreamingUpdate) {
    const std::string data(1000, 'q');

    hasher->init();
    hasher->update(bytes(std::string_view(data).substr(0, 100)));
    hasher->update(bytes(std::string_view(data).substr(100, 400)));
    hasher->update(bytes(std::string_view(data).substr(500)));
    auto streamed = hasher->finalize();

    EXPECT_EQ(streamed, SHA256Hasher::hash(std::string_view(data)));
    EXPECT_EQ(streamed.size(), 64u);
}

TEST_F(SHA256HasherTest, FileHashing) {
    auto path = writeFile("src/a.ts", "export function foo() {}\n");

    auto fileHash = hasher->hashFile(path);
    ASSERT_TRUE(fileHash.has_value());
    EXPECT_EQ(fileHash.value(), SHA256Hasher::hash(std::string_view("export function foo() {}\n")));
}

TEST_F(SHA256HasherTest, MissingFileIsAnIOError) {
    auto result = hasher->hashFile(testDir / "does-not-exist.ts");
    EXPECT_THAT(result, HasErrorCode(ErrorCode::IOError));
}

TEST_F(SHA256HasherTest, FactoryReturnsSha256) {
    auto generic = createSHA256Hasher();
    generic->init();
    generic->update(bytes("abc"));
    EXPECT_EQ(generic->finalize(), TestVectors::ABC_SHA256);
}
