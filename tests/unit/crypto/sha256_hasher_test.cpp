#include "test_helpers.h"
#include <gtest/gtest.h>
#include <scry/crypto/hasher.h>

#include <string>

using namespace scry;
using namespace scry::crypto;
using namespace scry::test;

class SHA256HasherTest : public ScryTest {
protected:
    std::unique_ptr<SHA256Hasher> hasher;

    void SetUp() override {
        ScryTest::SetUp();
        hasher = std::make_unique<SHA256Hasher>();
    }
};

TEST_F(SHA256HasherTest, EmptyInput) {
    hasher->init();
    auto hash = hasher->finalize();
    EXPECT_EQ(hash, TestVectors::EMPTY_SHA256);
}

TEST_F(SHA256HasherTest, KnownTestVector) {
    hasher->init();
    hasher->update(std::string_view("abc"));
    EXPECT_EQ(hasher->finalize(), TestVectors::ABC_SHA256);
}

TEST_F(SHA256HasherTest, StreamingUpdateMatchesOneShot) {
    std::string data(1000, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i * 31 % 251);

    hasher->init();
    hasher->update(std::string_view(data).substr(0, 100));
    hasher->update(std::string_view(data).substr(100, 400));
    hasher->update(std::string_view(data).substr(500));
    auto chunked = hasher->finalize();

    EXPECT_EQ(chunked, SHA256Hasher::hash(std::string_view(data)));
    EXPECT_EQ(chunked.size(), 64u);
}

TEST_F(SHA256HasherTest, FileHashingMatchesContentHash) {
    auto path = writeFile("payload.bin", "abc");
    auto fileHash = hasher->hashFile(path);
    ASSERT_TRUE(fileHash.has_value());
    EXPECT_EQ(fileHash.value(), TestVectors::ABC_SHA256);
}

TEST_F(SHA256HasherTest, GenericHashMethod) {
    std::string text = "abc";
    EXPECT_EQ(hasher->IContentHasher::hash(text), TestVectors::ABC_SHA256);
}

TEST_F(SHA256HasherTest, MissingFileIsAnError) {
    auto result = hasher->hashFile(testDir / "does-not-exist");
    EXPECT_THAT(result, HasErrorCode(ErrorCode::FileNotFound));
}

TEST_F(SHA256HasherTest, FactoryCreatesSha256) {
    auto generic = createSHA256Hasher();
    generic->init();
    generic->update(std::string_view("abc"));
    EXPECT_EQ(generic->finalize(), TestVectors::ABC_SHA256);
}
