#include <gtest/gtest.h>
#include <ragrank/crypto/hasher.h>

#include <string>

using namespace ragrank::crypto;

namespace {
constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kHelloWorldSha256 =
    "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
} // namespace

class SHA256HasherTest : public ::testing::Test {
protected:
    SHA256Hasher hasher;
};

TEST_F(SHA256HasherTest, EmptyInput) {
    hasher.init();
    EXPECT_EQ(hasher.finalize(), kEmptySha256);
}

TEST_F(SHA256HasherTest, KnownTestVectors) {
    EXPECT_EQ(SHA256Hasher::hashText("abc"), kAbcSha256);
    EXPECT_EQ(SHA256Hasher::hashText("hello world"), kHelloWorldSha256);
}

TEST_F(SHA256HasherTest, StreamingMatchesOneShot) {
    const std::string text = "hello world";
    hasher.init();
    hasher.update(std::as_bytes(std::span(text.data(), 5)));
    hasher.update(std::as_bytes(std::span(text.data() + 5, text.size() - 5)));
    EXPECT_EQ(hasher.finalize(), kHelloWorldSha256);
}

TEST_F(SHA256HasherTest, FinalizeResetsState) {
    hasher.update(std::as_bytes(std::span("abc", 3)));
    EXPECT_EQ(hasher.finalize(), kAbcSha256);
    EXPECT_EQ(hasher.finalize(), kEmptySha256);
}

TEST_F(SHA256HasherTest, InterfaceHashesText) {
    auto generic = createSHA256Hasher();
    EXPECT_EQ(generic->hash("abc"), kAbcSha256);
    EXPECT_EQ(generic->hash("abc").size(), 64u);
}

TEST_F(SHA256HasherTest, MoveKeepsHasherUsable) {
    SHA256Hasher moved = std::move(hasher);
    moved.update(std::as_bytes(std::span("abc", 3)));
    EXPECT_EQ(moved.finalize(), kAbcSha256);
}
