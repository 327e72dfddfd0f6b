#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace fwfleet {
namespace {

constexpr const char* kAbcDigest =
    "ba7816bf8f01cfea414140de5dae2223"
    "b00361a396177a9cb410ff61f20015ad";

TEST(Sha256Test, KnownVector) {
    testutil::MemoryReader reader(std::string("abc"));
    EXPECT_EQ(Sha256Hex(reader), kAbcDigest);
    EXPECT_EQ(Sha256Hex(std::string_view("abc")), kAbcDigest);
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::string_view()),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalHasherMatchesOneShot) {
    Sha256Hasher hasher;
    hasher.Update(std::string_view("a"));
    hasher.Update(std::string_view("bc"));
    EXPECT_EQ(hasher.FinalHex(), kAbcDigest);
}

TEST(Sha256Test, HashingWriterForwardsAndHashes) {
    testutil::MemoryWriter sink;
    HashingWriter writer(sink);

    const std::string chunk1 = "ab";
    const std::string chunk2 = "c";
    ASSERT_TRUE(writer.WriteAll(std::span<const std::uint8_t>(
                                    reinterpret_cast<const std::uint8_t*>(chunk1.data()), chunk1.size()))
                    .ok);
    ASSERT_TRUE(writer.WriteAll(std::span<const std::uint8_t>(
                                    reinterpret_cast<const std::uint8_t*>(chunk2.data()), chunk2.size()))
                    .ok);

    EXPECT_EQ(sink.data, "abc");
    EXPECT_EQ(writer.BytesWritten(), 3U);
    EXPECT_EQ(writer.FinalHex(), kAbcDigest);
}

TEST(Sha256Test, HashesFile) {
    testutil::TemporaryDirectory tmp;
    const auto path = std::filesystem::path(tmp.Path()) / "abc.txt";
    testutil::WriteFile(path, std::string("abc"));

    std::string hex;
    auto res = Sha256HexFile(path.string(), hex);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(hex, kAbcDigest);

    res = Sha256HexFile((std::filesystem::path(tmp.Path()) / "missing").string(), hex);
    EXPECT_FALSE(res.ok);
}

} // namespace
} // namespace fwfleet
