#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileReaderTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    std::vector<std::uint8_t> data(12345);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i & 0xFF);
    testutil::WriteFile(p, data);

    fwfleet::FileReader r;
    auto res = fwfleet::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());
    EXPECT_EQ(r.Path(), p);
}

TEST_F(FileReaderTests, OpenNonexistent_Fails) {
    fwfleet::FileReader r;
    auto res = fwfleet::FileReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_NE(res.err, 0);
}

TEST_F(FileReaderTests, ReadAllBytes_EqualsInput) {
    const std::string p = MakePath("in2.bin");
    std::vector<std::uint8_t> data(2 * 1024 * 1024 + 7);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
    testutil::WriteFile(p, data);

    fwfleet::FileReader r;
    auto res = fwfleet::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out;
    out.resize(data.size());

    size_t pos = 0;
    while (pos < out.size()) {
        std::span<std::uint8_t> buf(out.data() + pos, out.size() - pos);
        ssize_t n = r.Read(buf);
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(out, data);
}

TEST_F(FileReaderTests, WriterRoundTripsThroughReader) {
    const std::string p = MakePath("out.bin");

    fwfleet::FileWriter w;
    auto res = fwfleet::FileWriter::Open(p, w);
    ASSERT_TRUE(res.ok) << res.msg;

    const std::string payload = "firmware bytes";
    res = w.WriteAll(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(payload.data()),
                                                   payload.size()));
    ASSERT_TRUE(res.ok) << res.msg;
    ASSERT_TRUE(w.FsyncNow().ok);
    EXPECT_EQ(w.BytesWritten(), payload.size());
    ASSERT_TRUE(w.Close().ok);

    fwfleet::FileReader r;
    ASSERT_TRUE(fwfleet::FileReader::Open(p, r).ok);
    EXPECT_EQ(testutil::ReadAll(r), payload);
}

} // namespace
