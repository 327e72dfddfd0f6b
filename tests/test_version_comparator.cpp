#include <gtest/gtest.h>

#include "util/version_comparator.hpp"

#include <string>
#include <vector>

namespace fwfleet {
namespace {

TEST(VersionComparatorTest, OrdersNumericallyNotLexically) {
    EXPECT_TRUE(VersionComparator::IsNewer("6.6.51", "6.6.31"));
    EXPECT_FALSE(VersionComparator::IsNewer("6.6.31", "6.6.51"));
    EXPECT_TRUE(VersionComparator::IsNewer("6.10.0", "6.9.9"));
    EXPECT_EQ(VersionComparator::Compare("1.2.3", "1.2.3"), 0);
}

TEST(VersionComparatorTest, PadsShorterVersionWithZeros) {
    EXPECT_TRUE(VersionComparator::IsSame("6.6", "6.6.0"));
    EXPECT_TRUE(VersionComparator::IsSame("1", "1.0.0.0"));
    EXPECT_TRUE(VersionComparator::IsNewer("6.6.1", "6.6"));
}

TEST(VersionComparatorTest, UnparseableIsLowerThanEveryVersion) {
    EXPECT_LT(VersionComparator::Compare("bad", "0.0.1"), 0);
    EXPECT_GT(VersionComparator::Compare("0.0.1", "bad"), 0);
    EXPECT_LT(VersionComparator::Compare("", "0"), 0);
    EXPECT_LT(VersionComparator::Compare("unknown", "6.6.20"), 0);
    EXPECT_LT(VersionComparator::Compare("1..2", "0.1"), 0);
    EXPECT_LT(VersionComparator::Compare("1.2.x", "0.1"), 0);
    EXPECT_LT(VersionComparator::Compare("99999999999999999999999", "0.1"), 0);
}

TEST(VersionComparatorTest, UnparseableStringsAreEqualToEachOther) {
    EXPECT_TRUE(VersionComparator::IsSame("bad", "worse"));
    EXPECT_TRUE(VersionComparator::IsSame("", "v1.2"));
}

TEST(VersionComparatorTest, DateVersionsOrderChronologically) {
    EXPECT_TRUE(VersionComparator::IsNewer("2024-11-19", "2024-07-04"));
    EXPECT_TRUE(VersionComparator::IsNewer("2024-09-23", "2024-01-22"));
    EXPECT_TRUE(VersionComparator::IsSame("2024-11-19", "2024.11.19"));
    EXPECT_FALSE(VersionComparator::Parse("2024--11").has_value());
}

TEST(VersionComparatorTest, ParseReturnsSegments) {
    auto parts = VersionComparator::Parse("6.6.51");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(*parts, (std::vector<std::uint64_t>{6, 6, 51}));
    EXPECT_FALSE(VersionComparator::Parse("6.6.").has_value());
    EXPECT_FALSE(VersionComparator::Parse("-1").has_value());
}

TEST(VersionComparatorTest, OrderIsTotalAndTransitive) {
    const std::vector<std::string> versions = {
        "bad", "", "0", "0.0.1", "1", "1.0", "1.0.1", "6.6", "6.6.0", "6.6.20", "6.6.31", "6.6.51",
        "2024-01-22", "2024-11-19", "x.y",
    };

    for (const auto& a : versions) {
        for (const auto& b : versions) {
            const int ab = VersionComparator::Compare(a, b);
            const int ba = VersionComparator::Compare(b, a);
            EXPECT_EQ(ab, -ba) << a << " vs " << b;

            const int holds = (ab > 0) + (ab < 0) + (ab == 0);
            EXPECT_EQ(holds, 1);

            for (const auto& c : versions) {
                if (ab <= 0 && VersionComparator::Compare(b, c) <= 0) {
                    EXPECT_LE(VersionComparator::Compare(a, c), 0) << a << " <= " << b << " <= " << c;
                }
            }
        }
    }
}

} // namespace
} // namespace fwfleet
