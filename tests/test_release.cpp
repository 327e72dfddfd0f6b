#include <gtest/gtest.h>

#include "release/catalog_release_source.hpp"
#include "release/http_client.hpp"
#include "release/http_release_source.hpp"
#include "release/release.hpp"
#include "release/release_parser.hpp"

#include <memory>
#include <string>

namespace fwfleet {
namespace {

ReleaseMetadata MakeRelease(std::vector<ReleaseAsset> assets) {
    ReleaseMetadata rel;
    rel.tag = "v6.6.51";
    rel.version = "6.6.51";
    rel.assets = std::move(assets);
    return rel;
}

TEST(ReleaseTest, VersionFromTagStripsLeadingV) {
    EXPECT_EQ(VersionFromTag("v6.6.51"), "6.6.51");
    EXPECT_EQ(VersionFromTag("V1.0"), "1.0");
    EXPECT_EQ(VersionFromTag("2024-11-19"), "2024-11-19");
    EXPECT_EQ(VersionFromTag(""), "");
}

TEST(ReleaseTest, SelectsFirstTarGzAsset) {
    auto rel = MakeRelease({
        {"notes.txt", "https://x/notes.txt"},
        {"kernel-6.6.51.tar.gz", "https://x/kernel-6.6.51.tar.gz"},
        {"kernel-debug.tar.gz", "https://x/kernel-debug.tar.gz"},
    });

    ReleaseAsset payload;
    auto res = SelectPayloadAsset(rel, payload);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(payload.name, "kernel-6.6.51.tar.gz");
}

TEST(ReleaseTest, NoPayloadIsNoAssetFound) {
    auto rel = MakeRelease({{"kernel.zip", "https://x/kernel.zip"}});
    ReleaseAsset payload;
    auto res = SelectPayloadAsset(rel, payload);
    EXPECT_TRUE(res.Is(Errc::NoAssetFound));
}

TEST(ReleaseTest, PrefersSiblingChecksumAsset) {
    auto rel = MakeRelease({
        {"other.tar.gz.sha256", "https://x/other.sha256"},
        {"kernel.tar.gz", "https://x/kernel.tar.gz"},
        {"kernel.tar.gz.sha256", "https://x/kernel.tar.gz.sha256"},
    });
    const ReleaseAsset payload{"kernel.tar.gz", "https://x/kernel.tar.gz"};

    auto sum = SelectChecksumAsset(rel, payload);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(sum->name, "kernel.tar.gz.sha256");
}

TEST(ReleaseTest, FallsBackToAnyChecksumAsset) {
    auto rel = MakeRelease({
        {"kernel.tar.gz", "https://x/kernel.tar.gz"},
        {"SHA256SUMS.sha256sum", "https://x/SHA256SUMS.sha256sum"},
    });
    auto sum = SelectChecksumAsset(rel, rel.assets[0]);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(sum->name, "SHA256SUMS.sha256sum");

    auto bare = MakeRelease({{"kernel.tar.gz", "https://x/kernel.tar.gz"}});
    EXPECT_FALSE(SelectChecksumAsset(bare, bare.assets[0]).has_value());
}

TEST(ReleaseParserTest, ParsesLatestReleaseDocument) {
    const std::string doc = R"({
        "tag_name": "v6.6.51",
        "published_at": "2024-10-01T08:30:00Z",
        "body": "Linux 6.6.y LTS",
        "html_url": "https://github.com/raspberrypi/linux/releases/tag/v6.6.51",
        "assets": [
            {"name": "kernel-6.6.51.tar.gz", "browser_download_url": "https://dl/kernel-6.6.51.tar.gz"},
            {"name": "kernel-6.6.51.tar.gz.sha256", "browser_download_url": "https://dl/kernel-6.6.51.tar.gz.sha256"}
        ]
    })";

    ReleaseParser parser;
    auto rel = parser.Parse(doc);
    ASSERT_TRUE(rel.has_value()) << rel.error();
    EXPECT_EQ(rel->tag, "v6.6.51");
    EXPECT_EQ(rel->version, "6.6.51");
    EXPECT_EQ(rel->release_date, "2024-10-01");
    EXPECT_EQ(rel->notes, "Linux 6.6.y LTS");
    ASSERT_EQ(rel->assets.size(), 2U);
    EXPECT_EQ(rel->assets[1].download_url, "https://dl/kernel-6.6.51.tar.gz.sha256");
}

TEST(ReleaseParserTest, RejectsMalformedDocuments) {
    ReleaseParser parser;
    EXPECT_FALSE(parser.Parse("").has_value());
    EXPECT_FALSE(parser.Parse("{not json").has_value());
    EXPECT_FALSE(parser.Parse("[]").has_value());
    EXPECT_FALSE(parser.Parse(R"({"name": "no tag"})").has_value());
    EXPECT_FALSE(parser.Parse(R"({"tag_name": "v1", "assets": {}})").has_value());
}

TEST(CatalogReleaseSourceTest, ServesPublishedReleases) {
    CatalogReleaseSource source;
    ReleaseMetadata out;
    EXPECT_TRUE(source.LatestRelease("kernel", out).Is(Errc::NotFound));

    ReleaseMetadata rel;
    rel.tag = "v6.6.51";
    source.Publish("kernel", rel);

    auto res = source.LatestRelease("kernel", out);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(out.version, "6.6.51");
}

TEST(HttpReleaseSourceTest, BuildsLatestReleaseUrl) {
    HttpReleaseSource::Options opt;
    opt.api_base = "https://api.example.com/";
    opt.repos["kernel"] = "raspberrypi/linux";
    HttpReleaseSource source(opt, std::make_shared<const HttpClient>());

    EXPECT_EQ(source.LatestReleaseUrl("raspberrypi/linux"),
              "https://api.example.com/repos/raspberrypi/linux/releases/latest");
}

TEST(HttpReleaseSourceTest, UnmappedComponentIsNotFound) {
    HttpReleaseSource source(HttpReleaseSource::Options{}, std::make_shared<const HttpClient>());
    ReleaseMetadata out;
    auto res = source.LatestRelease("bootloader", out);
    EXPECT_TRUE(res.Is(Errc::NotFound));
}

TEST(HttpReleaseSourceTest, DropsAssetsWithLocalUrls) {
    auto rel = MakeRelease({
        {"kernel.tar.gz", "/etc/shadow"},
        {"kernel.tar.gz.sha256", "file:///tmp/kernel.tar.gz.sha256"},
        {"linux.tar.gz", "https://example.com/linux.tar.gz"},
    });

    EXPECT_EQ(HttpReleaseSource::DropNonRemoteAssets(rel), 2u);
    ASSERT_EQ(rel.assets.size(), 1u);
    EXPECT_EQ(rel.assets[0].name, "linux.tar.gz");

    ReleaseAsset payload;
    ASSERT_TRUE(SelectPayloadAsset(rel, payload).ok);
    EXPECT_EQ(payload.download_url, "https://example.com/linux.tar.gz");
}

} // namespace
} // namespace fwfleet
