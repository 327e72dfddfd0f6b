#include "fleet/fleet_seeder.hpp"

#include "crypto/sha256.hpp"
#include "store/memory_state_store.hpp"

#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>

namespace fwfleet {
namespace {

ReleaseMetadata Latest(const std::string& version) {
    ReleaseMetadata rel;
    rel.tag = "v" + version;
    rel.version = version;
    rel.notes = "release " + version;
    rel.html_url = "https://example.invalid/releases/" + version;
    return rel;
}

TEST(FleetSeederTest, SeedsMissingPairsWithStatusFromCatalog) {
    MemoryStateStore store;
    const SeedVersions seed{
        {"alice", {{"kernel", "6.6.31"}, {"os", "2024.10.1"}}},
        {"aria64", {{"bootloader", "2024.04"}}},
    };
    const std::map<std::string, ReleaseMetadata> catalog{
        {"kernel", Latest("6.6.51")},
        {"os", Latest("2024.10.1")},
    };

    std::size_t inserted = 0;
    ASSERT_TRUE(SeedFleet(store, seed, catalog, inserted).ok);
    EXPECT_EQ(inserted, 3U);

    std::optional<FirmwareRecord> rec;
    ASSERT_TRUE(store.Get("alice", "kernel", rec).ok);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->version, "6.6.31");
    EXPECT_EQ(rec->status, FirmwareStatus::Available);
    EXPECT_EQ(rec->checksum, Sha256Hex("alice-kernel-6.6.31"));
    EXPECT_EQ(rec->notes, "release 6.6.51");

    ASSERT_TRUE(store.Get("alice", "os", rec).ok);
    EXPECT_EQ(rec->status, FirmwareStatus::Current);

    ASSERT_TRUE(store.Get("aria64", "bootloader", rec).ok);
    EXPECT_EQ(rec->status, FirmwareStatus::Available);
    EXPECT_TRUE(rec->download_url.empty());
}

TEST(FleetSeederTest, ExistingRecordsAreLeftAlone) {
    MemoryStateStore store;
    FirmwareRecord installed;
    installed.device = "alice";
    installed.component = "kernel";
    installed.version = "6.6.51";
    installed.checksum = std::string(64, 'a');
    ASSERT_TRUE(store.Upsert(installed).ok);

    const SeedVersions seed{{"alice", {{"kernel", "6.6.31"}}}};
    std::size_t inserted = 0;
    ASSERT_TRUE(SeedFleet(store, seed, {}, inserted).ok);
    EXPECT_EQ(inserted, 0U);

    std::optional<FirmwareRecord> rec;
    ASSERT_TRUE(store.Get("alice", "kernel", rec).ok);
    EXPECT_EQ(rec->version, "6.6.51");
    EXPECT_EQ(rec->checksum, std::string(64, 'a'));
}

TEST(FleetSeederTest, SeedingTwiceInsertsOnce) {
    MemoryStateStore store;
    const SeedVersions seed{{"blackroad-pi", {{"os", "2024.09.0"}}}};

    std::size_t inserted = 0;
    ASSERT_TRUE(SeedFleet(store, seed, {}, inserted).ok);
    EXPECT_EQ(inserted, 1U);
    ASSERT_TRUE(SeedFleet(store, seed, {}, inserted).ok);
    EXPECT_EQ(inserted, 0U);
}

} // namespace
} // namespace fwfleet
