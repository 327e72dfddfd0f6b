#include "cli/commands.hpp"

#include "ota/streaming_installer.hpp"
#include "release/catalog_release_source.hpp"
#include "release/local_asset_downloader.hpp"
#include "store/memory_state_store.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace fwfleet::cli {
namespace {

namespace fs = std::filesystem;

// Owns mutable argv storage for getopt.
class Argv {
  public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

Result Parse(Command cmd, std::initializer_list<std::string> args, CommandArgs& out) {
    Argv argv(args);
    return ParseCommandArgs(cmd, argv.argc(), argv.argv(), out);
}

TEST(ParseCommandTest, KnownNames) {
    Command cmd{};
    ASSERT_TRUE(ParseCommand("update", cmd));
    EXPECT_EQ(cmd, Command::Update);
    ASSERT_TRUE(ParseCommand("log", cmd));
    EXPECT_EQ(cmd, Command::Log);
    EXPECT_FALSE(ParseCommand("flash", cmd));
    EXPECT_STREQ(ToString(Command::Verify), "verify");
}

TEST(ParseCommandArgsTest, ListTakesFilters) {
    CommandArgs args;
    auto r = Parse(Command::List, {"list", "--device", "alice", "--component=kernel", "--status", "available"}, args);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(args.device, "alice");
    EXPECT_EQ(args.component, "kernel");
    ASSERT_TRUE(args.status.has_value());
    EXPECT_EQ(*args.status, FirmwareStatus::Available);
}

TEST(ParseCommandArgsTest, UpdateDryRun) {
    CommandArgs args;
    ASSERT_TRUE(Parse(Command::Update, {"update", "--dry-run", "--device", "aria64"}, args).ok);
    EXPECT_TRUE(args.dry_run);
    EXPECT_EQ(args.device, "aria64");
    EXPECT_FALSE(args.component.has_value());
}

TEST(ParseCommandArgsTest, LogLimit) {
    CommandArgs args;
    ASSERT_TRUE(Parse(Command::Log, {"log"}, args).ok);
    EXPECT_EQ(args.limit, 20U);

    ASSERT_TRUE(Parse(Command::Log, {"log", "--limit", "5"}, args).ok);
    EXPECT_EQ(args.limit, 5U);

    EXPECT_TRUE(Parse(Command::Log, {"log", "--limit", "five"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::Log, {"log", "--limit", "-1"}, args).Is(Errc::InvalidArgument));
}

TEST(ParseCommandArgsTest, RejectsOptionsTheCommandDoesNotTake) {
    CommandArgs args;
    EXPECT_TRUE(Parse(Command::Check, {"check", "--component", "os"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::List, {"list", "--dry-run"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::Log, {"log", "--device", "alice"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::Verify, {"verify", "--limit", "3"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::List, {"list", "--status", "bogus"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::List, {"list", "--frobnicate"}, args).Is(Errc::InvalidArgument));
    EXPECT_TRUE(Parse(Command::List, {"list", "stray"}, args).Is(Errc::InvalidArgument));
}

class RunCommandTest : public ::testing::Test {
  protected:
    void SetUp() override {
        prev_level_ = Logger::Instance().Level();
        Logger::Instance().SetLevel(LogLevel::None);

        releases_ = fs::path(temp_.Path()) / "releases";
        fs::create_directories(releases_);

        store_ = std::make_shared<MemoryStateStore>();
        source_ = std::make_shared<CatalogReleaseSource>();
        auto downloader = std::make_shared<LocalAssetDownloader>();
        auto installer = std::make_shared<StreamingInstaller>(downloader, StreamingInstaller::Options{});

        UpdateOrchestrator::Options opt;
        opt.install_root = (fs::path(temp_.Path()) / "fleet").string();
        opt.devices = {"aria64", "alice"};
        opt.components = {"os", "kernel"};
        orch_ = std::make_unique<UpdateOrchestrator>(opt, source_, downloader, installer, store_);
    }

    void TearDown() override { Logger::Instance().SetLevel(prev_level_); }

    // Runs |cmd| and captures what it prints.
    int Run(Command cmd, const CommandArgs& args, std::string& output) {
        char* buf = nullptr;
        size_t len = 0;
        std::FILE* out = ::open_memstream(&buf, &len);
        EXPECT_NE(out, nullptr);
        const int rc = RunCommand(cmd, args, *store_, *orch_, out);
        std::fclose(out);
        output.assign(buf, len);
        std::free(buf);
        return rc;
    }

    void Seed(const std::string& device, const std::string& component, const std::string& version) {
        FirmwareRecord rec;
        rec.device = device;
        rec.component = component;
        rec.version = version;
        rec.release_date = "2024-01-01";
        rec.checksum = std::string(64, 'e');
        ASSERT_TRUE(store_->Upsert(rec).ok);
    }

    testutil::TemporaryDirectory temp_;
    fs::path releases_;
    std::shared_ptr<MemoryStateStore> store_;
    std::shared_ptr<CatalogReleaseSource> source_;
    std::unique_ptr<UpdateOrchestrator> orch_;

  private:
    LogLevel prev_level_{LogLevel::Info};
};

TEST_F(RunCommandTest, ListEmptyAndPopulated) {
    std::string output;
    EXPECT_EQ(Run(Command::List, {}, output), 0);
    EXPECT_NE(output.find("No firmware records found."), std::string::npos);

    Seed("alice", "kernel", "6.6.31");
    EXPECT_EQ(Run(Command::List, {}, output), 0);
    EXPECT_NE(output.find("alice"), std::string::npos);
    EXPECT_NE(output.find("6.6.31"), std::string::npos);
    EXPECT_NE(output.find("current"), std::string::npos);
}

TEST_F(RunCommandTest, CheckReportsPendingUpdates) {
    Seed("alice", "kernel", "6.6.31");
    source_->Publish("kernel", testutil::PublishRelease(releases_, "kernel", {"6.6.51", {{"VERSION", "6.6.51"}}}));

    std::string output;
    CommandArgs args;
    args.device = "alice";
    EXPECT_EQ(Run(Command::Check, args, output), 0);
    EXPECT_NE(output.find("1 update(s) available"), std::string::npos);
    EXPECT_NE(output.find("6.6.31"), std::string::npos);
    EXPECT_NE(output.find("6.6.51"), std::string::npos);
    EXPECT_NE(output.find("could not be checked"), std::string::npos);
}

TEST_F(RunCommandTest, UpdateThenVerifyThenLog) {
    Seed("alice", "kernel", "6.6.31");
    source_->Publish("kernel", testutil::PublishRelease(releases_, "kernel", {"6.6.51", {{"VERSION", "6.6.51"}}}));

    CommandArgs args;
    args.device = "alice";
    args.component = "kernel";

    std::string output;
    EXPECT_EQ(Run(Command::Update, args, output), 0);
    EXPECT_NE(output.find("[updated]"), std::string::npos);

    EXPECT_EQ(Run(Command::Verify, args, output), 0);
    EXPECT_NE(output.find("[ok]"), std::string::npos);
    EXPECT_NE(output.find("All checksums verified."), std::string::npos);

    EXPECT_EQ(Run(Command::Log, CommandArgs{}, output), 0);
    EXPECT_NE(output.find("6.6.31"), std::string::npos);
    EXPECT_NE(output.find("[success]"), std::string::npos);
}

TEST_F(RunCommandTest, UpdateDryRunSaysSo) {
    source_->Publish("os", testutil::PublishRelease(releases_, "os", {"2024.10.1", {{"VERSION", "2024.10.1"}}}));

    CommandArgs args;
    args.component = "os";
    args.dry_run = true;

    std::string output;
    EXPECT_EQ(Run(Command::Update, args, output), 0);
    EXPECT_NE(output.find("[would-update]"), std::string::npos);
    EXPECT_NE(output.find("[dry-run] No changes applied."), std::string::npos);
}

TEST_F(RunCommandTest, UpdateFailureExitsNonZero) {
    source_->Publish("kernel", testutil::PublishRelease(releases_, "kernel",
                                                        {"6.6.51", {{"VERSION", "6.6.51"}},
                                                         testutil::ChecksumAsset::Wrong}));
    CommandArgs args;
    args.device = "alice";
    args.component = "kernel";

    std::string output;
    EXPECT_EQ(Run(Command::Update, args, output), 1);
    EXPECT_NE(output.find("[failed]"), std::string::npos);
}

TEST_F(RunCommandTest, UpdateUnknownDeviceExitsNonZero) {
    CommandArgs args;
    args.device = "bob";
    std::string output;
    EXPECT_EQ(Run(Command::Update, args, output), 1);
}

TEST_F(RunCommandTest, VerifyMissingRecordExitsNonZero) {
    Seed("alice", "kernel", "6.6.31");

    CommandArgs args;
    args.device = "alice";
    std::string output;
    EXPECT_EQ(Run(Command::Verify, args, output), 1);
    EXPECT_NE(output.find("[unverified]"), std::string::npos);
    EXPECT_NE(output.find("[missing]"), std::string::npos);
    EXPECT_NE(output.find("Some checksums failed."), std::string::npos);
}

TEST_F(RunCommandTest, LogEmpty) {
    std::string output;
    EXPECT_EQ(Run(Command::Log, CommandArgs{}, output), 0);
    EXPECT_NE(output.find("No update log entries found."), std::string::npos);
}

} // namespace
} // namespace fwfleet::cli
