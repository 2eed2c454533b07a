#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"
#include "mirror/ledger/ledger.hpp"
#include "mirror/orchestrator/orchestrator.hpp"

#include "support/fake_remote_source.hpp"
#include "support/temp_dir.hpp"
#include "support/zip_writer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace fs = std::filesystem;

using mirror::ErrorKind;
using mirror::MirrorConfig;
using mirror::ledger::Ledger;
using mirror::orchestrator::MirrorOrchestrator;
using mirror::orchestrator::RunSummary;
using mirror::test_support::FakeRemoteSource;
using mirror::test_support::TempDir;
using mirror::test_support::listing_page;
using mirror::test_support::make_zip;
using mirror::test_support::read_file;

namespace {

const std::string kRoot = "https://mirror.test/files/";

class MirrorRun {
public:
    MirrorRun() {
        config_.root_url = kRoot;
        config_.destination_root = dir_ / "mirror";
        config_.ledger_path = dir_ / "downloads.db";
        config_.worker_count = 3;

        auto opened = Ledger::open(config_.ledger_path);
        if (opened.is_error()) {
            throw std::runtime_error(opened.error().message);
        }
        ledger_ = std::move(opened.value());
    }

    RunSummary run(const std::atomic<bool>* interrupt = nullptr) {
        MirrorOrchestrator orchestrator(config_, remote_, *ledger_, bus_, interrupt);
        return orchestrator.run();
    }

    MirrorConfig& config() { return config_; }
    FakeRemoteSource& remote() { return remote_; }
    Ledger& ledger() { return *ledger_; }
    mirror::events::EventBus& bus() { return bus_; }
    fs::path mirror_root() const { return dir_ / "mirror"; }

private:
    TempDir dir_;
    MirrorConfig config_;
    FakeRemoteSource remote_;
    std::unique_ptr<Ledger> ledger_;
    mirror::events::EventBus bus_;
};

} // namespace

TEST(MirrorOrchestrator, MirrorsFilesAndExtractsArchives) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"a.bin", "b.zip"}));
    fixture.remote().add_file(kRoot + "a.bin", "alpha");
    fixture.remote().add_file(kRoot + "b.zip", make_zip({{"b.txt", "bravo"}}));

    const auto summary = fixture.run();

    EXPECT_EQ(summary.exit_code(0), mirror::orchestrator::kExitSuccess);
    EXPECT_EQ(summary.queued, 2u);
    EXPECT_EQ(summary.ok, 2u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(read_file(fixture.mirror_root() / "a.bin"), "alpha");
    EXPECT_EQ(read_file(fixture.mirror_root() / "b.txt"), "bravo");
    EXPECT_FALSE(fs::exists(fixture.mirror_root() / "b.zip"));
    EXPECT_EQ(fixture.ledger().size().value(), 2u);
}

TEST(MirrorOrchestrator, SecondRunSkipsEverything) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"a.bin", "sub/"}));
    fixture.remote().add_page(kRoot + "sub/", listing_page({"b.zip"}));
    fixture.remote().add_file(kRoot + "a.bin", "alpha");
    fixture.remote().add_file(kRoot + "sub/b.zip", make_zip({{"b.txt", "bravo"}}));

    const auto first = fixture.run();
    ASSERT_EQ(first.ok, 2u);
    const auto streams_after_first = fixture.remote().total_streams();

    const auto second = fixture.run();
    EXPECT_EQ(second.exit_code(0), mirror::orchestrator::kExitSuccess);
    EXPECT_EQ(second.skipped_ledger, 2u);
    EXPECT_EQ(second.ok, 0u);
    EXPECT_EQ(fixture.remote().total_streams(), streams_after_first);
}

TEST(MirrorOrchestrator, RegionFilterLimitsQueue) {
    MirrorRun fixture;
    fixture.config().regions = {"USA", "EU"};
    fixture.remote().add_page(kRoot, listing_page({
        "Game%20(USA).bin", "Game%20(Europe).bin", "Game%20(Japan).bin", "Untagged.bin"}));
    fixture.remote().add_file(kRoot + "Game%20(USA).bin", "us");
    fixture.remote().add_file(kRoot + "Game%20(Europe).bin", "eu");

    const auto summary = fixture.run();

    EXPECT_EQ(summary.queued, 2u);
    EXPECT_EQ(summary.filtered_out, 2u);
    EXPECT_EQ(summary.ok, 2u);
    EXPECT_TRUE(fs::exists(fixture.mirror_root() / "Game (USA).bin"));
    EXPECT_FALSE(fs::exists(fixture.mirror_root() / "Game (Japan).bin"));
}

TEST(MirrorOrchestrator, FailedTransferFailsRun) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"good.bin", "missing.bin"}));
    fixture.remote().add_file(kRoot + "good.bin", "ok");

    const auto summary = fixture.run();

    EXPECT_EQ(summary.ok, 1u);
    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].relative_path, "missing.bin");
    EXPECT_EQ(summary.failures[0].error.kind, ErrorKind::Transfer);
    EXPECT_EQ(summary.exit_code(0), mirror::orchestrator::kExitFailure);
}

TEST(MirrorOrchestrator, CrawlErrorsRespectTolerance) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"ok/", "broken/"}));
    fixture.remote().add_page(kRoot + "ok/", listing_page({"f.bin"}));
    fixture.remote().add_file(kRoot + "ok/f.bin", "f");

    const auto summary = fixture.run();

    EXPECT_EQ(summary.ok, 1u);
    ASSERT_EQ(summary.crawl_errors.size(), 1u);
    EXPECT_EQ(summary.directories, 3u);
    EXPECT_EQ(summary.exit_code(0), mirror::orchestrator::kExitFailure);
    EXPECT_EQ(summary.exit_code(1), mirror::orchestrator::kExitSuccess);
}

TEST(MirrorOrchestrator, ClosedLedgerIsFatal) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"a.bin", "b.bin", "c.bin"}));
    fixture.remote().add_file(kRoot + "a.bin", "a");
    fixture.remote().add_file(kRoot + "b.bin", "b");
    fixture.remote().add_file(kRoot + "c.bin", "c");
    fixture.ledger().close();

    const auto summary = fixture.run();

    ASSERT_TRUE(summary.stop_error.has_value());
    EXPECT_EQ(summary.stop_error->kind, ErrorKind::LedgerUnavailable);
    EXPECT_EQ(summary.exit_code(0), mirror::orchestrator::kExitFatalLedger);
    EXPECT_EQ(summary.ok, 0u);
    EXPECT_EQ(fixture.remote().total_streams(), 0u);
}

TEST(MirrorOrchestrator, InterruptedRunReportsCancellation) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"a.bin"}));
    fixture.remote().add_file(kRoot + "a.bin", "a");
    std::atomic<bool> interrupted{true};

    const auto summary = fixture.run(&interrupted);

    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.ok, 0u);
    EXPECT_EQ(summary.exit_code(0), mirror::orchestrator::kExitInterrupted);
    EXPECT_FALSE(fs::exists(fixture.mirror_root() / "a.bin"));
}

TEST(MirrorOrchestrator, EmitsRunLifecycleEvents) {
    MirrorRun fixture;
    fixture.remote().add_page(kRoot, listing_page({"a.bin"}));
    fixture.remote().add_file(kRoot + "a.bin", "a");

    bool started = false;
    mirror::events::CrawlCompletedEvent crawl{};
    mirror::events::RunFinishedEvent finished{};
    fixture.bus().subscribe<mirror::events::RunStartedEvent>(
        [&](const mirror::events::RunStartedEvent& e) { started = e.workers == 3; });
    fixture.bus().subscribe<mirror::events::CrawlCompletedEvent>(
        [&](const mirror::events::CrawlCompletedEvent& e) { crawl = e; });
    fixture.bus().subscribe<mirror::events::RunFinishedEvent>(
        [&](const mirror::events::RunFinishedEvent& e) { finished = e; });

    fixture.run();

    EXPECT_TRUE(started);
    EXPECT_EQ(crawl.files, 1u);
    EXPECT_EQ(crawl.directories, 1u);
    EXPECT_EQ(finished.processed, 1u);
    EXPECT_EQ(finished.total_bytes, 1u);
    EXPECT_TRUE(finished.success);
}

TEST(CountFiles, CountsWithoutTransferring) {
    FakeRemoteSource remote;
    remote.add_page(kRoot, listing_page({"a (USA).bin", "b (Japan).bin", "sub/"}));
    remote.add_page(kRoot + "sub/", listing_page({"c (USA).bin"}));

    MirrorConfig config;
    config.root_url = kRoot;
    config.regions = {"usa"};
    mirror::events::EventBus bus;

    const auto report = mirror::orchestrator::count_files(config, remote, bus);

    EXPECT_EQ(report.files, 2u);
    EXPECT_EQ(report.filtered_out, 1u);
    EXPECT_EQ(report.directories, 2u);
    EXPECT_TRUE(report.crawl_errors.empty());
    EXPECT_EQ(remote.total_streams(), 0u);
}
