#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"
#include "mirror/fetch/fetch_worker.hpp"
#include "mirror/ledger/ledger.hpp"

#include "support/fake_remote_source.hpp"
#include "support/temp_dir.hpp"
#include "support/zip_writer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace fs = std::filesystem;

using mirror::ErrorKind;
using mirror::crawl::FileEntry;
using mirror::fetch::FetchWorker;
using mirror::fetch::OutcomeKind;
using mirror::fetch::WorkerSettings;
using mirror::ledger::Ledger;
using mirror::test_support::FakeRemoteSource;
using mirror::test_support::TempDir;
using mirror::test_support::make_zip;
using mirror::test_support::read_file;
using mirror::test_support::write_file;

namespace {

const std::string kRoot = "https://mirror.test/files/";

FileEntry entry_for(const std::string& relative_path) {
    return FileEntry{kRoot + relative_path, relative_path, false};
}

std::string error_of(const mirror::fetch::TransferOutcome& outcome) {
    return outcome.error ? mirror::describe(*outcome.error) : "no error";
}

class WorkerFixture {
public:
    WorkerFixture() {
        auto opened = Ledger::open(dir_ / "downloads.db");
        if (opened.is_error()) {
            throw std::runtime_error(opened.error().message);
        }
        ledger_ = std::move(opened.value());
    }

    FetchWorker worker(bool fail_on_corrupt_archive = true) {
        return FetchWorker(remote_, *ledger_, WorkerSettings{mirror_root(), fail_on_corrupt_archive}, &bus_);
    }

    fs::path mirror_root() const { return dir_ / "mirror"; }

    FakeRemoteSource& remote() { return remote_; }
    Ledger& ledger() { return *ledger_; }
    mirror::events::EventBus& bus() { return bus_; }

private:
    TempDir dir_;
    FakeRemoteSource remote_;
    std::unique_ptr<Ledger> ledger_;
    mirror::events::EventBus bus_;
};

} // namespace

TEST(FetchWorker, TransfersAndRecordsNewFile) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "dir/a.bin", "payload bytes");

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("dir/a.bin"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Ok) << error_of(outcome);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.byte_size, 13u);
    EXPECT_EQ(read_file(fx.mirror_root() / "dir/a.bin"), "payload bytes");

    auto record = fx.ledger().find(kRoot + "dir/a.bin");
    ASSERT_TRUE(record.is_ok());
    ASSERT_TRUE(record.value().has_value());
    EXPECT_EQ(record.value()->relative_path, "dir/a.bin");
    EXPECT_EQ(record.value()->local_path, outcome.local_path);
    EXPECT_EQ(record.value()->byte_size, 13u);
}

TEST(FetchWorker, SkipsLedgerRecordedFile) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "a.bin", "content");
    auto worker = fx.worker();

    ASSERT_EQ(worker.process(entry_for("a.bin")).outcome, OutcomeKind::Ok);
    const auto second = worker.process(entry_for("a.bin"));

    EXPECT_EQ(second.outcome, OutcomeKind::SkippedLedger);
    EXPECT_EQ(fx.remote().total_streams(), 1u);
}

TEST(FetchWorker, ExistingFileIsSkippedUntilDeleted) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "a.bin", "fresh");
    write_file(fx.mirror_root() / "a.bin", "already here");
    auto worker = fx.worker();

    const auto skipped = worker.process(entry_for("a.bin"));
    EXPECT_EQ(skipped.outcome, OutcomeKind::SkippedDisk);
    EXPECT_EQ(fx.remote().total_streams(), 0u);
    EXPECT_EQ(read_file(fx.mirror_root() / "a.bin"), "already here");
    EXPECT_FALSE(fx.ledger().contains(kRoot + "a.bin").value());

    fs::remove(fx.mirror_root() / "a.bin");
    const auto fetched = worker.process(entry_for("a.bin"));
    EXPECT_EQ(fetched.outcome, OutcomeKind::Ok);
    EXPECT_EQ(read_file(fx.mirror_root() / "a.bin"), "fresh");
    EXPECT_TRUE(fx.ledger().contains(kRoot + "a.bin").value());
}

TEST(FetchWorker, StaleLedgerRecordIsFetchedAgain) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "a.bin", "content");
    auto worker = fx.worker();

    ASSERT_EQ(worker.process(entry_for("a.bin")).outcome, OutcomeKind::Ok);
    fs::remove(fx.mirror_root() / "a.bin");

    const auto again = worker.process(entry_for("a.bin"));
    EXPECT_EQ(again.outcome, OutcomeKind::Ok);
    EXPECT_EQ(fx.remote().total_streams(), 2u);
    EXPECT_TRUE(fs::exists(fx.mirror_root() / "a.bin"));
    EXPECT_EQ(fx.ledger().size().value(), 1u);
}

TEST(FetchWorker, ExtractsArchiveAndRecordsIt) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "set/b.zip", make_zip({{"b.txt", "inner"}}));

    mirror::events::ArchiveExtractedEvent extracted;
    fx.bus().subscribe<mirror::events::ArchiveExtractedEvent>(
        [&](const mirror::events::ArchiveExtractedEvent& e) { extracted = e; });

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("set/b.zip"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Ok) << error_of(outcome);
    EXPECT_EQ(outcome.extracted_entries, 1u);
    EXPECT_FALSE(fs::exists(fx.mirror_root() / "set/b.zip"));
    EXPECT_EQ(read_file(fx.mirror_root() / "set/b.txt"), "inner");
    EXPECT_TRUE(fx.ledger().contains(kRoot + "set/b.zip").value());
    EXPECT_EQ(extracted.entries, 1u);
    EXPECT_FALSE(extracted.resumed);

    // The archive is gone from disk but the ledger still vouches for it
    EXPECT_EQ(worker.process(entry_for("set/b.zip")).outcome, OutcomeKind::SkippedLedger);
    EXPECT_EQ(fx.remote().total_streams(), 1u);
}

TEST(FetchWorker, ResumesArchiveLeftOnDisk) {
    WorkerFixture fx;
    write_file(fx.mirror_root() / "left.zip", make_zip({{"left.txt", "resumed"}}));

    bool resumed = false;
    fx.bus().subscribe<mirror::events::ArchiveExtractedEvent>(
        [&](const mirror::events::ArchiveExtractedEvent& e) { resumed = e.resumed; });

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("left.zip"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Ok) << error_of(outcome);
    EXPECT_TRUE(resumed);
    EXPECT_EQ(fx.remote().total_streams(), 0u);
    EXPECT_FALSE(fs::exists(fx.mirror_root() / "left.zip"));
    EXPECT_EQ(read_file(fx.mirror_root() / "left.txt"), "resumed");
    EXPECT_TRUE(fx.ledger().contains(kRoot + "left.zip").value());
}

TEST(FetchWorker, CorruptArchiveIsNotRecorded) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "bad.zip", "definitely not a zip file");

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("bad.zip"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::CorruptArchive);
    EXPECT_TRUE(fs::exists(fx.mirror_root() / "bad.zip"));
    EXPECT_FALSE(fx.ledger().contains(kRoot + "bad.zip").value());
}

TEST(FetchWorker, CorruptArchiveKeptWhenPolicyAllows) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "bad.zip", "definitely not a zip file");

    auto worker = fx.worker(false);
    const auto outcome = worker.process(entry_for("bad.zip"));

    EXPECT_EQ(outcome.outcome, OutcomeKind::Ok);
    EXPECT_TRUE(fs::exists(fx.mirror_root() / "bad.zip"));
    EXPECT_TRUE(fx.ledger().contains(kRoot + "bad.zip").value());
}

TEST(FetchWorker, TransferFailureLeavesNoTrace) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "cut.bin", std::string(100, 'c'));
    fx.remote().fail_midway(kRoot + "cut.bin", 30);

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("cut.bin"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Failed);
    EXPECT_EQ(outcome.error->kind, ErrorKind::Transfer);
    EXPECT_FALSE(fs::exists(fx.mirror_root() / "cut.bin"));
    EXPECT_FALSE(fs::exists(fx.mirror_root() / "cut.bin.part"));
    EXPECT_FALSE(fx.ledger().contains(kRoot + "cut.bin").value());

    const auto missing = worker.process(entry_for("missing.bin"));
    ASSERT_EQ(missing.outcome, OutcomeKind::Failed);
    EXPECT_NE(missing.error->message.find("404"), std::string::npos);
}

TEST(FetchWorker, DirectoryEntryIsRejected) {
    WorkerFixture fx;
    auto worker = fx.worker();

    const auto outcome = worker.process(FileEntry{kRoot + "sub/", "sub", true});
    ASSERT_EQ(outcome.outcome, OutcomeKind::Failed);
    EXPECT_EQ(outcome.error->kind, ErrorKind::InvalidArgument);
}

TEST(FetchWorker, ClosedLedgerIsFatal) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "a.bin", "content");
    fx.ledger().close();

    auto worker = fx.worker();
    const auto outcome = worker.process(entry_for("a.bin"));

    ASSERT_EQ(outcome.outcome, OutcomeKind::Failed);
    EXPECT_EQ(outcome.error->kind, ErrorKind::LedgerUnavailable);
    EXPECT_TRUE(outcome.error->is_fatal());
    EXPECT_EQ(fx.remote().total_streams(), 0u);
}

TEST(FetchWorker, EmitsOneFinishedEventPerTask) {
    WorkerFixture fx;
    fx.remote().add_file(kRoot + "a.bin", "content");

    std::vector<OutcomeKind> finished;
    fx.bus().subscribe<mirror::events::TaskFinishedEvent>(
        [&](const mirror::events::TaskFinishedEvent& e) { finished.push_back(e.outcome.outcome); });

    auto worker = fx.worker();
    worker.process(entry_for("a.bin"));
    worker.process(entry_for("a.bin"));
    worker.process(entry_for("gone.bin"));

    EXPECT_EQ(finished, (std::vector<OutcomeKind>{OutcomeKind::Ok, OutcomeKind::SkippedLedger, OutcomeKind::Failed}));
}

TEST(FetchWorker, LocalPathIsBelowMirrorRoot) {
    WorkerFixture fx;
    auto worker = fx.worker();
    const auto path = worker.local_path_for(entry_for("a/b/c.bin"));
    EXPECT_EQ(path.string(), (fs::absolute(fx.mirror_root()) / "a/b/c.bin").lexically_normal().string());
}
