#include "mirror/fetch/fetch_worker.hpp"

#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"
#include "mirror/ledger/ledger.hpp"
#include "mirror/net/remote_source.hpp"

#include <spdlog/spdlog.h>

namespace mirror::fetch {
namespace fs = std::filesystem;

FetchWorker::FetchWorker(net::RemoteSource& remote,
                         ledger::Ledger& ledger,
                         WorkerSettings settings,
                         events::EventBus* bus)
    : remote_(remote),
      ledger_(ledger),
      settings_(std::move(settings)),
      bus_(bus) {
    std::error_code ec;
    auto absolute = fs::absolute(settings_.destination_root, ec);
    if (!ec) {
        settings_.destination_root = absolute.lexically_normal();
    }
}

fs::path FetchWorker::local_path_for(const crawl::FileEntry& entry) const {
    return settings_.destination_root / fs::path(entry.relative_path);
}

TransferOutcome FetchWorker::process(const crawl::FileEntry& entry) const {
    TaskLifecycle lifecycle(entry.location);
    TransferOutcome outcome;
    outcome.entry = entry;
    outcome.local_path = local_path_for(entry).string();

    if (entry.is_directory) {
        fail(lifecycle, outcome, Error{ErrorKind::InvalidArgument, "directories are not transfer tasks"});
        return finish(std::move(outcome));
    }

    auto decision = consult_ledger(entry, outcome.local_path);
    if (decision.is_error()) {
        fail(lifecycle, outcome, decision.error());
        return finish(std::move(outcome));
    }
    if (decision.value() == LedgerDecision::Skip) {
        advance(lifecycle, TaskState::SkippedLedger);
        outcome.outcome = OutcomeKind::SkippedLedger;
        return finish(std::move(outcome));
    }

    std::error_code ec;
    if (fs::exists(outcome.local_path, ec)) {
        if (detect_archive_format(entry.relative_path) != ArchiveFormat::None &&
            fs::is_regular_file(outcome.local_path, ec)) {
            resume_extraction(lifecycle, outcome);
        } else {
            advance(lifecycle, TaskState::SkippedDisk);
            outcome.outcome = OutcomeKind::SkippedDisk;
        }
        return finish(std::move(outcome));
    }

    transfer(lifecycle, outcome);
    return finish(std::move(outcome));
}

Result<FetchWorker::LedgerDecision> FetchWorker::consult_ledger(const crawl::FileEntry& entry,
                                                               const fs::path& local_path) const {
    auto found = ledger_.find(entry.location);
    if (found.is_error()) {
        return Err<LedgerDecision>(found.error());
    }
    if (!found.value()) {
        return Ok(LedgerDecision::Proceed);
    }

    const auto& existing = *found.value();
    const fs::path recorded_path = existing.local_path.empty() ? local_path : fs::path(existing.local_path);

    // Archives are deleted after extraction, so their absence proves nothing
    std::error_code ec;
    if (fs::exists(recorded_path, ec) || detect_archive_format(entry.relative_path) != ArchiveFormat::None) {
        return Ok(LedgerDecision::Skip);
    }

    spdlog::warn("Ledger record for {} points at missing file {}, fetching again",
                 entry.relative_path, recorded_path.string());
    auto removed = ledger_.remove(entry.location);
    if (removed.is_error()) {
        return Err<LedgerDecision>(removed.error());
    }
    return Ok(LedgerDecision::Proceed);
}

void FetchWorker::resume_extraction(TaskLifecycle& lifecycle, TransferOutcome& outcome) const {
    advance(lifecycle, TaskState::Materializing);

    std::error_code ec;
    const auto archive_size = fs::file_size(outcome.local_path, ec);
    outcome.byte_size = ec ? 0 : archive_size;

    auto extracted = materializer_.extract_and_replace(outcome.local_path);
    if (extracted.is_error()) {
        if (extracted.error().kind == ErrorKind::CorruptArchive) {
            handle_corrupt_archive(lifecycle, outcome, extracted.error());
        } else {
            fail(lifecycle, outcome, extracted.error());
        }
        return;
    }

    outcome.extracted_entries = extracted.value().files.size();
    if (bus_ != nullptr) {
        bus_->emit(events::ArchiveExtractedEvent{outcome.local_path, outcome.extracted_entries, true});
    }
    record(lifecycle, outcome);
}

void FetchWorker::transfer(TaskLifecycle& lifecycle, TransferOutcome& outcome) const {
    advance(lifecycle, TaskState::Fetching);

    const std::string location = outcome.entry.location;
    ByteStream stream = [this, location](const ChunkSink& sink) {
        return remote_.stream(location, sink);
    };

    auto placed = materializer_.place(stream, outcome.local_path);
    if (placed.is_error()) {
        fail(lifecycle, outcome, placed.error());
        return;
    }
    outcome.byte_size = placed.value();

    advance(lifecycle, TaskState::Materializing);
    if (detect_archive_format(outcome.entry.relative_path) != ArchiveFormat::None) {
        auto extracted = materializer_.extract_and_replace(outcome.local_path);
        if (extracted.is_error()) {
            if (extracted.error().kind == ErrorKind::CorruptArchive) {
                handle_corrupt_archive(lifecycle, outcome, extracted.error());
            } else {
                fail(lifecycle, outcome, extracted.error());
            }
            return;
        }
        outcome.extracted_entries = extracted.value().files.size();
        if (bus_ != nullptr) {
            bus_->emit(events::ArchiveExtractedEvent{outcome.local_path, outcome.extracted_entries, false});
        }
    }

    record(lifecycle, outcome);
}

void FetchWorker::handle_corrupt_archive(TaskLifecycle& lifecycle, TransferOutcome& outcome, Error error) const {
    if (settings_.fail_on_corrupt_archive) {
        fail(lifecycle, outcome, std::move(error));
        return;
    }
    spdlog::warn("Keeping unreadable archive {}: {}", outcome.local_path, error.message);
    record(lifecycle, outcome);
}

void FetchWorker::record(TaskLifecycle& lifecycle, TransferOutcome& outcome) const {
    ledger::LedgerRecord entry;
    entry.location = outcome.entry.location;
    entry.relative_path = outcome.entry.relative_path;
    entry.local_path = outcome.local_path;
    entry.completed_at = std::chrono::system_clock::now();
    entry.byte_size = outcome.byte_size;
    entry.status = ledger::RecordStatus::Completed;

    auto recorded = ledger_.record(entry);
    if (recorded.is_error() && recorded.error().kind != ErrorKind::LedgerDuplicate) {
        fail(lifecycle, outcome, recorded.error());
        return;
    }
    if (recorded.is_error()) {
        // Another writer recorded the same file at the same path
        spdlog::debug("{}", recorded.error().message);
    }

    advance(lifecycle, TaskState::Recorded);
    outcome.outcome = OutcomeKind::Ok;
    outcome.error.reset();
}

void FetchWorker::advance(TaskLifecycle& lifecycle, TaskState next) const {
    if (auto res = lifecycle.transition_to(next); res.is_error()) {
        spdlog::error("{}", res.error().message);
    }
}

void FetchWorker::fail(TaskLifecycle& lifecycle, TransferOutcome& outcome, Error error) const {
    if (auto res = lifecycle.mark_failed(error.message); res.is_error()) {
        spdlog::error("{}", res.error().message);
    }
    outcome.outcome = OutcomeKind::Failed;
    outcome.error = std::move(error);
}

TransferOutcome FetchWorker::finish(TransferOutcome outcome) const {
    if (bus_ != nullptr) {
        bus_->emit(events::TaskFinishedEvent{outcome});
    }
    return outcome;
}

} // namespace mirror::fetch
