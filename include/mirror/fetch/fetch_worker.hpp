#pragma once

#include "mirror/crawl/types.hpp"
#include "mirror/fetch/materializer.hpp"
#include "mirror/fetch/task_state.hpp"
#include "mirror/fetch/types.hpp"

#include <filesystem>

namespace mirror::events {
class EventBus;
}

namespace mirror::ledger {
class Ledger;
}

namespace mirror::net {
class RemoteSource;
}

namespace mirror::fetch {

struct WorkerSettings {
    std::filesystem::path destination_root;
    bool fail_on_corrupt_archive = true;
};

/**
 * @brief Runs one task through ledger check, disk check, transfer, materialize and record
 *
 * Stateless between tasks; one instance is shared by all pool threads.
 * Every call to process() emits exactly one TaskFinishedEvent.
 */
class FetchWorker {
public:
    FetchWorker(net::RemoteSource& remote,
                ledger::Ledger& ledger,
                WorkerSettings settings,
                events::EventBus* bus = nullptr);

    TransferOutcome process(const crawl::FileEntry& entry) const;

    /// Local destination of @p entry below the mirror root.
    [[nodiscard]] std::filesystem::path local_path_for(const crawl::FileEntry& entry) const;

private:
    enum class LedgerDecision {
        Skip,
        Proceed
    };

    Result<LedgerDecision> consult_ledger(const crawl::FileEntry& entry,
                                          const std::filesystem::path& local_path) const;

    void resume_extraction(TaskLifecycle& lifecycle, TransferOutcome& outcome) const;
    void transfer(TaskLifecycle& lifecycle, TransferOutcome& outcome) const;
    void record(TaskLifecycle& lifecycle, TransferOutcome& outcome) const;

    /// Apply the archive policy after a placed file failed to unpack.
    void handle_corrupt_archive(TaskLifecycle& lifecycle, TransferOutcome& outcome, Error error) const;

    void advance(TaskLifecycle& lifecycle, TaskState next) const;
    void fail(TaskLifecycle& lifecycle, TransferOutcome& outcome, Error error) const;
    TransferOutcome finish(TransferOutcome outcome) const;

    net::RemoteSource& remote_;
    ledger::Ledger& ledger_;
    WorkerSettings settings_;
    events::EventBus* bus_ = nullptr;
    Materializer materializer_;
};

} // namespace mirror::fetch
