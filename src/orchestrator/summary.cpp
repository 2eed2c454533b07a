#include "mirror/orchestrator/summary.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace mirror::orchestrator {

using json = nlohmann::json;

void RunSummary::add(const fetch::TransferOutcome& outcome) {
    switch (outcome.outcome) {
        case fetch::OutcomeKind::SkippedLedger:
            ++skipped_ledger;
            break;
        case fetch::OutcomeKind::SkippedDisk:
            ++skipped_disk;
            break;
        case fetch::OutcomeKind::Ok:
            ++ok;
            total_bytes += outcome.byte_size;
            break;
        case fetch::OutcomeKind::Failed:
            ++failed;
            failures.push_back(TaskFailure{
                outcome.entry.location,
                outcome.entry.relative_path,
                outcome.error.value_or(Error{ErrorKind::Io, "unknown error"})});
            break;
    }
}

int RunSummary::exit_code(std::size_t crawl_error_tolerance) const {
    if (stop_error && stop_error->is_fatal()) {
        return kExitFatalLedger;
    }
    if (cancelled) {
        return kExitInterrupted;
    }
    if (failed > 0 || stop_error || dropped > 0 || crawl_errors.size() > crawl_error_tolerance) {
        return kExitFailure;
    }
    return kExitSuccess;
}

json to_json(const RunSummary& summary, int exit_code) {
    json crawl_errors = json::array();
    for (const auto& failure : summary.crawl_errors) {
        crawl_errors.push_back({
            {"location", failure.location},
            {"kind", to_string(failure.error.kind)},
            {"message", failure.error.message}
        });
    }

    json failures = json::array();
    for (const auto& failure : summary.failures) {
        failures.push_back({
            {"location", failure.location},
            {"relative_path", failure.relative_path},
            {"kind", to_string(failure.error.kind)},
            {"message", failure.error.message}
        });
    }

    json result = {
        {"queued", summary.queued},
        {"filtered_out", summary.filtered_out},
        {"processed", summary.processed()},
        {"skipped_ledger", summary.skipped_ledger},
        {"skipped_disk", summary.skipped_disk},
        {"ok", summary.ok},
        {"failed", summary.failed},
        {"dropped", summary.dropped},
        {"directories", summary.directories},
        {"total_bytes", summary.total_bytes},
        {"elapsed_ms", summary.elapsed.count()},
        {"cancelled", summary.cancelled},
        {"crawl_errors", crawl_errors},
        {"failures", failures},
        {"exit_code", exit_code}
    };

    if (summary.stop_error) {
        result["stop_error"] = {
            {"kind", to_string(summary.stop_error->kind)},
            {"message", summary.stop_error->message},
            {"fatal", summary.stop_error->is_fatal()}
        };
    } else {
        result["stop_error"] = nullptr;
    }
    return result;
}

Result<void> write_summary_json(const std::filesystem::path& path, const RunSummary& summary, int exit_code) {
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Io, "cannot write summary to " + path.string());
    }
    output << to_json(summary, exit_code).dump(2) << '\n';
    if (!output) {
        return Err<void>(ErrorKind::Io, "write failed for " + path.string());
    }
    return Ok();
}

void log_summary(const RunSummary& summary) {
    spdlog::info("Summary: {} processed, {} transferred, {} skipped (ledger), {} skipped (disk), {} failed",
                 summary.processed(), summary.ok, summary.skipped_ledger, summary.skipped_disk, summary.failed);
    spdlog::info("Summary: {} bytes in {:.1f} s across {} directories",
                 summary.total_bytes, static_cast<double>(summary.elapsed.count()) / 1000.0, summary.directories);

    if (summary.filtered_out > 0) {
        spdlog::info("Summary: {} files excluded by region filter", summary.filtered_out);
    }
    if (summary.dropped > 0) {
        spdlog::warn("Summary: {} queued files were not processed", summary.dropped);
    }
    for (const auto& failure : summary.crawl_errors) {
        spdlog::warn("  crawl error: {} - {}", failure.location, failure.error.message);
    }
    for (const auto& failure : summary.failures) {
        spdlog::error("  failed: {} - {}", failure.relative_path, describe(failure.error));
    }
    if (summary.stop_error) {
        spdlog::error("Run stopped early: {}", describe(*summary.stop_error));
    }
    if (summary.cancelled) {
        spdlog::warn("Run interrupted");
    }
}

} // namespace mirror::orchestrator
