#pragma once

#include "mirror/core/result.hpp"
#include "mirror/crawl/types.hpp"
#include "mirror/fetch/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mirror::orchestrator {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitConfigError = 2;
inline constexpr int kExitFatalLedger = 3;
inline constexpr int kExitInterrupted = 130;

struct TaskFailure {
    std::string location;
    std::string relative_path;
    Error error;
};

/**
 * @brief Aggregate of every TransferOutcome of one run
 */
struct RunSummary {
    std::size_t queued = 0;             ///< Leaf entries handed to the pool
    std::size_t filtered_out = 0;       ///< Entries rejected by the region filter
    std::size_t skipped_ledger = 0;
    std::size_t skipped_disk = 0;
    std::size_t ok = 0;
    std::size_t failed = 0;
    std::size_t dropped = 0;            ///< Queued but never processed because the run stopped
    std::size_t directories = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};

    std::vector<crawl::CrawlFailure> crawl_errors;
    std::vector<TaskFailure> failures;
    std::optional<Error> stop_error;    ///< Why the pool stopped early
    bool cancelled = false;

    void add(const fetch::TransferOutcome& outcome);

    [[nodiscard]] std::size_t processed() const noexcept {
        return skipped_ledger + skipped_disk + ok + failed;
    }

    /**
     * @brief Process exit status for this run
     *
     * kExitFatalLedger for a fatal ledger error, kExitInterrupted after a
     * signal, kExitFailure for task failures, an early stop or more crawl
     * errors than @p crawl_error_tolerance, kExitSuccess otherwise.
     */
    [[nodiscard]] int exit_code(std::size_t crawl_error_tolerance) const;
};

nlohmann::json to_json(const RunSummary& summary, int exit_code);

Result<void> write_summary_json(const std::filesystem::path& path, const RunSummary& summary, int exit_code);

/// One spdlog block: counts, bytes, elapsed time, then each failure.
void log_summary(const RunSummary& summary);

} // namespace mirror::orchestrator
