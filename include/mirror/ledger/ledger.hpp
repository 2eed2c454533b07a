#pragma once

/**
 * @file ledger.hpp
 * @brief Durable record of completed transfers, keyed by source location
 *
 * WHY THIS FILE EXISTS:
 * A mirror run must not transfer the same remote file twice, across runs and
 * across crashes. The ledger is the single source of truth for "already done".
 *
 * STORAGE:
 * One SQLite database, table `downloads`:
 *   location TEXT PRIMARY KEY, relative_path, local_path, completed_at,
 *   byte_size, status
 * Every record() is its own IMMEDIATE transaction with synchronous=FULL, so a
 * record either exists completely after a crash or not at all.
 *
 * THREAD SAFETY PATTERN:
 * - contains(), find(), size(): shared_lock (concurrent readers)
 * - record(), remove(), close(): unique_lock (one writer at a time)
 *
 * EXAMPLE USAGE:
 * auto opened = Ledger::open("downloads.db");
 * if (opened.is_error()) { ... }
 * auto& ledger = *opened.value();
 * if (!ledger.contains(url).value()) {
 *     ledger.record(LedgerRecord{url, "dir/a.bin", "/mirror/dir/a.bin", ...});
 * }
 */

#include "mirror/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

struct sqlite3;

namespace mirror::ledger {

enum class RecordStatus {
    Completed,
    Failed
};

const char* to_string(RecordStatus status);

struct LedgerRecord {
    std::string location;                               ///< Primary key
    std::string relative_path;
    std::string local_path;                             ///< Absolute path on disk
    std::chrono::system_clock::time_point completed_at{};
    std::uint64_t byte_size = 0;
    RecordStatus status = RecordStatus::Completed;
};

class Ledger {
public:
    /**
     * @brief Open (creating if needed) the ledger database at @p path
     *
     * Creates the `downloads` table and adds columns missing from databases
     * written by older versions.
     *
     * ERRORS: LedgerUnavailable when the database cannot be opened or migrated
     */
    static Result<std::unique_ptr<Ledger>> open(const std::filesystem::path& path);

    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    Result<bool> contains(const std::string& location) const;

    Result<std::optional<LedgerRecord>> find(const std::string& location) const;

    /**
     * @brief Append a completed record
     *
     * Insert-only: an existing row is never replaced.
     * ERRORS:
     * - LedgerDuplicate: same location already recorded with the same local path
     * - LedgerConflict: same location already recorded with a different local path
     * - InvalidArgument: record status is not Completed
     * - LedgerUnavailable: the write itself failed
     */
    Result<void> record(const LedgerRecord& record);

    /// Delete the record for @p location. Returns whether a row was removed.
    Result<bool> remove(const std::string& location);

    Result<std::size_t> size() const;

    /// Flush and release the database. Further calls report LedgerUnavailable.
    void close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Ledger(sqlite3* db, std::filesystem::path path);

    Result<void> initialize_schema();
    Result<std::optional<LedgerRecord>> find_locked(const std::string& location) const;
    Result<void> execute(const char* sql);
    Result<void> unavailable_if_closed() const;

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
};

} // namespace mirror::ledger
