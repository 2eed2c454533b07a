#include "mirror/ledger/ledger.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <ctime>
#include <mutex>
#include <set>

namespace mirror::ledger {
namespace {

constexpr int kBusyTimeoutMs = 5000;

// Owns one prepared statement for the duration of a call
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind_text(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    void bind_int64(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    int step() { return sqlite3_step(stmt_); }

    std::string column_text(int index) const {
        const auto* text = sqlite3_column_text(stmt_, index);
        return text != nullptr ? reinterpret_cast<const char*>(text) : std::string();
    }
    std::int64_t column_int64(int index) const {
        return sqlite3_column_int64(stmt_, index);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

std::string sqlite_message(sqlite3* db) {
    return db != nullptr ? sqlite3_errmsg(db) : "no database handle";
}

std::string format_utc(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &utc);
    return buffer;
}

// Rolls back an open transaction unless commit() succeeded
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}
    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    int begin() {
        const int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
        active_ = rc == SQLITE_OK;
        return rc;
    }

    int commit() {
        const int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) {
            active_ = false;
        }
        return rc;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

} // namespace

const char* to_string(RecordStatus status) {
    switch (status) {
        case RecordStatus::Completed: return "completed";
        case RecordStatus::Failed: return "failed";
    }
    return "unknown";
}

Result<std::unique_ptr<Ledger>> Ledger::open(const std::filesystem::path& path) {
    if (path.empty()) {
        return Err<std::unique_ptr<Ledger>>(ErrorKind::LedgerUnavailable, "ledger path is empty");
    }

    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Err<std::unique_ptr<Ledger>>(ErrorKind::LedgerUnavailable,
                "cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "cannot open " + path.string() + ": " + sqlite_message(db);
        sqlite3_close(db);
        return Err<std::unique_ptr<Ledger>>(ErrorKind::LedgerUnavailable, std::move(message));
    }

    std::unique_ptr<Ledger> ledger(new Ledger(db, path));
    if (auto res = ledger->initialize_schema(); res.is_error()) {
        return Err<std::unique_ptr<Ledger>>(res.error());
    }

    spdlog::debug("Ledger opened at {}", path.string());
    return Ok(std::move(ledger));
}

Ledger::Ledger(sqlite3* db, std::filesystem::path path)
    : db_(db), path_(std::move(path)) {}

Ledger::~Ledger() {
    close();
}

void Ledger::close() {
    std::unique_lock lock(mutex_);
    if (db_ == nullptr) {
        return;
    }
    if (sqlite3_close(db_) != SQLITE_OK) {
        spdlog::warn("Ledger {} did not close cleanly: {}", path_.string(), sqlite_message(db_));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}

Result<void> Ledger::initialize_schema() {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    if (auto res = execute("PRAGMA journal_mode=WAL"); res.is_error()) {
        return res;
    }
    if (auto res = execute("PRAGMA synchronous=FULL"); res.is_error()) {
        return res;
    }

    auto created = execute(
        "CREATE TABLE IF NOT EXISTS downloads ("
        " location TEXT PRIMARY KEY,"
        " relative_path TEXT,"
        " local_path TEXT,"
        " completed_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
        " byte_size INTEGER,"
        " status TEXT DEFAULT 'completed')");
    if (created.is_error()) {
        return created;
    }

    std::set<std::string> columns;
    {
        Statement info(db_, "PRAGMA table_info(downloads)");
        if (!info.ok()) {
            return Err<void>(ErrorKind::LedgerUnavailable, "cannot inspect schema: " + sqlite_message(db_));
        }
        while (info.step() == SQLITE_ROW) {
            columns.insert(info.column_text(1));
        }
    }

    if (columns.count("location") == 0) {
        return Err<void>(ErrorKind::LedgerUnavailable,
            "table 'downloads' in " + path_.string() + " has no 'location' column");
    }

    // Older databases predate some columns
    static const std::pair<const char*, const char*> migrations[] = {
        {"relative_path", "ALTER TABLE downloads ADD COLUMN relative_path TEXT"},
        {"local_path", "ALTER TABLE downloads ADD COLUMN local_path TEXT"},
        {"completed_at", "ALTER TABLE downloads ADD COLUMN completed_at TIMESTAMP"},
        {"byte_size", "ALTER TABLE downloads ADD COLUMN byte_size INTEGER"},
        {"status", "ALTER TABLE downloads ADD COLUMN status TEXT DEFAULT 'completed'"},
    };
    for (const auto& [column, sql] : migrations) {
        if (columns.count(column) != 0) {
            continue;
        }
        spdlog::info("Migrating ledger {}: adding column '{}'", path_.string(), column);
        if (auto res = execute(sql); res.is_error()) {
            return res;
        }
    }

    return Ok();
}

Result<void> Ledger::execute(const char* sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string text = message != nullptr ? message : sqlite_message(db_);
        sqlite3_free(message);
        return Err<void>(ErrorKind::LedgerUnavailable, std::string(sql) + ": " + text);
    }
    return Ok();
}

Result<void> Ledger::unavailable_if_closed() const {
    if (db_ == nullptr) {
        return Err<void>(ErrorKind::LedgerUnavailable, "ledger " + path_.string() + " is closed");
    }
    return Ok();
}

Result<bool> Ledger::contains(const std::string& location) const {
    std::shared_lock lock(mutex_);
    if (auto res = unavailable_if_closed(); res.is_error()) {
        return Err<bool>(res.error());
    }

    Statement query(db_, "SELECT 1 FROM downloads WHERE location = ?1 LIMIT 1");
    if (!query.ok()) {
        return Err<bool>(ErrorKind::LedgerUnavailable, "lookup failed: " + sqlite_message(db_));
    }
    query.bind_text(1, location);

    const int rc = query.step();
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(ErrorKind::LedgerUnavailable, "lookup failed: " + sqlite_message(db_));
}

Result<std::optional<LedgerRecord>> Ledger::find(const std::string& location) const {
    std::shared_lock lock(mutex_);
    if (auto res = unavailable_if_closed(); res.is_error()) {
        return Err<std::optional<LedgerRecord>>(res.error());
    }
    return find_locked(location);
}

Result<std::optional<LedgerRecord>> Ledger::find_locked(const std::string& location) const {
    Statement query(db_,
        "SELECT location, relative_path, local_path,"
        " CAST(strftime('%s', completed_at) AS INTEGER), byte_size, status"
        " FROM downloads WHERE location = ?1");
    if (!query.ok()) {
        return Err<std::optional<LedgerRecord>>(ErrorKind::LedgerUnavailable,
            "lookup failed: " + sqlite_message(db_));
    }
    query.bind_text(1, location);

    const int rc = query.step();
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<LedgerRecord>());
    }
    if (rc != SQLITE_ROW) {
        return Err<std::optional<LedgerRecord>>(ErrorKind::LedgerUnavailable,
            "lookup failed: " + sqlite_message(db_));
    }

    LedgerRecord record;
    record.location = query.column_text(0);
    record.relative_path = query.column_text(1);
    record.local_path = query.column_text(2);
    record.completed_at = std::chrono::system_clock::from_time_t(
        static_cast<std::time_t>(query.column_int64(3)));
    record.byte_size = static_cast<std::uint64_t>(query.column_int64(4));
    record.status = query.column_text(5) == "failed" ? RecordStatus::Failed : RecordStatus::Completed;
    return Ok(std::optional<LedgerRecord>(std::move(record)));
}

Result<void> Ledger::record(const LedgerRecord& record) {
    if (record.location.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "ledger record has no location");
    }
    if (record.status != RecordStatus::Completed) {
        return Err<void>(ErrorKind::InvalidArgument, "only completed transfers are recorded");
    }

    std::unique_lock lock(mutex_);
    if (auto res = unavailable_if_closed(); res.is_error()) {
        return res;
    }

    Transaction txn(db_);
    if (txn.begin() != SQLITE_OK) {
        return Err<void>(ErrorKind::LedgerUnavailable, "cannot begin transaction: " + sqlite_message(db_));
    }

    auto existing = find_locked(record.location);
    if (existing.is_error()) {
        return Err<void>(existing.error());
    }
    if (existing.value()) {
        const auto& previous = *existing.value();
        if (previous.local_path == record.local_path) {
            return Err<void>(ErrorKind::LedgerDuplicate, record.location + " is already recorded");
        }
        return Err<void>(ErrorKind::LedgerConflict,
            record.location + " is recorded at " + previous.local_path + ", not " + record.local_path);
    }

    Statement insert(db_,
        "INSERT INTO downloads (location, relative_path, local_path, completed_at, byte_size, status)"
        " VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    if (!insert.ok()) {
        return Err<void>(ErrorKind::LedgerUnavailable, "cannot prepare insert: " + sqlite_message(db_));
    }

    const auto completed_at = record.completed_at == std::chrono::system_clock::time_point{}
        ? std::chrono::system_clock::now()
        : record.completed_at;

    insert.bind_text(1, record.location);
    insert.bind_text(2, record.relative_path);
    insert.bind_text(3, record.local_path);
    insert.bind_text(4, format_utc(completed_at));
    insert.bind_int64(5, static_cast<std::int64_t>(record.byte_size));
    insert.bind_text(6, to_string(record.status));

    if (insert.step() != SQLITE_DONE) {
        return Err<void>(ErrorKind::LedgerUnavailable, "insert failed: " + sqlite_message(db_));
    }
    if (txn.commit() != SQLITE_OK) {
        return Err<void>(ErrorKind::LedgerUnavailable, "commit failed: " + sqlite_message(db_));
    }
    return Ok();
}

Result<bool> Ledger::remove(const std::string& location) {
    std::unique_lock lock(mutex_);
    if (auto res = unavailable_if_closed(); res.is_error()) {
        return Err<bool>(res.error());
    }

    Statement erase(db_, "DELETE FROM downloads WHERE location = ?1");
    if (!erase.ok()) {
        return Err<bool>(ErrorKind::LedgerUnavailable, "cannot prepare delete: " + sqlite_message(db_));
    }
    erase.bind_text(1, location);
    if (erase.step() != SQLITE_DONE) {
        return Err<bool>(ErrorKind::LedgerUnavailable, "delete failed: " + sqlite_message(db_));
    }
    return Ok(sqlite3_changes(db_) > 0);
}

Result<std::size_t> Ledger::size() const {
    std::shared_lock lock(mutex_);
    if (auto res = unavailable_if_closed(); res.is_error()) {
        return Err<std::size_t>(res.error());
    }

    Statement count(db_, "SELECT COUNT(*) FROM downloads");
    if (!count.ok() || count.step() != SQLITE_ROW) {
        return Err<std::size_t>(ErrorKind::LedgerUnavailable, "count failed: " + sqlite_message(db_));
    }
    return Ok(static_cast<std::size_t>(count.column_int64(0)));
}

} // namespace mirror::ledger
