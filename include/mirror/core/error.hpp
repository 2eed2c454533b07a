#pragma once

#include <string>

namespace mirror {

/**
 * @brief Failure categories shared by every module
 *
 * Task-scoped kinds (Transfer, CorruptArchive, Io, Cancelled) end a single task.
 * LedgerConflict and LedgerUnavailable are fatal to the whole run.
 */
enum class ErrorKind {
    Crawl,
    Transfer,
    CorruptArchive,
    LedgerConflict,
    LedgerDuplicate,
    LedgerUnavailable,
    Io,
    Cancelled,
    Config,
    InvalidArgument
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool is_fatal() const noexcept {
        return kind == ErrorKind::LedgerConflict || kind == ErrorKind::LedgerUnavailable;
    }
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Crawl: return "crawl";
        case ErrorKind::Transfer: return "transfer";
        case ErrorKind::CorruptArchive: return "corrupt-archive";
        case ErrorKind::LedgerConflict: return "ledger-conflict";
        case ErrorKind::LedgerDuplicate: return "ledger-duplicate";
        case ErrorKind::LedgerUnavailable: return "ledger-unavailable";
        case ErrorKind::Io: return "io";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Config: return "config";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace mirror
