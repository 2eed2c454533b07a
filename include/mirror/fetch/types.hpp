#pragma once

#include "mirror/core/error.hpp"
#include "mirror/crawl/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mirror::fetch {

enum class OutcomeKind {
    SkippedLedger,
    SkippedDisk,
    Ok,
    Failed
};

inline const char* to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SkippedLedger: return "skipped-ledger";
        case OutcomeKind::SkippedDisk: return "skipped-disk";
        case OutcomeKind::Ok: return "ok";
        case OutcomeKind::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief Terminal result of one task, produced by a worker for the orchestrator
 */
struct TransferOutcome {
    crawl::FileEntry entry;
    OutcomeKind outcome = OutcomeKind::Failed;
    std::optional<Error> error;     ///< Present iff outcome == Failed
    std::uint64_t byte_size = 0;    ///< Bytes written for Ok outcomes
    std::string local_path;
    std::size_t extracted_entries = 0;
};

} // namespace mirror::fetch
