/**
 * @file events.hpp
 * @brief Event types emitted during a mirror run
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: DirectoryScannedEvent, TaskFinishedEvent.
 * They are emitted synchronously on the thread that produced them
 * (crawler thread or a worker thread), so handlers must be thread-safe.
 */

#pragma once

#include "mirror/fetch/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mirror::events {

// ════════════════════════════════════════════════════════
// Crawl Events
// ════════════════════════════════════════════════════════

/**
 * @brief A listing page was fetched and parsed
 *
 * WHO EMITS: TreeCrawler
 * WHO SUBSCRIBES: Logger
 */
struct DirectoryScannedEvent {
    std::string location;
    std::size_t files = 0;
    std::size_t subdirectories = 0;
};

/**
 * @brief A listing page could not be fetched or a link was rejected
 *
 * WHO EMITS: TreeCrawler
 * WHO SUBSCRIBES: Logger
 */
struct CrawlFailedEvent {
    std::string location;
    std::string reason;
};

// ════════════════════════════════════════════════════════
// Task Events
// ════════════════════════════════════════════════════════

/**
 * @brief A task reached a terminal state
 *
 * WHO EMITS: FetchWorker, once per dequeued task
 * WHO SUBSCRIBES: Logger (one line per file), progress reporting
 */
struct TaskFinishedEvent {
    fetch::TransferOutcome outcome;
};

/**
 * @brief An archive was unpacked next to itself and removed
 *
 * WHO EMITS: FetchWorker
 * WHO SUBSCRIBES: Logger
 */
struct ArchiveExtractedEvent {
    std::string archive_path;
    std::size_t entries = 0;
    bool resumed = false;   ///< Archive was left over from an earlier run
};

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

struct RunStartedEvent {
    std::string root_url;
    std::string destination_root;
    std::size_t workers = 0;
};

struct CrawlCompletedEvent {
    std::size_t files = 0;
    std::size_t directories = 0;
    std::size_t failures = 0;
};

struct RunFinishedEvent {
    std::size_t processed = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    bool success = false;
};

} // namespace mirror::events
