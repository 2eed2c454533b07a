#include "mirror/events/components.hpp"

#include <spdlog/spdlog.h>

namespace mirror::events {

template<typename EventType, typename Handler>
void LoggerComponent::listen(Handler handler) {
    const auto id = bus_.subscribe<EventType>([this, handler](const EventType& e) {
        (this->*handler)(e);
    });
    unsubscribers_.push_back([this, id]() {
        bus_.unsubscribe<EventType>(id);
    });
}

LoggerComponent::LoggerComponent(EventBus& bus) : bus_(bus) {
    listen<DirectoryScannedEvent>(&LoggerComponent::on_directory_scanned);
    listen<CrawlFailedEvent>(&LoggerComponent::on_crawl_failed);
    listen<TaskFinishedEvent>(&LoggerComponent::on_task_finished);
    listen<ArchiveExtractedEvent>(&LoggerComponent::on_archive_extracted);
    listen<RunStartedEvent>(&LoggerComponent::on_run_started);
    listen<CrawlCompletedEvent>(&LoggerComponent::on_crawl_completed);
    listen<RunFinishedEvent>(&LoggerComponent::on_run_finished);
}

LoggerComponent::~LoggerComponent() {
    for (auto& unsubscribe : unsubscribers_) {
        unsubscribe();
    }
}

void LoggerComponent::on_directory_scanned(const DirectoryScannedEvent& e) {
    spdlog::info("[SCAN] {} ({} files, {} subdirectories)", e.location, e.files, e.subdirectories);
}

void LoggerComponent::on_crawl_failed(const CrawlFailedEvent& e) {
    spdlog::error("[CRAWL] {} - {}", e.location, e.reason);
}

void LoggerComponent::on_task_finished(const TaskFinishedEvent& e) {
    const auto& outcome = e.outcome;
    switch (outcome.outcome) {
        case fetch::OutcomeKind::SkippedLedger:
            spdlog::info("[SKIP] {} already recorded in ledger", outcome.entry.relative_path);
            break;
        case fetch::OutcomeKind::SkippedDisk:
            spdlog::info("[SKIP] {} already on disk", outcome.entry.relative_path);
            break;
        case fetch::OutcomeKind::Ok:
            spdlog::info("[OK]   {} ({} bytes)", outcome.entry.relative_path, outcome.byte_size);
            break;
        case fetch::OutcomeKind::Failed:
            spdlog::error("[FAIL] {} - {}", outcome.entry.relative_path,
                          outcome.error ? describe(*outcome.error) : std::string("unknown error"));
            break;
    }
}

void LoggerComponent::on_archive_extracted(const ArchiveExtractedEvent& e) {
    spdlog::info("[UNZIP] {} ({} entries{})", e.archive_path, e.entries, e.resumed ? ", resumed" : "");
}

void LoggerComponent::on_run_started(const RunStartedEvent& e) {
    spdlog::info("Mirroring {} into {} with {} workers", e.root_url, e.destination_root, e.workers);
}

void LoggerComponent::on_crawl_completed(const CrawlCompletedEvent& e) {
    spdlog::info("Crawl finished: {} files in {} directories, {} listing errors",
                 e.files, e.directories, e.failures);
}

void LoggerComponent::on_run_finished(const RunFinishedEvent& e) {
    spdlog::info("Run {} after {} ms: {} tasks, {} bytes",
                 e.success ? "completed" : "FAILED", e.elapsed.count(), e.processed, e.total_bytes);
}

ProgressComponent::ProgressComponent(EventBus& bus, std::size_t interval)
    : bus_(bus), interval_(interval) {
    task_subscription_ = bus_.subscribe<TaskFinishedEvent>([this](const TaskFinishedEvent& e) {
        stats_.bytes += e.outcome.byte_size;
        const auto processed = ++stats_.processed;
        if (interval_ == 0 || processed % interval_ != 0) {
            return;
        }
        if (crawl_complete_.load()) {
            spdlog::info("Progress: {}/{} files processed", processed, stats_.discovered.load());
        } else {
            spdlog::info("Progress: {} files processed ({} discovered so far)", processed, stats_.discovered.load());
        }
    });

    directory_subscription_ = bus_.subscribe<DirectoryScannedEvent>([this](const DirectoryScannedEvent& e) {
        stats_.discovered += e.files;
    });

    crawl_subscription_ = bus_.subscribe<CrawlCompletedEvent>([this](const CrawlCompletedEvent& e) {
        stats_.discovered = e.files;
        crawl_complete_ = true;
    });
}

ProgressComponent::~ProgressComponent() {
    bus_.unsubscribe<TaskFinishedEvent>(task_subscription_);
    bus_.unsubscribe<DirectoryScannedEvent>(directory_subscription_);
    bus_.unsubscribe<CrawlCompletedEvent>(crawl_subscription_);
}

} // namespace mirror::events
