#include "mirror/orchestrator/orchestrator.hpp"

#include "mirror/crawl/crawler.hpp"
#include "mirror/crawl/region_filter.hpp"
#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"
#include "mirror/fetch/fetch_worker.hpp"
#include "mirror/fetch/worker_pool.hpp"
#include "mirror/ledger/ledger.hpp"
#include "mirror/net/remote_source.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

namespace mirror::orchestrator {

MirrorOrchestrator::MirrorOrchestrator(MirrorConfig config,
                                       net::RemoteSource& remote,
                                       ledger::Ledger& ledger,
                                       events::EventBus& bus,
                                       const std::atomic<bool>* interrupt)
    : config_(std::move(config)),
      remote_(remote),
      ledger_(ledger),
      bus_(bus),
      interrupt_(interrupt) {}

RunSummary MirrorOrchestrator::run() {
    const auto started = std::chrono::steady_clock::now();
    RunSummary summary;

    bus_.emit(events::RunStartedEvent{config_.root_url, config_.destination_root.string(), config_.worker_count});

    fetch::FetchWorker worker(remote_, ledger_,
                              fetch::WorkerSettings{config_.destination_root, config_.fail_on_corrupt_archive},
                              &bus_);

    fetch::PoolOptions options;
    options.worker_count = config_.worker_count;
    options.queue_capacity = config_.queue_capacity;
    options.io_error_threshold = config_.io_error_threshold;
    options.external_stop = interrupt_;

    fetch::FetchWorkerPool pool(options, [&worker](const crawl::FileEntry& entry) {
        return worker.process(entry);
    });
    pool.start();

    crawl::TreeCrawler crawler(remote_, config_.root_url, &bus_, interrupt_);
    const crawl::RegionFilter filter(config_.regions);
    if (!filter.empty()) {
        std::string regions;
        for (const auto& region : filter.regions()) {
            regions += regions.empty() ? region : ", " + region;
        }
        spdlog::info("Region filter: {}", regions);
    }

    while (auto entry = crawler.next()) {
        if (entry->is_directory) {
            continue;
        }
        if (!filter.accepts(*entry)) {
            ++summary.filtered_out;
            continue;
        }
        if (!pool.submit(std::move(*entry))) {
            spdlog::warn("Worker pool stopped, ending crawl early");
            break;
        }
        ++summary.queued;
    }
    pool.close();

    summary.directories = crawler.directories_visited();
    summary.crawl_errors = crawler.failures();
    bus_.emit(events::CrawlCompletedEvent{summary.queued, summary.directories, summary.crawl_errors.size()});

    pool.join();
    while (auto outcome = pool.results().pop()) {
        summary.add(*outcome);
    }

    summary.stop_error = pool.stop_error();
    summary.dropped = pool.dropped_tasks();
    summary.cancelled = interrupted();
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    const int code = summary.exit_code(config_.crawl_error_tolerance);
    bus_.emit(events::RunFinishedEvent{summary.processed(), summary.total_bytes, summary.elapsed,
                                       code == kExitSuccess});
    return summary;
}

bool MirrorOrchestrator::interrupted() const {
    return interrupt_ != nullptr && interrupt_->load();
}

CountReport count_files(const MirrorConfig& config,
                        net::RemoteSource& remote,
                        events::EventBus& bus,
                        const std::atomic<bool>* interrupt) {
    CountReport report;
    crawl::TreeCrawler crawler(remote, config.root_url, &bus, interrupt);
    const crawl::RegionFilter filter(config.regions);

    while (auto entry = crawler.next()) {
        if (entry->is_directory) {
            continue;
        }
        if (filter.accepts(*entry)) {
            ++report.files;
        } else {
            ++report.filtered_out;
        }
    }

    report.directories = crawler.directories_visited();
    report.crawl_errors = crawler.failures();
    bus.emit(events::CrawlCompletedEvent{report.files, report.directories, report.crawl_errors.size()});
    return report;
}

} // namespace mirror::orchestrator
