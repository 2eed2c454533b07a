#pragma once

/**
 * @file orchestrator.hpp
 * @brief Wires crawler, worker pool, materializer and ledger into one run
 *
 * FLOW:
 * 1. Workers start first and wait on the task queue
 * 2. The crawler walks the listing tree on the calling thread; every leaf that
 *    passes the region filter is submitted as soon as it is discovered
 * 3. When the crawl ends the task queue is closed; workers drain it and exit
 * 4. Outcomes are read from the results queue into a RunSummary
 *
 * A fatal ledger error, the I/O circuit breaker or an interrupt stops the
 * crawl as well as the pool.
 */

#include "mirror/core/config.hpp"
#include "mirror/crawl/types.hpp"
#include "mirror/orchestrator/summary.hpp"

#include <atomic>
#include <cstddef>
#include <vector>

namespace mirror::events {
class EventBus;
}

namespace mirror::ledger {
class Ledger;
}

namespace mirror::net {
class RemoteSource;
}

namespace mirror::orchestrator {

struct CountReport {
    std::size_t files = 0;
    std::size_t filtered_out = 0;
    std::size_t directories = 0;
    std::vector<crawl::CrawlFailure> crawl_errors;
};

class MirrorOrchestrator {
public:
    MirrorOrchestrator(MirrorConfig config,
                       net::RemoteSource& remote,
                       ledger::Ledger& ledger,
                       events::EventBus& bus,
                       const std::atomic<bool>* interrupt = nullptr);

    RunSummary run();

    [[nodiscard]] const MirrorConfig& config() const noexcept { return config_; }

private:
    bool interrupted() const;

    MirrorConfig config_;
    net::RemoteSource& remote_;
    ledger::Ledger& ledger_;
    events::EventBus& bus_;
    const std::atomic<bool>* interrupt_ = nullptr;
};

/// Crawl only and count the leaf files that a run would process.
CountReport count_files(const MirrorConfig& config,
                        net::RemoteSource& remote,
                        events::EventBus& bus,
                        const std::atomic<bool>* interrupt = nullptr);

} // namespace mirror::orchestrator
