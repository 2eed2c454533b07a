/**
 * @file components.hpp
 * @brief Reporting components that react to run events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressComponent progress(bus, 50);
 * // Crawler and workers now report through spdlog automatically
 */

#pragma once

#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mirror::events {

/**
 * @brief Logs every terminal task outcome and every crawl/archive event
 *
 * One line per file: [SKIP], [OK] or [FAIL] with the reason.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_directory_scanned(const DirectoryScannedEvent& e);
    void on_crawl_failed(const CrawlFailedEvent& e);
    void on_task_finished(const TaskFinishedEvent& e);
    void on_archive_extracted(const ArchiveExtractedEvent& e);
    void on_run_started(const RunStartedEvent& e);
    void on_crawl_completed(const CrawlCompletedEvent& e);
    void on_run_finished(const RunFinishedEvent& e);

    template<typename EventType, typename Handler>
    void listen(Handler handler);

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts finished tasks and logs progress every `interval` completions
 */
class ProgressComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> processed{0};
        std::atomic<std::uint64_t> discovered{0};
        std::atomic<std::uint64_t> bytes{0};
    };

    ProgressComponent(EventBus& bus, std::size_t interval);
    ~ProgressComponent();

    ProgressComponent(const ProgressComponent&) = delete;
    ProgressComponent& operator=(const ProgressComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

private:
    EventBus& bus_;
    std::size_t interval_;
    std::size_t task_subscription_ = 0;
    std::size_t directory_subscription_ = 0;
    std::size_t crawl_subscription_ = 0;
    std::atomic<bool> crawl_complete_{false};
    Stats stats_;
};

} // namespace mirror::events
