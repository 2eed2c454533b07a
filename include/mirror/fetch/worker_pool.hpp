/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of fetch threads between a task queue and a results queue
 *
 * DATA FLOW:
 *   producer --submit()--> [task queue] --> N worker threads --> [results queue] --> consumer
 *
 * Each dequeued task yields exactly one TransferOutcome on the results queue.
 *
 * STOPPING:
 * - close(): no more tasks; workers finish what is queued, then exit
 * - request_stop(): queued tasks are dropped; in-flight tasks finish
 * - a fatal task error (ledger conflict or ledger unavailable) or too many
 *   I/O errors stop the pool the same way request_stop() does
 * - the external stop flag (set from a signal handler) is polled between tasks
 *
 * EXAMPLE:
 * FetchWorkerPool pool(options, [&](const FileEntry& e) { return worker.process(e); });
 * pool.start();
 * while (auto entry = crawler.next()) pool.submit(*entry);
 * pool.close();
 * pool.join();
 * while (auto outcome = pool.results().pop()) { ... }
 */

#pragma once

#include "mirror/crawl/types.hpp"
#include "mirror/fetch/blocking_queue.hpp"
#include "mirror/fetch/types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace mirror::fetch {

struct PoolOptions {
    std::size_t worker_count = 8;
    std::size_t queue_capacity = 0;              ///< 0 means unbounded
    std::size_t io_error_threshold = 25;         ///< 0 disables the circuit breaker
    const std::atomic<bool>* external_stop = nullptr;
};

using TaskHandler = std::function<TransferOutcome(const crawl::FileEntry&)>;

class FetchWorkerPool {
public:
    FetchWorkerPool(PoolOptions options, TaskHandler handler);
    ~FetchWorkerPool();

    FetchWorkerPool(const FetchWorkerPool&) = delete;
    FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

    void start();

    /**
     * @brief Queue one task, waiting for room when the queue is bounded
     *
     * RETURNS: false once the pool is closed or stopping (task not queued)
     */
    bool submit(crawl::FileEntry entry);

    void close();
    void request_stop();

    /// Wait for all workers, then close the results queue.
    void join();

    BlockingQueue<TransferOutcome>& results() { return results_; }

    [[nodiscard]] bool stopping() const;

    /// The error that stopped the pool early, if any.
    [[nodiscard]] std::optional<Error> stop_error() const;

    [[nodiscard]] std::size_t io_errors() const noexcept { return io_errors_.load(); }
    [[nodiscard]] std::size_t dropped_tasks() const noexcept { return dropped_.load(); }
    [[nodiscard]] std::size_t worker_count() const noexcept { return options_.worker_count; }

private:
    void worker_loop(std::size_t index);
    TransferOutcome run_task(const crawl::FileEntry& entry);
    void observe(const TransferOutcome& outcome);
    void halt(Error reason);
    bool external_stop_requested() const;

    PoolOptions options_;
    TaskHandler handler_;

    BlockingQueue<crawl::FileEntry> tasks_;
    BlockingQueue<TransferOutcome> results_;
    std::vector<std::thread> workers_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> joined_{false};
    std::atomic<std::size_t> io_errors_{0};
    std::atomic<std::size_t> dropped_{0};

    mutable std::mutex error_mutex_;
    std::optional<Error> stop_error_;
};

} // namespace mirror::fetch
