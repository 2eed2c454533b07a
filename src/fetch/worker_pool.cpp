#include "mirror/fetch/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

namespace mirror::fetch {
namespace {

// Bounds how long a worker waits before re-checking the external stop flag
constexpr auto kStopPollInterval = std::chrono::milliseconds(100);

} // namespace

FetchWorkerPool::FetchWorkerPool(PoolOptions options, TaskHandler handler)
    : options_(options),
      handler_(std::move(handler)),
      tasks_(options.queue_capacity) {
    if (options_.worker_count == 0) {
        options_.worker_count = 1;
    }
}

FetchWorkerPool::~FetchWorkerPool() {
    if (started_ && !joined_) {
        request_stop();
        join();
    }
}

void FetchWorkerPool::start() {
    if (started_.exchange(true)) {
        return;
    }
    workers_.reserve(options_.worker_count);
    for (std::size_t i = 0; i < options_.worker_count; ++i) {
        workers_.emplace_back(&FetchWorkerPool::worker_loop, this, i);
    }
    spdlog::debug("Started {} fetch workers", options_.worker_count);
}

bool FetchWorkerPool::submit(crawl::FileEntry entry) {
    if (stopping()) {
        return false;
    }
    return tasks_.push(std::move(entry));
}

void FetchWorkerPool::close() {
    tasks_.close();
}

void FetchWorkerPool::request_stop() {
    stopping_ = true;
    const auto dropped = tasks_.abort();
    dropped_ += dropped;
    if (dropped > 0) {
        spdlog::warn("Dropped {} queued tasks", dropped);
    }
}

void FetchWorkerPool::join() {
    if (joined_.exchange(true)) {
        return;
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    results_.close();
    spdlog::debug("Fetch workers joined");
}

bool FetchWorkerPool::stopping() const {
    return stopping_.load() || external_stop_requested();
}

std::optional<Error> FetchWorkerPool::stop_error() const {
    std::lock_guard lock(error_mutex_);
    return stop_error_;
}

void FetchWorkerPool::worker_loop(std::size_t index) {
    spdlog::debug("Fetch worker {} running", index);

    while (true) {
        if (stopping()) {
            if (!stopping_.load()) {
                request_stop();
            }
            break;
        }

        auto task = tasks_.pop_for(kStopPollInterval);
        if (!task) {
            if (tasks_.closed() && tasks_.empty()) {
                break;
            }
            continue;
        }

        auto outcome = run_task(*task);
        observe(outcome);
        if (!results_.push(std::move(outcome))) {
            spdlog::error("Results queue closed, outcome for {} lost", task->location);
        }
    }

    spdlog::debug("Fetch worker {} exiting", index);
}

TransferOutcome FetchWorkerPool::run_task(const crawl::FileEntry& entry) {
    try {
        return handler_(entry);
    } catch (const std::exception& e) {
        TransferOutcome outcome;
        outcome.entry = entry;
        outcome.outcome = OutcomeKind::Failed;
        outcome.error = Error{ErrorKind::Io, std::string("unexpected error: ") + e.what()};
        spdlog::error("[FAIL] {} - {}", entry.relative_path, describe(*outcome.error));
        return outcome;
    }
}

void FetchWorkerPool::observe(const TransferOutcome& outcome) {
    if (!outcome.error) {
        return;
    }

    const auto& error = *outcome.error;
    if (error.is_fatal()) {
        halt(error);
        return;
    }

    if (error.kind == ErrorKind::Io) {
        const auto count = ++io_errors_;
        if (options_.io_error_threshold != 0 && count == options_.io_error_threshold) {
            halt(Error{ErrorKind::Io, "stopping after " + std::to_string(count) + " I/O errors, last: " +
                                      error.message});
        }
    }
}

void FetchWorkerPool::halt(Error reason) {
    {
        std::lock_guard lock(error_mutex_);
        if (!stop_error_) {
            spdlog::error("Stopping worker pool: {}", describe(reason));
            stop_error_ = std::move(reason);
        }
    }
    request_stop();
}

bool FetchWorkerPool::external_stop_requested() const {
    return options_.external_stop != nullptr && options_.external_stop->load();
}

} // namespace mirror::fetch
