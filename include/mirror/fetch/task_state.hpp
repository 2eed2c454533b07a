#pragma once

#include "mirror/core/result.hpp"

#include <chrono>
#include <string>

namespace mirror::fetch {

enum class TaskState {
    Pending,
    SkippedLedger,
    SkippedDisk,
    Fetching,
    Materializing,
    Recorded,
    Failed
};

const char* to_string(TaskState state);

[[nodiscard]] bool is_terminal(TaskState state) noexcept;

/**
 * @brief Lifecycle of one task inside a worker
 *
 * Pending -> SkippedLedger | SkippedDisk | Fetching | Materializing | Failed
 * Fetching -> Materializing | Failed
 * Materializing -> Recorded | Failed
 *
 * Terminal states accept no further transitions.
 */
class TaskLifecycle {
public:
    explicit TaskLifecycle(std::string location);

    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    Result<void> transition_to(TaskState next_state);
    Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::steady_clock::duration time_in_state() const;

private:
    [[nodiscard]] bool can_transition(TaskState target) const noexcept;

    std::string location_;
    TaskState state_ = TaskState::Pending;
    std::string last_error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace mirror::fetch
