#include "mirror/fetch/task_state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace mirror::fetch {
namespace {

bool is_progressive(TaskState current, TaskState target) {
    static const std::unordered_map<TaskState, std::vector<TaskState>> transitions {
        // Pending -> Materializing resumes an archive left on disk by an earlier run
        {TaskState::Pending, {TaskState::SkippedLedger, TaskState::SkippedDisk, TaskState::Fetching, TaskState::Materializing}},
        {TaskState::Fetching, {TaskState::Materializing}},
        {TaskState::Materializing, {TaskState::Recorded}},
    };

    if (target == TaskState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::SkippedLedger: return "skipped-ledger";
        case TaskState::SkippedDisk: return "skipped-disk";
        case TaskState::Fetching: return "fetching";
        case TaskState::Materializing: return "materializing";
        case TaskState::Recorded: return "recorded";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(TaskState state) noexcept {
    return state == TaskState::SkippedLedger || state == TaskState::SkippedDisk ||
           state == TaskState::Recorded || state == TaskState::Failed;
}

TaskLifecycle::TaskLifecycle(std::string location)
    : location_(std::move(location)),
      last_transition_(std::chrono::steady_clock::now()) {}

Result<void> TaskLifecycle::transition_to(TaskState next_state) {
    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::InvalidArgument,
            std::string("illegal task transition ") + to_string(state_) + " -> " + to_string(next_state) +
            " for " + location_);
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    return Ok();
}

Result<void> TaskLifecycle::mark_failed(std::string error_message) {
    if (is_terminal(state_)) {
        return Err<void>(ErrorKind::InvalidArgument,
            std::string("task already finished as ") + to_string(state_) + " for " + location_);
    }
    last_error_ = std::move(error_message);
    return transition_to(TaskState::Failed);
}

std::chrono::steady_clock::duration TaskLifecycle::time_in_state() const {
    return std::chrono::steady_clock::now() - last_transition_;
}

bool TaskLifecycle::can_transition(TaskState target) const noexcept {
    if (is_terminal(state_)) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace mirror::fetch
