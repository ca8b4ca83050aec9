#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace keel::protocol {

enum class RunStatus {
    Completed,
    Cancelled,
    Failed
};

enum class TaskState {
    Running,
    Completed,
    Cancelled,
    Failed
};

// What one phase scope looked like when it closed.
struct ScopeReport {
    std::string name;
    std::string span_id;
    bool cancelled = false;
    std::string cancel_reason;
    std::size_t completed = 0;
    std::size_t cancelled_tasks = 0;
    std::size_t failed = 0;
};

struct RunSummary {
    std::string trace_id;
    RunStatus status = RunStatus::Completed;
    std::string reason;  // Human-readable cause for cancelled / failed runs
    std::size_t events_emitted = 0;
    std::size_t phases_completed = 0;
    std::vector<ScopeReport> phases;
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Cancelled:
            return "cancelled";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const TaskState state) {
    switch (state) {
        case TaskState::Running:
            return "running";
        case TaskState::Completed:
            return "completed";
        case TaskState::Cancelled:
            return "cancelled";
        case TaskState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline bool is_terminal(const TaskState state) {
    return state != TaskState::Running;
}

}  // namespace keel::protocol
