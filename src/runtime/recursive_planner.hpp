#pragma once

#include <functional>
#include <string>
#include <vector>
#include "core/errors/keel_errors.hpp"
#include "policy/validation_gateway.hpp"
#include "protocol/context.hpp"
#include "runtime/cancel_token.hpp"
#include "runtime/event_bus.hpp"

namespace keel::runtime {

struct Subtask {
    std::string task;
    double complexity = 0.0;
    protocol::ExecutionMode mode = protocol::ExecutionMode::Student;
};

enum class SubtaskStatus {
    Complete,
    Rejected,
    NotRun
};

std::string to_string(SubtaskStatus status);

struct SubtaskResult {
    std::string task;
    SubtaskStatus status = SubtaskStatus::NotRun;
    std::string output;
};

struct PlanReport {
    std::string goal;
    std::vector<SubtaskResult> results;
    bool cancelled = false;
};

// Performs one allowed subtask and returns its output.
using SubtaskExecutor = std::function<core::errors::Result<std::string>(
    const Subtask& subtask, const protocol::Context& context,
    const CancelToken& cancel_token)>;

// Goal -> subtasks -> validated, sequential execution inside one "plan"
// scope. A vetoed subtask is recorded as rejected and the plan moves on.
class RecursivePlanner {
public:
    RecursivePlanner(const policy::ValidationGateway& gateway, EventBus& bus,
                     protocol::Context root_context, SubtaskExecutor executor = nullptr);

    static std::vector<Subtask> decompose_goal(const std::string& goal);

    core::errors::Result<PlanReport> plan_and_execute(
        const std::string& goal, const CancelToken& cancel_token = CancelToken());

private:
    core::errors::Status execute_subtask(const Subtask& subtask, SubtaskResult& result,
                                         const protocol::Context& context,
                                         const CancelToken& cancel_token);

    const policy::ValidationGateway& gateway_;
    EventBus& bus_;
    protocol::Context root_context_;
    SubtaskExecutor executor_;
};

}  // namespace keel::runtime
