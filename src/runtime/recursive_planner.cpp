#include "runtime/recursive_planner.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/decision.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/task_scope.hpp"

namespace keel::runtime {

using protocol::Context;
using protocol::ExecutionMode;
namespace event_types = protocol::event_types;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string mode_label(const ExecutionMode mode) {
    std::string label = protocol::to_string(mode);
    if (!label.empty()) {
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    }
    return label;
}

// Span segments are dot-separated, so free-form goals need flattening.
std::string span_segment(const std::string& task, const std::size_t index) {
    std::string segment;
    for (const char c : task) {
        segment.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'
                              ? c
                              : '_');
    }
    if (segment.empty()) {
        segment = "subtask";
    }
    return std::to_string(index) + "_" + segment;
}

nlohmann::json result_to_json(const SubtaskResult& result) {
    return {{"task", result.task},
            {"status", to_string(result.status)},
            {"output", result.output}};
}

}  // namespace

std::string to_string(const SubtaskStatus status) {
    switch (status) {
        case SubtaskStatus::Complete:
            return "complete";
        case SubtaskStatus::Rejected:
            return "rejected";
        case SubtaskStatus::NotRun:
            return "not_run";
        default:
            return "unknown";
    }
}

RecursivePlanner::RecursivePlanner(const policy::ValidationGateway& gateway, EventBus& bus,
                                   Context root_context, SubtaskExecutor executor)
    : gateway_(gateway),
      bus_(bus),
      root_context_(std::move(root_context)),
      executor_(std::move(executor)) {
    if (!executor_) {
        executor_ = [](const Subtask& subtask, const Context&,
                       const CancelToken&) -> core::errors::Result<std::string> {
            return "Completed " + subtask.task;
        };
    }
}

std::vector<Subtask> RecursivePlanner::decompose_goal(const std::string& goal) {
    if (lowercase(goal).find("build") != std::string::npos) {
        return {{"analyze_requirements", 0.3, ExecutionMode::Student},
                {"design_architecture", 0.6, ExecutionMode::Architect},
                {"implement_core", 0.8, ExecutionMode::Surgeon},
                {"test_and_verify", 0.5, ExecutionMode::Firefighter}};
    }
    return {{goal, 0.4, ExecutionMode::Student}};
}

core::errors::Status RecursivePlanner::execute_subtask(const Subtask& subtask,
                                                       SubtaskResult& result,
                                                       const Context& context,
                                                       const CancelToken& cancel_token) {
    const std::string intent = "Execute " + subtask.task + " as " + mode_label(subtask.mode);
    const protocol::Decision decision =
        gateway_.validate(subtask.task, intent, subtask.complexity, context);

    if (const auto* rejected = std::get_if<protocol::Rejected>(&decision)) {
        KEEL_LOG_WARN("RecursivePlanner: rejected " + subtask.task + ": " + rejected->reason);
        bus_.emit(event_types::kAgentRejected,
                  {{"task", subtask.task},
                   {"category", protocol::to_string(rejected->category)},
                   {"reason", rejected->reason}},
                  context);
        result.status = SubtaskStatus::Rejected;
        result.output = rejected->reason;
        return core::errors::ok();
    }

    const auto& allowed = std::get<protocol::Allowed>(decision);
    bus_.emit(event_types::kAgentValidated,
              {{"task", subtask.task}, {"warnings", allowed.warnings}}, context);
    bus_.emit(event_types::kAgentExecute,
              {{"task", subtask.task}, {"mode", protocol::to_string(subtask.mode)}}, context);

    auto output = executor_(subtask, context, cancel_token);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }

    result.status = SubtaskStatus::Complete;
    result.output = core::errors::get_value(output);
    bus_.emit(event_types::kAgentComplete, result_to_json(result), context);
    return core::errors::ok();
}

core::errors::Result<PlanReport> RecursivePlanner::plan_and_execute(
    const std::string& goal, const CancelToken& cancel_token) {
    bus_.emit(event_types::kAgentPlan, {{"goal", goal}}, root_context_);

    const std::vector<Subtask> subtasks = decompose_goal(goal);
    KEEL_LOG_INFO("RecursivePlanner: decomposed into " + std::to_string(subtasks.size()) +
                  " subtasks");

    PlanReport report;
    report.goal = goal;
    for (const auto& subtask : subtasks) {
        report.results.push_back(SubtaskResult{subtask.task, SubtaskStatus::NotRun, ""});
    }

    TaskScope scope("plan", root_context_, bus_, cancel_token);
    auto scope_result = scope.run([&](TaskScope& s) -> core::errors::Status {
        for (std::size_t i = 0; i < subtasks.size(); ++i) {
            // Each task writes only its own slot; wait() orders the handoff.
            SubtaskResult* slot = &report.results[i];
            const Subtask* subtask = &subtasks[i];
            auto spawned = s.spawn(
                [this, slot, subtask](const Context& ctx, const CancelToken& token) {
                    return execute_subtask(*subtask, *slot, ctx, token);
                },
                span_segment(subtask->task, i));
            if (core::errors::is_error(spawned)) {
                return core::errors::get_error(spawned);
            }
            if (s.wait(*core::errors::get_value(spawned)) != protocol::TaskState::Completed) {
                break;
            }
        }
        return core::errors::ok();
    });
    if (core::errors::is_error(scope_result)) {
        return core::errors::get_error(scope_result);
    }
    report.cancelled = core::errors::get_value(scope_result).cancelled;

    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : report.results) {
        results.push_back(result_to_json(result));
    }
    bus_.emit(event_types::kPlanDone,
              {{"goal", goal},
               {"results", results},
               {"total_tasks", subtasks.size()},
               {"cancelled", report.cancelled}},
              root_context_);
    return report;
}

}  // namespace keel::runtime
