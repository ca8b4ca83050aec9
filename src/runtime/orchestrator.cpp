#include "runtime/orchestrator.hpp"

#include <utility>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/config/trace_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/decision.hpp"
#include "protocol/event_contract.hpp"

namespace keel::runtime {

using core::errors::KeelError;
using protocol::Allowed;
using protocol::Context;
using protocol::Rejected;
using protocol::RunStatus;
using protocol::RunSummary;
using protocol::ScopeReport;
using protocol::TaskState;
namespace event_types = protocol::event_types;

std::string shell_single_quote(const std::string& value) {
    std::string escaped = "'";
    escaped.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    escaped += "'";
    return escaped;
}

DeploymentOrchestrator::DeploymentOrchestrator(core::config::EngineConfig config,
                                               tools::ActionRunner& runner)
    : config_(std::move(config)),
      runner_(runner),
      gateway_(config_.policy),
      root_context_(Context::root(core::config::generate_trace_id("deploy"),
                                  config_.mode,
                                  {{"repo_path", config_.repo_path.string()}})),
      phases_(default_phases()) {}

std::vector<PhaseSpec> DeploymentOrchestrator::default_phases() {
    std::vector<PhaseSpec> phases;

    PhaseSpec meta{"meta_analysis", PhaseExecution::Parallel, {}};
    PhaseTaskSpec audit;
    audit.name = "inversion_audit";
    audit.work = [this](const Context& ctx, const CancelToken&) -> core::errors::Status {
        nlohmann::json concerns = nlohmann::json::array({
            "context preservation across deployments",
            "cancellation semantics for interrupted pushes",
            "resource cleanup for temporary files",
            "observability of deployment causality",
            "validation of destructive operations"});
        bus_.emit(event_types::kMetaAnalysis,
                  {{"baseline", "git add, commit, push"}, {"concerns", concerns}}, ctx);
        return core::errors::ok();
    };
    meta.tasks.push_back(std::move(audit));
    phases.push_back(std::move(meta));

    phases.push_back(PhaseSpec{"repo_prep",
                               PhaseExecution::Sequential,
                               {PhaseTaskSpec{"git_init", "git init", "", nullptr},
                                PhaseTaskSpec{"git_add", "git add .", "", nullptr}}});

    const std::string commit_message =
        "Autonomous deployment " + root_context_.trace_id() + "\n\nTrace ID: " +
        root_context_.trace_id() + "\nDeployment Context: " +
        protocol::to_string(root_context_.mode()) + "\n";
    phases.push_back(PhaseSpec{
        "commit",
        PhaseExecution::Sequential,
        {PhaseTaskSpec{"git_commit", "git commit -m " + shell_single_quote(commit_message),
                       "Deploy step: commit " + root_context_.trace_id(), nullptr}}});

    if (config_.remote_url.has_value() && !config_.remote_url->empty()) {
        const std::string url = shell_single_quote(config_.remote_url.value());
        phases.push_back(PhaseSpec{
            "github_deploy",
            PhaseExecution::Sequential,
            {PhaseTaskSpec{"add_remote",
                           "git remote add origin " + url + " || git remote set-url origin " + url,
                           "", nullptr},
             PhaseTaskSpec{"git_push", "git branch -M main && git push -u origin main", "",
                           nullptr}}});
    }
    return phases;
}

void DeploymentOrchestrator::set_phases(std::vector<PhaseSpec> phases) {
    phases_ = std::move(phases);
}

void DeploymentOrchestrator::request_cancel(const std::string& reason) {
    if (cancel_source_.request(reason)) {
        KEEL_LOG_WARN("Orchestrator: external cancellation requested: " + reason);
    }
}

core::errors::Status DeploymentOrchestrator::execute_action(
    const std::string& command, const std::string& intent,
    const std::filesystem::path& working_directory, const Context& context,
    const CancelToken& cancel_token) {
    protocol::Decision decision =
        gateway_.check_working_directory(config_.repo_path, working_directory, context);
    if (protocol::is_allowed(decision)) {
        decision = gateway_.validate(command, intent, context);
    }
    if (const auto* rejected = std::get_if<Rejected>(&decision)) {
        bus_.emit(event_types::kActionRejected,
                  {{"action", command},
                   {"working_directory", working_directory.string()},
                   {"category", protocol::to_string(rejected->category)},
                   {"reason", rejected->reason}},
                  context);
        return protocol::to_error(*rejected);
    }

    const auto& allowed = std::get<Allowed>(decision);
    for (const auto& warning : allowed.warnings) {
        bus_.emit(event_types::kActionWarning, {{"action", command}, {"warning", warning}},
                  context);
    }
    bus_.emit(event_types::kActionValidated, {{"action", command}}, context);

    protocol::ActionRequest request;
    request.command = command;
    request.intent = intent;
    request.working_directory = working_directory;
    request.timeout_ms = config_.command_timeout_ms;

    auto output = runner_.run(request, context, cancel_token);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    KEEL_LOG_DEBUG("Orchestrator: " + context.span_id() + " finished in " +
                   std::to_string(core::errors::get_value(output).duration_ms) + " ms");
    return core::errors::ok();
}

TaskWork DeploymentOrchestrator::make_task_work(const PhaseSpec& phase,
                                                const PhaseTaskSpec& task) {
    if (task.work) {
        return task.work;
    }
    const std::string intent =
        task.intent.empty() ? "Deploy step: " + task.command : task.intent;
    std::filesystem::path directory =
        !task.working_directory.empty() ? task.working_directory : phase.working_directory;
    if (directory.empty()) {
        directory = ".";
    }
    return [this, command = task.command, intent, directory](const Context& ctx,
                                                             const CancelToken& token) {
        return execute_action(command, intent, directory, ctx, token);
    };
}

core::errors::Result<ScopeReport> DeploymentOrchestrator::run_phase(const PhaseSpec& phase) {
    KEEL_LOG_INFO("Orchestrator: phase " + phase.name + " (" +
                  std::to_string(phase.tasks.size()) + " tasks)");
    TaskScope scope(phase.name, root_context_, bus_, cancel_source_);
    return scope.run([this, &phase](TaskScope& s) -> core::errors::Status {
        for (const auto& task : phase.tasks) {
            auto spawned = s.spawn(make_task_work(phase, task), task.name);
            if (core::errors::is_error(spawned)) {
                return core::errors::get_error(spawned);
            }
            if (phase.execution != PhaseExecution::Sequential) {
                continue;
            }
            // Leave the terminal signal to exit(); just stop spawning.
            if (s.wait(*core::errors::get_value(spawned)) != TaskState::Completed) {
                break;
            }
        }
        return core::errors::ok();
    });
}

RunSummary DeploymentOrchestrator::run() {
    core::logging::Logger::get().set_trace_id(root_context_.trace_id());
    KEEL_LOG_INFO("Orchestrator: mode " + protocol::to_string(root_context_.mode()) +
                  ", repository " + config_.repo_path.string());

    RunSummary summary;
    summary.trace_id = root_context_.trace_id();
    bus_.emit(event_types::kRunStart,
              {{"repo_path", config_.repo_path.string()},
               {"mode", protocol::to_string(root_context_.mode())},
               {"phases", phases_.size()}},
              root_context_);

    for (const auto& phase : phases_) {
        if (cancel_source_.is_requested()) {
            summary.status = RunStatus::Cancelled;
            summary.reason = cancel_source_.reason();
            break;
        }

        auto result = run_phase(phase);
        if (core::errors::is_error(result)) {
            const KeelError& err = core::errors::get_error(result);
            summary.status = RunStatus::Failed;
            summary.reason = err.message;
            KEEL_LOG_ERROR("Orchestrator: phase " + phase.name + " failed [" + err.code +
                           "]: " + err.message);
            break;
        }

        const ScopeReport& report = core::errors::get_value(result);
        summary.phases.push_back(report);
        if (report.cancelled) {
            summary.status = RunStatus::Cancelled;
            summary.reason = "phase " + phase.name + " cancelled: " + report.cancel_reason;
            break;
        }
        ++summary.phases_completed;
    }

    bus_.emit(event_types::kRunEnd,
              {{"status", protocol::to_string(summary.status)},
               {"reason", summary.reason},
               {"phases_completed", summary.phases_completed}},
              root_context_);
    summary.events_emitted = bus_.event_count();

    switch (summary.status) {
        case RunStatus::Completed:
            KEEL_LOG_INFO("Orchestrator: deployment complete, " +
                          std::to_string(summary.events_emitted) + " events");
            break;
        case RunStatus::Cancelled:
            KEEL_LOG_WARN("Orchestrator: deployment cancelled (clean stop): " + summary.reason);
            break;
        case RunStatus::Failed:
            KEEL_LOG_ERROR("Orchestrator: deployment failed: " + summary.reason);
            break;
    }
    return summary;
}

}  // namespace keel::runtime
