#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "app/signal_watcher.hpp"
#include "core/config/trace_id.hpp"
#include "core/errors/keel_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/validation_gateway.hpp"
#include "protocol/context.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/cancel_token.hpp"
#include "runtime/event_bus.hpp"
#include "runtime/orchestrator.hpp"
#include "runtime/recursive_planner.hpp"
#include "session/event_log_writer.hpp"
#include "tools/action_runner.hpp"

namespace {

using namespace keel;

int exit_code_for(const protocol::RunStatus status) {
    return status == protocol::RunStatus::Failed ? 1 : 0;
}

std::unique_ptr<session::EventLogWriter> make_event_log(const core::config::EngineConfig& config) {
    if (config.artifact_dir.empty()) {
        return nullptr;
    }
    std::filesystem::path dir = config.artifact_dir;
    if (dir.is_relative()) {
        dir = config.repo_path / dir;
    }
    KEEL_LOG_DEBUG("Event log directory: " + dir.string());
    return std::make_unique<session::EventLogWriter>(dir);
}

int run_deploy(const core::config::EngineConfig& config) {
    auto event_log = make_event_log(config);

    tools::ShellActionRunner runner(config.repo_path);
    runtime::DeploymentOrchestrator orchestrator(config, runner);
    if (event_log) {
        event_log->attach(orchestrator.event_bus());
    }

    protocol::RunSummary summary;
    {
        app::SignalWatcher watcher([&orchestrator](const std::string& reason) {
            orchestrator.request_cancel(reason);
        });
        summary = orchestrator.run();
    }

    for (const auto& phase : summary.phases) {
        KEEL_LOG_INFO("Phase " + phase.name + " [" + phase.span_id + "]: " +
                      std::to_string(phase.completed) + " completed, " +
                      std::to_string(phase.cancelled_tasks) + " cancelled, " +
                      std::to_string(phase.failed) + " failed");
    }

    if (event_log) {
        auto written = event_log->write_summary(summary);
        if (core::errors::is_error(written)) {
            const auto& err = core::errors::get_error(written);
            KEEL_LOG_ERROR("Failed to write run summary [" + err.code + "]: " + err.message);
        } else {
            KEEL_LOG_INFO("Event log: " + core::errors::get_value(written).string());
        }
    }

    std::cout << "status=" << protocol::to_string(summary.status)
              << " trace=" << summary.trace_id
              << " events=" << summary.events_emitted
              << " cause=" << (summary.reason.empty() ? "-" : summary.reason) << std::endl;
    return exit_code_for(summary.status);
}

int run_plan(const app::cli::CliCommand& command) {
    const auto& config = command.config;
    const policy::ValidationGateway gateway(config.policy);
    runtime::EventBus bus;
    const protocol::Context root = protocol::Context::root(
        core::config::generate_trace_id("plan"), config.mode, {{"goal", command.goal}});
    core::logging::Logger::get().set_trace_id(root.trace_id());

    runtime::CancelToken cancel_source;
    runtime::RecursivePlanner planner(gateway, bus, root);

    core::errors::Result<runtime::PlanReport> planned = runtime::PlanReport{};
    {
        app::SignalWatcher watcher([cancel_source](const std::string& reason) mutable {
            cancel_source.request(reason);
        });
        planned = planner.plan_and_execute(command.goal, cancel_source);
    }

    if (core::errors::is_error(planned)) {
        const auto& err = core::errors::get_error(planned);
        KEEL_LOG_ERROR("Plan failed [" + err.code + "]: " + err.message);
        std::cout << "status=failed trace=" << root.trace_id()
                  << " events=" << bus.event_count() << " cause=" << err.message << std::endl;
        return 1;
    }

    const auto& report = core::errors::get_value(planned);
    for (const auto& result : report.results) {
        KEEL_LOG_INFO("Subtask " + result.task + ": " + runtime::to_string(result.status) +
                      (result.output.empty() ? "" : " (" + result.output + ")"));
    }
    const protocol::RunStatus status =
        report.cancelled ? protocol::RunStatus::Cancelled : protocol::RunStatus::Completed;
    std::cout << "status=" << protocol::to_string(status) << " trace=" << root.trace_id()
              << " events=" << bus.event_count()
              << " cause=" << (report.cancelled ? cancel_source.reason() : "-") << std::endl;
    return exit_code_for(status);
}

}  // namespace

int main(int argc, char* argv[]) {
    KEEL_LOG_DEBUG("keel: bootstrapping");
    auto parsed = keel::app::cli::parse_and_validate(argc, argv);
    if (keel::core::errors::is_error(parsed)) {
        const auto& err = keel::core::errors::get_error(parsed);
        KEEL_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            KEEL_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& command = keel::core::errors::get_value(parsed);
    keel::core::logging::Logger::get().set_min_level(command.config.log_level);

    if (command.kind == keel::app::cli::CommandKind::Plan) {
        return run_plan(command);
    }
    return run_deploy(command.config);
}
