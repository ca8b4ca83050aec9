#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/keel_errors.hpp"
#include "policy/validation_gateway.hpp"
#include "protocol/context.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/cancel_token.hpp"
#include "runtime/event_bus.hpp"
#include "runtime/task_scope.hpp"
#include "tools/action_runner.hpp"

namespace keel::runtime {

enum class PhaseExecution {
    Parallel,   // Spawn every task at once
    Sequential  // Spawn the next task only after the previous one completed
};

struct PhaseTaskSpec {
    std::string name;
    std::string command;  // External action, validated before it runs
    std::string intent;   // Defaults to "Deploy step: <command>"
    TaskWork work;        // When set, replaces the action entirely
    std::filesystem::path working_directory;  // Empty: the phase's directory
};

struct PhaseSpec {
    std::string name;
    PhaseExecution execution = PhaseExecution::Sequential;
    std::vector<PhaseTaskSpec> tasks;
    std::filesystem::path working_directory;  // Relative to the repository; empty is its root
};

// Runs a fixed list of phases, one TaskScope each. A cancelled phase stops
// the run cleanly (Cancelled); a failed phase stops it with Failed.
class DeploymentOrchestrator {
public:
    DeploymentOrchestrator(core::config::EngineConfig config,
                           tools::ActionRunner& runner);

    // meta_analysis, repo_prep, commit, github_deploy (skipped without a remote).
    std::vector<PhaseSpec> default_phases();

    void set_phases(std::vector<PhaseSpec> phases);
    const std::vector<PhaseSpec>& phases() const { return phases_; }

    protocol::RunSummary run();

    // Safe to call from any thread, including while run() is in progress.
    void request_cancel(const std::string& reason);

    EventBus& event_bus() { return bus_; }
    const EventBus& event_bus() const { return bus_; }
    const protocol::Context& root_context() const { return root_context_; }
    const policy::ValidationGateway& gateway() const { return gateway_; }

private:
    core::errors::Result<protocol::ScopeReport> run_phase(const PhaseSpec& phase);
    TaskWork make_task_work(const PhaseSpec& phase, const PhaseTaskSpec& task);
    core::errors::Status execute_action(const std::string& command,
                                        const std::string& intent,
                                        const std::filesystem::path& working_directory,
                                        const protocol::Context& context,
                                        const CancelToken& cancel_token);

    core::config::EngineConfig config_;
    tools::ActionRunner& runner_;
    policy::ValidationGateway gateway_;
    EventBus bus_;
    protocol::Context root_context_;
    CancelToken cancel_source_;
    std::vector<PhaseSpec> phases_;
};

std::string shell_single_quote(const std::string& value);

}  // namespace keel::runtime
