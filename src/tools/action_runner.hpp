#pragma once

#include <filesystem>
#include "core/errors/keel_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/context.hpp"
#include "runtime/cancel_token.hpp"

namespace keel::tools {

// Boundary between a task body and the outside world. Implementations must
// return Cancellation errors (not Execution errors) when the action was
// abandoned because of the token or a timeout.
class ActionRunner {
public:
    virtual ~ActionRunner() = default;

    virtual core::errors::Result<protocol::ActionOutput> run(
        const protocol::ActionRequest& request, const protocol::Context& context,
        const runtime::CancelToken& cancel_token) = 0;
};

// Runs actions through /bin/sh in `working_directory` under the workspace
// root. Containment is the gateway's job; the runner only requires the
// directory to exist. The child's process group is killed when the token is
// requested or the timeout elapses.
class ShellActionRunner : public ActionRunner {
public:
    explicit ShellActionRunner(std::filesystem::path workspace_root);

    core::errors::Result<protocol::ActionOutput> run(
        const protocol::ActionRequest& request, const protocol::Context& context,
        const runtime::CancelToken& cancel_token) override;

private:
    std::filesystem::path workspace_root_;
};

}  // namespace keel::tools
