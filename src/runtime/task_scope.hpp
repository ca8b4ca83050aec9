#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/keel_errors.hpp"
#include "protocol/context.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/cancel_token.hpp"
#include "runtime/event_bus.hpp"

namespace keel::runtime {

// Body of a spawned task. Returning a Cancellation error is a clean stop;
// any other error is a failure, and so is anything the body throws.
using TaskWork = std::function<core::errors::Status(
    const protocol::Context& context, const CancelToken& cancel_token)>;

enum class ScopeState {
    Created,   // Constructed, not yet entered
    Open,      // Accepting spawns
    Draining,  // Exit sequence started, no new spawns
    Closed
};

std::string to_string(ScopeState state);

class TaskScope;

// One spawned unit of work. Owned by its scope; callers only observe it.
class TaskHandle {
public:
    // Only TaskScope can mint one.
    class ConstructionKey {
        friend class TaskScope;
        ConstructionKey() {}
    };

    TaskHandle(ConstructionKey key, std::string name, protocol::Context context,
               CancelToken token);

    const std::string& name() const { return name_; }
    const protocol::Context& context() const { return context_; }
    protocol::TaskState state() const { return state_.load(); }

    // The wrapped failure or cancellation, once terminal.
    std::optional<core::errors::KeelError> error() const;

private:
    friend class TaskScope;

    // No-op once the task is terminal.
    bool request_cancel(const std::string& reason);

    std::string name_;
    protocol::Context context_;
    CancelToken token_;
    std::atomic<protocol::TaskState> state_{protocol::TaskState::Running};
    mutable std::mutex mutex_;
    std::optional<core::errors::KeelError> error_;
    std::thread thread_;
};

// Structured-concurrency boundary. Every task spawned here has reached a
// terminal state by the time exit() returns, and scope.exit is the last
// event the scope emits. Cancellation is absorbed at exit(); any other
// failure is returned after all siblings have been cleaned up.
class TaskScope {
public:
    // The scope runs under parent_context.derive_child(name).
    TaskScope(std::string name, const protocol::Context& parent_context,
              EventBus& bus, const CancelToken& parent_token = CancelToken());
    ~TaskScope();

    TaskScope(const TaskScope&) = delete;
    TaskScope& operator=(const TaskScope&) = delete;

    core::errors::Status enter();

    core::errors::Result<TaskHandle*> spawn(TaskWork work, const std::string& name);

    // External cancellation; handled exactly like a child's cancellation.
    void cancel(const std::string& reason);

    // Blocks until `handle` is terminal and returns its final state.
    protocol::TaskState wait(const TaskHandle& handle);

    core::errors::Result<protocol::ScopeReport> exit(
        const std::optional<core::errors::KeelError>& outcome_signal = std::nullopt);

    // enter(), body(*this), exit(body's error).
    core::errors::Result<protocol::ScopeReport> run(
        const std::function<core::errors::Status(TaskScope&)>& body);

    const std::string& name() const { return name_; }
    const protocol::Context& context() const { return context_; }
    ScopeState state() const;
    bool is_cancelled() const;
    std::size_t running_count() const;
    std::size_t handle_count() const;

private:
    void run_task(TaskHandle& handle, const TaskWork& work);
    void finish_task(TaskHandle& handle, protocol::TaskState state,
                     std::optional<core::errors::KeelError> error);
    void cancel_running_locked(const std::string& reason);
    void join_all();

    std::string name_;
    protocol::Context context_;
    EventBus& bus_;
    CancelToken token_;

    mutable std::mutex mutex_;
    std::condition_variable terminal_cv_;
    ScopeState state_ = ScopeState::Created;
    std::vector<std::unique_ptr<TaskHandle>> handles_;
    bool cancelled_ = false;
    std::string cancel_reason_;
    std::optional<core::errors::KeelError> first_failure_;
};

}  // namespace keel::runtime
