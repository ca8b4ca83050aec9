#include "runtime/task_scope.hpp"

#include <exception>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"

namespace keel::runtime {

using core::errors::ErrorCategory;
using core::errors::KeelError;
using protocol::Context;
using protocol::ScopeReport;
using protocol::TaskState;
namespace event_types = protocol::event_types;

std::string to_string(const ScopeState state) {
    switch (state) {
        case ScopeState::Created:
            return "created";
        case ScopeState::Open:
            return "open";
        case ScopeState::Draining:
            return "draining";
        case ScopeState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

TaskHandle::TaskHandle(ConstructionKey, std::string name, Context context, CancelToken token)
    : name_(std::move(name)), context_(std::move(context)), token_(std::move(token)) {}

std::optional<KeelError> TaskHandle::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool TaskHandle::request_cancel(const std::string& reason) {
    if (protocol::is_terminal(state_.load())) {
        return false;
    }
    return token_.request(reason);
}

TaskScope::TaskScope(std::string name, const Context& parent_context, EventBus& bus,
                     const CancelToken& parent_token)
    : name_(std::move(name)),
      context_(parent_context.derive_child(name_)),
      bus_(bus),
      token_(parent_token.child()) {}

TaskScope::~TaskScope() {
    bool needs_exit = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        needs_exit = state_ == ScopeState::Open;
    }
    if (needs_exit) {
        auto result = exit(core::errors::cancellation(
            "scope '" + name_ + "' destroyed without exit", "scope_abandoned"));
        if (core::errors::is_error(result)) {
            KEEL_LOG_ERROR("TaskScope: abandoned scope " + context_.span_id() +
                           " failed during cleanup: " +
                           core::errors::get_error(result).message);
        }
    }
    join_all();
}

core::errors::Status TaskScope::enter() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ScopeState::Created) {
            return KeelError{ErrorCategory::Input,
                             "Scope '" + name_ + "' cannot be entered from state " +
                                 to_string(state_),
                             "invalid_scope_state"};
        }
        state_ = ScopeState::Open;
    }
    KEEL_LOG_DEBUG("TaskScope: enter " + context_.span_id());
    bus_.emit(event_types::kScopeEnter, {{"scope", name_}}, context_);
    return core::errors::ok();
}

core::errors::Result<TaskHandle*> TaskScope::spawn(TaskWork work,
                                                   const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ScopeState::Open) {
        return KeelError{ErrorCategory::Input,
                         "Cannot spawn '" + name + "' in scope '" + name_ +
                             "' while " + to_string(state_),
                         "scope_not_open"};
    }

    // After a veto or a failure token_ is already requested, so a late
    // spawn starts cancelled and never reaches its body.
    handles_.push_back(std::make_unique<TaskHandle>(TaskHandle::ConstructionKey(), name,
                                                    context_.derive_child(name),
                                                    token_.child()));
    TaskHandle* handle = handles_.back().get();
    handle->thread_ = std::thread([this, handle, work = std::move(work)]() {
        run_task(*handle, work);
    });
    return handle;
}

void TaskScope::run_task(TaskHandle& handle, const TaskWork& work) {
    const Context& ctx = handle.context();
    bus_.emit(event_types::kTaskStart, {{"task", handle.name()}}, ctx);

    core::errors::Status result = core::errors::ok();
    if (handle.token_.is_requested()) {
        result = core::errors::cancellation("cancelled before start: " +
                                            handle.token_.reason());
    } else {
        try {
            result = work(ctx, handle.token_);
        } catch (const std::exception& ex) {
            result = KeelError{ErrorCategory::Internal,
                               std::string("task threw: ") + ex.what(),
                               "task_exception"};
        } catch (...) {
            result = KeelError{ErrorCategory::Internal,
                               "task threw a non-standard exception",
                               "task_exception"};
        }
    }

    if (!core::errors::is_error(result)) {
        bus_.emit(event_types::kTaskComplete, {{"task", handle.name()}}, ctx);
        finish_task(handle, TaskState::Completed, std::nullopt);
        return;
    }

    const KeelError& err = core::errors::get_error(result);
    if (core::errors::is_cancellation(err)) {
        KEEL_LOG_WARN("TaskScope: task " + ctx.span_id() + " cancelled: " + err.message);
        bus_.emit(event_types::kTaskCancelled,
                  {{"task", handle.name()}, {"reason", err.message}}, ctx);
        finish_task(handle, TaskState::Cancelled, err);
        return;
    }

    KeelError wrapped = core::errors::wrap_task_error(err, handle.name(), ctx.span_id());
    KEEL_LOG_ERROR("TaskScope: " + wrapped.message);
    bus_.emit(event_types::kTaskError,
              {{"task", handle.name()}, {"error", wrapped.message}, {"code", wrapped.code}},
              ctx);
    finish_task(handle, TaskState::Failed, std::move(wrapped));
}

void TaskScope::finish_task(TaskHandle& handle, const TaskState state,
                            std::optional<KeelError> error) {
    {
        std::lock_guard<std::mutex> handle_lock(handle.mutex_);
        handle.error_ = error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    handle.state_.store(state);
    if (state == TaskState::Cancelled && !first_failure_.has_value()) {
        // A cancellation the scope did not ask for spreads to every sibling.
        if (!cancelled_) {
            cancelled_ = true;
            cancel_reason_ = error.has_value() ? error->message : "cancelled";
        }
        const std::string reason = "sibling '" + handle.name() + "' cancelled";
        token_.request(reason);
        cancel_running_locked(reason);
    } else if (state == TaskState::Failed && !first_failure_.has_value()) {
        first_failure_ = error;
        const std::string reason = "sibling '" + handle.name() + "' failed";
        token_.request(reason);
        cancel_running_locked(reason);
    }
    terminal_cv_.notify_all();
}

void TaskScope::cancel_running_locked(const std::string& reason) {
    for (auto& handle : handles_) {
        if (handle->request_cancel(reason)) {
            KEEL_LOG_DEBUG("TaskScope: cancellation requested for " +
                           handle->context().span_id() + " (" + reason + ")");
        }
    }
}

void TaskScope::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
        cancelled_ = true;
        cancel_reason_ = reason;
    }
    token_.request(reason);
    cancel_running_locked(reason);
}

TaskState TaskScope::wait(const TaskHandle& handle) {
    std::unique_lock<std::mutex> lock(mutex_);
    terminal_cv_.wait(lock, [&handle]() { return protocol::is_terminal(handle.state()); });
    return handle.state();
}

void TaskScope::join_all() {
    // handles_ is frozen once the scope left Open, so it can be walked
    // without the lock while threads finish and take it themselves.
    for (auto& handle : handles_) {
        if (handle->thread_.joinable()) {
            handle->thread_.join();
        }
    }
}

core::errors::Result<ScopeReport> TaskScope::exit(
    const std::optional<KeelError>& outcome_signal) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ScopeState::Open) {
            return KeelError{ErrorCategory::Input,
                             "Scope '" + name_ + "' cannot exit from state " +
                                 to_string(state_),
                             "invalid_scope_state"};
        }
        state_ = ScopeState::Draining;

        if (outcome_signal.has_value()) {
            if (core::errors::is_cancellation(*outcome_signal)) {
                if (!cancelled_) {
                    cancelled_ = true;
                    cancel_reason_ = outcome_signal->message;
                }
            } else if (!first_failure_.has_value()) {
                first_failure_ = outcome_signal;
            }
        }
        if (!cancelled_ && !first_failure_.has_value() && token_.is_requested()) {
            cancelled_ = true;
            cancel_reason_ = token_.reason();
        }

        if (cancelled_ || first_failure_.has_value()) {
            KEEL_LOG_DEBUG("TaskScope: " + context_.span_id() +
                           " draining with cancellation of running children");
            cancel_running_locked(cancelled_ ? cancel_reason_ : "scope failed");
        }
    }

    join_all();

    ScopeReport report;
    report.name = name_;
    report.span_id = context_.span_id();
    std::optional<KeelError> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& handle : handles_) {
            switch (handle->state()) {
                case TaskState::Completed:
                    ++report.completed;
                    break;
                case TaskState::Cancelled:
                    ++report.cancelled_tasks;
                    break;
                case TaskState::Failed:
                    ++report.failed;
                    break;
                case TaskState::Running:
                    break;
            }
        }
        report.cancelled = cancelled_;
        report.cancel_reason = cancel_reason_;
        failure = first_failure_;
        state_ = ScopeState::Closed;
    }

    nlohmann::json signal = nullptr;
    if (failure.has_value()) {
        signal = "failure";
    } else if (report.cancelled) {
        signal = "cancellation";
    }
    bus_.emit(event_types::kScopeExit,
              {{"scope", name_}, {"cancelled", report.cancelled}, {"signal", signal}},
              context_);

    if (failure.has_value()) {
        return *failure;
    }
    if (report.cancelled) {
        KEEL_LOG_WARN("TaskScope: scope " + context_.span_id() + " cancelled: " +
                      cancel_reason_);
    }
    return report;
}

core::errors::Result<ScopeReport> TaskScope::run(
    const std::function<core::errors::Status(TaskScope&)>& body) {
    auto entered = enter();
    if (core::errors::is_error(entered)) {
        return core::errors::get_error(entered);
    }

    std::optional<KeelError> signal;
    auto status = body(*this);
    if (core::errors::is_error(status)) {
        signal = core::errors::get_error(status);
    }
    return exit(signal);
}

ScopeState TaskScope::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TaskScope::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::size_t TaskScope::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t running = 0;
    for (const auto& handle : handles_) {
        if (!protocol::is_terminal(handle->state())) {
            ++running;
        }
    }
    return running;
}

std::size_t TaskScope::handle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

}  // namespace keel::runtime
