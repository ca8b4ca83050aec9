#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/errors/keel_errors.hpp"
#include "protocol/context.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/cancel_token.hpp"
#include "runtime/event_bus.hpp"
#include "runtime/task_scope.hpp"

namespace {

using keel::core::errors::ErrorCategory;
using keel::core::errors::KeelError;
using keel::core::errors::Status;
using keel::core::errors::get_error;
using keel::core::errors::get_value;
using keel::core::errors::is_error;
using keel::core::errors::ok;
using keel::protocol::Context;
using keel::protocol::Event;
using keel::protocol::ExecutionMode;
using keel::protocol::TaskState;
using keel::runtime::CancelToken;
using keel::runtime::EventBus;
using keel::runtime::ScopeState;
using keel::runtime::TaskHandle;
using keel::runtime::TaskScope;
namespace event_types = keel::protocol::event_types;

Context make_root() {
    return Context::root("trace_scope", ExecutionMode::Architect);
}

// Blocks until the token fires, then stops the way a well-behaved task does.
Status wait_for_cancel(const Context&, const CancelToken& token) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!token.is_requested()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return KeelError{ErrorCategory::Internal, "never cancelled", "test_deadline"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return keel::core::errors::cancellation("stopped: " + token.reason());
}

Status succeed(const Context&, const CancelToken&) {
    return ok();
}

TaskHandle* spawn_or_die(TaskScope& scope, keel::runtime::TaskWork work, const std::string& name) {
    auto spawned = scope.spawn(std::move(work), name);
    if (is_error(spawned)) {
        throw std::runtime_error("spawn failed: " + get_error(spawned).message);
    }
    return get_value(spawned);
}

TEST(TaskScopeTest, EmptyScopeEmitsEnterAndExitOnly) {
    EventBus bus;
    TaskScope scope("noop", make_root(), bus);

    auto result = scope.run([](TaskScope&) -> Status { return ok(); });
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).cancelled);

    const auto events = bus.snapshot();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, event_types::kScopeEnter);
    EXPECT_EQ(events[1].type, event_types::kScopeExit);
    EXPECT_EQ(events[0].trace_id, "trace_scope");
    EXPECT_EQ(events[1].trace_id, "trace_scope");
    EXPECT_EQ(events[1].span_id, "root.noop");
    EXPECT_TRUE(events[1].payload.at("signal").is_null());
    EXPECT_EQ(scope.state(), ScopeState::Closed);
}

TEST(TaskScopeTest, TasksRunUnderChildSpans) {
    EventBus bus;
    TaskScope scope("repo_prep", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* handle = spawn_or_die(scope, succeed, "git_init");
    EXPECT_EQ(handle->context().span_id(), "root.repo_prep.git_init");
    EXPECT_EQ(handle->context().metadata().at(Context::kParentSpanKey), "root.repo_prep");
    EXPECT_EQ(scope.wait(*handle), TaskState::Completed);

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).completed, 1u);
    EXPECT_EQ(get_value(result).span_id, "root.repo_prep");
}

TEST(TaskScopeTest, CancelledScopeExitsNormally) {
    EventBus bus;
    TaskScope scope("deploy", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* handle = spawn_or_die(scope, wait_for_cancel, "git_push");
    scope.cancel("user interrupt");

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    const auto& report = get_value(result);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.cancel_reason, "user interrupt");
    EXPECT_EQ(report.cancelled_tasks, 1u);
    EXPECT_EQ(handle->state(), TaskState::Cancelled);
    EXPECT_EQ(scope.running_count(), 0u);

    const auto events = bus.snapshot();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, event_types::kScopeExit);
    EXPECT_EQ(events.back().payload.at("signal"), "cancellation");
}

TEST(TaskScopeTest, TaskCancellationSpreadsToSiblings) {
    EventBus bus;
    TaskScope scope("commit", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* waiting = spawn_or_die(scope, wait_for_cancel, "waiting");
    TaskHandle* vetoed = spawn_or_die(
        scope,
        [](const Context&, const CancelToken&) -> Status {
            return keel::core::errors::cancellation("vetoed", "self_preservation_veto");
        },
        "vetoed");

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).cancel_reason, "vetoed");
    EXPECT_EQ(vetoed->state(), TaskState::Cancelled);
    EXPECT_EQ(waiting->state(), TaskState::Cancelled);
    ASSERT_TRUE(vetoed->error().has_value());
    EXPECT_EQ(vetoed->error()->code, "self_preservation_veto");
}

TEST(TaskScopeTest, FailureCancelsSiblingsAndPropagates) {
    EventBus bus;
    TaskScope scope("repo_prep", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* first = spawn_or_die(scope, wait_for_cancel, "first");
    TaskHandle* failing = spawn_or_die(
        scope,
        [](const Context&, const CancelToken&) -> Status {
            return KeelError{ErrorCategory::Execution, "exit code 128", "action_failed"};
        },
        "failing");
    TaskHandle* third = spawn_or_die(scope, wait_for_cancel, "third");

    auto result = scope.exit();
    ASSERT_TRUE(is_error(result));
    const KeelError& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::Execution);
    EXPECT_EQ(err.code, "action_failed");
    EXPECT_EQ(err.task, "failing");
    EXPECT_EQ(err.span, "root.repo_prep.failing");
    EXPECT_EQ(err.message, "task 'failing' [root.repo_prep.failing]: exit code 128");

    EXPECT_EQ(failing->state(), TaskState::Failed);
    EXPECT_EQ(first->state(), TaskState::Cancelled);
    EXPECT_EQ(third->state(), TaskState::Cancelled);
    EXPECT_FALSE(scope.is_cancelled());
    EXPECT_EQ(scope.running_count(), 0u);
    EXPECT_EQ(scope.state(), ScopeState::Closed);

    const auto events = bus.snapshot();
    EXPECT_EQ(events.back().type, event_types::kScopeExit);
    EXPECT_EQ(events.back().payload.at("signal"), "failure");
}

TEST(TaskScopeTest, ThrowingTaskIsFailure) {
    EventBus bus;
    TaskScope scope("meta_analysis", make_root(), bus);

    auto result = scope.run([](TaskScope& s) -> Status {
        auto spawned = s.spawn(
            [](const Context&, const CancelToken&) -> Status {
                throw std::runtime_error("bad payload");
            },
            "inversion_audit");
        if (is_error(spawned)) {
            return get_error(spawned);
        }
        return ok();
    });

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "task_exception");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
}

TEST(TaskScopeTest, NonStandardThrowIsFailure) {
    EventBus bus;
    TaskScope scope("meta_analysis", make_root(), bus);

    auto result = scope.run([](TaskScope& s) -> Status {
        auto spawned = s.spawn([](const Context&, const CancelToken&) -> Status { throw 42; },
                               "inversion_audit");
        if (is_error(spawned)) {
            return get_error(spawned);
        }
        return ok();
    });

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "task_exception");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
}

TEST(TaskScopeTest, SpawnAfterVetoStartsCancelled) {
    EventBus bus;
    TaskScope scope("commit", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* vetoed = spawn_or_die(
        scope,
        [](const Context&, const CancelToken&) -> Status {
            return keel::core::errors::cancellation("vetoed", "self_preservation_veto");
        },
        "vetoed");
    ASSERT_EQ(scope.wait(*vetoed), TaskState::Cancelled);
    EXPECT_TRUE(scope.is_cancelled());

    std::atomic<bool> ran{false};
    TaskHandle* late = spawn_or_die(
        scope,
        [&ran](const Context&, const CancelToken&) -> Status {
            ran = true;
            return ok();
        },
        "git_push");
    EXPECT_EQ(scope.wait(*late), TaskState::Cancelled);
    EXPECT_FALSE(ran.load());
    ASSERT_TRUE(late->error().has_value());
    EXPECT_NE(late->error()->message.find("cancelled before start"), std::string::npos);

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).cancelled_tasks, 2u);
    EXPECT_EQ(get_value(result).completed, 0u);
}

TEST(TaskScopeTest, SpawnAfterFailureStartsCancelled) {
    EventBus bus;
    TaskScope scope("repo_prep", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* failing = spawn_or_die(
        scope,
        [](const Context&, const CancelToken&) -> Status {
            return KeelError{ErrorCategory::Execution, "exit code 128", "action_failed"};
        },
        "git_init");
    ASSERT_EQ(scope.wait(*failing), TaskState::Failed);

    std::atomic<bool> ran{false};
    TaskHandle* late = spawn_or_die(
        scope,
        [&ran](const Context&, const CancelToken&) -> Status {
            ran = true;
            return ok();
        },
        "git_add");
    EXPECT_EQ(scope.wait(*late), TaskState::Cancelled);
    EXPECT_FALSE(ran.load());

    auto result = scope.exit();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "action_failed");
    EXPECT_EQ(get_error(result).task, "git_init");

    const auto late_events = bus.events_for_span("root.repo_prep.git_add");
    ASSERT_FALSE(late_events.empty());
    EXPECT_EQ(late_events.back().type, event_types::kTaskCancelled);
}

TEST(TaskScopeTest, ScopeExitFollowsEveryDescendantEvent) {
    EventBus bus;
    const Context root = make_root();
    TaskScope scope("phase", root, bus);

    auto result = scope.run([&bus](TaskScope& s) -> Status {
        for (int i = 0; i < 4; ++i) {
            auto spawned = s.spawn(
                [&bus](const Context& ctx, const CancelToken& token) -> Status {
                    bus.emit("work.progress", {{"step", 1}}, ctx);
                    TaskScope inner("inner", ctx, bus, token);
                    auto inner_result = inner.run([](TaskScope& nested) -> Status {
                        auto child = nested.spawn(succeed, "leaf");
                        if (is_error(child)) {
                            return get_error(child);
                        }
                        return ok();
                    });
                    if (is_error(inner_result)) {
                        return get_error(inner_result);
                    }
                    return ok();
                },
                "worker_" + std::to_string(i));
            if (is_error(spawned)) {
                return get_error(spawned);
            }
        }
        return ok();
    });
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).completed, 4u);

    const auto events = bus.events_for_span("root.phase");
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().type, event_types::kScopeEnter);
    EXPECT_EQ(events.back().type, event_types::kScopeExit);
    EXPECT_EQ(events.back().span_id, "root.phase");

    // Each inner scope closes before its owning task completes.
    for (int i = 0; i < 4; ++i) {
        const std::string task_span = "root.phase.worker_" + std::to_string(i);
        const auto task_events = bus.events_for_span(task_span);
        ASSERT_FALSE(task_events.empty());
        EXPECT_EQ(task_events.front().type, event_types::kTaskStart);
        EXPECT_EQ(task_events.back().type, event_types::kTaskComplete);
        const auto inner_events = bus.events_for_span(task_span + ".inner");
        ASSERT_FALSE(inner_events.empty());
        EXPECT_EQ(inner_events.back().type, event_types::kScopeExit);
        EXPECT_LT(inner_events.back().sequence, task_events.back().sequence);
    }
}

TEST(TaskScopeTest, SpawnOutsideOpenIsRejected) {
    EventBus bus;
    TaskScope scope("late", make_root(), bus);

    auto before = scope.spawn(succeed, "early");
    ASSERT_TRUE(is_error(before));
    EXPECT_EQ(get_error(before).code, "scope_not_open");

    ASSERT_FALSE(is_error(scope.enter()));
    ASSERT_FALSE(is_error(scope.exit()));

    auto after = scope.spawn(succeed, "late_task");
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "scope_not_open");
    EXPECT_EQ(scope.handle_count(), 0u);
}

TEST(TaskScopeTest, ExitTwiceIsInvalid) {
    EventBus bus;
    TaskScope scope("once", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));
    ASSERT_FALSE(is_error(scope.exit()));

    auto again = scope.exit();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "invalid_scope_state");

    auto reenter = scope.enter();
    ASSERT_TRUE(is_error(reenter));
    EXPECT_EQ(get_error(reenter).code, "invalid_scope_state");
}

TEST(TaskScopeTest, CompletedTaskIsUnaffectedByLaterCancel) {
    EventBus bus;
    TaskScope scope("commit", make_root(), bus);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* done = spawn_or_die(scope, succeed, "git_commit");
    ASSERT_EQ(scope.wait(*done), TaskState::Completed);
    scope.cancel("too late");

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(done->state(), TaskState::Completed);
    EXPECT_FALSE(done->error().has_value());
    EXPECT_EQ(get_value(result).completed, 1u);
    EXPECT_TRUE(get_value(result).cancelled);
}

TEST(TaskScopeTest, ParentTokenCancelsScope) {
    EventBus bus;
    CancelToken run_token;
    TaskScope scope("github_deploy", make_root(), bus, run_token);
    ASSERT_FALSE(is_error(scope.enter()));

    TaskHandle* handle = spawn_or_die(scope, wait_for_cancel, "git_push");
    run_token.request("SIGINT");

    auto result = scope.exit();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(handle->state(), TaskState::Cancelled);
    ASSERT_TRUE(handle->error().has_value());
    EXPECT_EQ(handle->error()->message, "stopped: SIGINT");
}

TEST(TaskScopeTest, FailureWinsOverCancellation) {
    EventBus bus;
    TaskScope scope("mixed", make_root(), bus);

    auto result = scope.run([](TaskScope& s) -> Status {
        auto spawned = s.spawn(wait_for_cancel, "waiting");
        if (is_error(spawned)) {
            return get_error(spawned);
        }
        s.cancel("user interrupt");
        return KeelError{ErrorCategory::Execution, "body failed", "body_failed"};
    });

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "body_failed");
}

TEST(TaskScopeTest, BodyCancellationIsAbsorbed) {
    EventBus bus;
    TaskScope scope("veto", make_root(), bus);

    auto result = scope.run([](TaskScope&) -> Status {
        return keel::core::errors::cancellation("vetoed by gateway");
    });

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).cancel_reason, "vetoed by gateway");
}

TEST(TaskScopeTest, DestroyingOpenScopeCancelsChildren) {
    EventBus bus;
    TaskHandle* handle = nullptr;
    std::atomic<bool> saw_cancel{false};
    {
        TaskScope scope("abandoned", make_root(), bus);
        ASSERT_FALSE(is_error(scope.enter()));
        handle = spawn_or_die(
            scope,
            [&saw_cancel](const Context& ctx, const CancelToken& token) -> Status {
                Status status = wait_for_cancel(ctx, token);
                saw_cancel = keel::core::errors::is_cancelled(status);
                return status;
            },
            "orphan");
        EXPECT_NE(handle, nullptr);
    }

    EXPECT_TRUE(saw_cancel.load());
    const auto events = bus.snapshot();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, event_types::kScopeExit);
    EXPECT_EQ(events.back().payload.at("signal"), "cancellation");
}

}  // namespace
