#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace keel::protocol {

    // Lifecycle event tags emitted by the scope machinery. Task bodies may
    // emit their own domain tags next to these.
    namespace event_types {
        inline constexpr const char* kScopeEnter = "scope.enter";
        inline constexpr const char* kScopeExit = "scope.exit";
        inline constexpr const char* kTaskStart = "task.start";
        inline constexpr const char* kTaskComplete = "task.complete";
        inline constexpr const char* kTaskCancelled = "task.cancelled";
        inline constexpr const char* kTaskError = "task.error";

        inline constexpr const char* kActionValidated = "action.validated";
        inline constexpr const char* kActionWarning = "action.warning";
        inline constexpr const char* kActionRejected = "action.rejected";
        inline constexpr const char* kMetaAnalysis = "meta.analysis";
        inline constexpr const char* kRunStart = "run.start";
        inline constexpr const char* kRunEnd = "run.end";

        inline constexpr const char* kAgentPlan = "agent.plan";
        inline constexpr const char* kAgentValidated = "agent.validated";
        inline constexpr const char* kAgentRejected = "agent.rejected";
        inline constexpr const char* kAgentExecute = "agent.execute";
        inline constexpr const char* kAgentComplete = "agent.complete";
        inline constexpr const char* kPlanDone = "plan.done";

        // Subscribing with this tag receives every event.
        inline constexpr const char* kAny = "*";
    } // namespace event_types

    // Immutable record appended to the event bus. The payload is an open
    // JSON object; everything above it is typed.
    struct Event {
        std::string type;
        std::chrono::system_clock::time_point timestamp;
        std::uint64_t sequence = 0;  // Append index in the bus log
        std::string trace_id;
        std::string span_id;
        nlohmann::json payload = nlohmann::json::object();
    };

    std::string format_timestamp(std::chrono::system_clock::time_point timestamp);
    nlohmann::json event_to_json(const Event& event);

} // namespace keel::protocol
