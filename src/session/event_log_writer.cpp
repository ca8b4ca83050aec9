#include "session/event_log_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace keel::session {

using core::errors::ErrorCategory;
using core::errors::KeelError;
using nlohmann::json;

namespace {

// Payloads carry raw child stderr, which need not be UTF-8.
std::string to_line(const json& record) {
    return record.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

EventLogWriter::EventLogWriter(std::filesystem::path artifact_dir)
    : artifact_dir_(std::move(artifact_dir)) {}

void EventLogWriter::attach(runtime::EventBus& bus) {
    bus.subscribe(protocol::event_types::kAny,
                  [this](const protocol::Event& event,
                         const protocol::Context&) -> core::errors::Status {
                      auto written = append(event);
                      if (core::errors::is_error(written)) {
                          return core::errors::get_error(written);
                      }
                      return core::errors::ok();
                  });
}

core::errors::Result<std::filesystem::path> EventLogWriter::log_path(
    const std::string& trace_id) const {
    if (trace_id.empty()) {
        return KeelError{ErrorCategory::Input, "Trace ID cannot be empty.",
                         "invalid_trace_id"};
    }
    if (artifact_dir_.empty()) {
        return KeelError{ErrorCategory::Input, "Artifact directory is not configured.",
                         "invalid_artifact_dir"};
    }

    std::error_code ec;
    std::filesystem::create_directories(artifact_dir_, ec);
    if (ec) {
        return KeelError{ErrorCategory::Internal,
                         "Unable to create artifacts directory: " +
                             artifact_dir_.string(),
                         "artifact_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(artifact_dir_, ec) || ec) {
        return KeelError{ErrorCategory::Input,
                         "Artifact path is not a directory: " + artifact_dir_.string(),
                         "invalid_artifact_dir"};
    }

    return artifact_dir_ / (trace_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> EventLogWriter::append_line(
    const std::string& trace_id, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = log_path(trace_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return KeelError{ErrorCategory::Internal,
                         "Unable to open event log: " + path.string(),
                         "artifact_open_failed"};
    }

    out << line << "\n";
    if (!out.good()) {
        return KeelError{ErrorCategory::Internal,
                         "Unable to write event log: " + path.string(),
                         "artifact_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> EventLogWriter::append(
    const protocol::Event& event) {
    return append_line(event.trace_id, to_line(protocol::event_to_json(event)));
}

core::errors::Result<std::filesystem::path> EventLogWriter::write_summary(
    const protocol::RunSummary& summary) {
    json phases = json::array();
    for (const auto& phase : summary.phases) {
        phases.push_back({{"name", phase.name},
                          {"span_id", phase.span_id},
                          {"cancelled", phase.cancelled},
                          {"completed", phase.completed},
                          {"cancelled_tasks", phase.cancelled_tasks},
                          {"failed", phase.failed}});
    }

    json record;
    record["type"] = "run.summary";
    record["trace_id"] = summary.trace_id;
    record["status"] = protocol::to_string(summary.status);
    record["reason"] = summary.reason;
    record["events_emitted"] = summary.events_emitted;
    record["phases_completed"] = summary.phases_completed;
    record["phases"] = phases;
    return append_line(summary.trace_id, to_line(record));
}

}  // namespace keel::session
