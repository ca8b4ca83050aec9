#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/keel_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_summary.hpp"
#include "runtime/event_bus.hpp"

namespace keel::session {

// Event-sink subscriber that mirrors a run's events into
// <artifact_dir>/<trace_id>.jsonl, one JSON object per line.
class EventLogWriter {
public:
    explicit EventLogWriter(std::filesystem::path artifact_dir);

    // Subscribes to every event on `bus`. The writer must outlive the bus.
    void attach(runtime::EventBus& bus);

    core::errors::Result<std::filesystem::path> append(const protocol::Event& event);

    core::errors::Result<std::filesystem::path> write_summary(
        const protocol::RunSummary& summary);

    core::errors::Result<std::filesystem::path> log_path(const std::string& trace_id) const;

private:
    core::errors::Result<std::filesystem::path> append_line(const std::string& trace_id,
                                                            const std::string& line);

    std::filesystem::path artifact_dir_;
    std::mutex mutex_;
};

}  // namespace keel::session
