#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/keel_errors.hpp"
#include "protocol/context.hpp"
#include "protocol/event_contract.hpp"

namespace keel::runtime {

using EventHandler = std::function<core::errors::Status(
    const protocol::Event& event, const protocol::Context& context)>;

// Append-only event log plus a per-type subscriber registry.
//
// Appends are serialized, so the log order is the single ordering guarantee.
// Subscribers run on the emitting thread, outside the lock, in registration
// order; emit() does not return until all of them have run. A failing
// subscriber is logged and counted but never fails the emitter, and the
// remaining subscribers still run.
class EventBus {
public:
    protocol::Event emit(const std::string& type, nlohmann::json payload,
                         const protocol::Context& context);

    // Use protocol::event_types::kAny to receive every event. Wildcard
    // handlers run after the type-specific ones.
    void subscribe(const std::string& type, EventHandler handler);

    std::vector<protocol::Event> snapshot() const;
    std::size_t event_count() const;

    // Events whose span is `span_prefix` or descends from it.
    std::vector<protocol::Event> events_for_span(const std::string& span_prefix) const;

    std::size_t subscriber_failures() const;

private:
    void dispatch(const std::vector<EventHandler>& handlers,
                  const protocol::Event& event, const protocol::Context& context);

    mutable std::mutex mutex_;
    std::vector<protocol::Event> log_;
    std::unordered_map<std::string, std::vector<EventHandler>> subscribers_;
    std::size_t subscriber_failures_ = 0;
};

}  // namespace keel::runtime
