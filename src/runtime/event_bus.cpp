#include "runtime/event_bus.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace keel::runtime {

using protocol::Context;
using protocol::Event;

Event EventBus::emit(const std::string& type, nlohmann::json payload,
                     const Context& context) {
    Event event;
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.type = type;
        event.timestamp = std::chrono::system_clock::now();
        event.sequence = log_.size();
        event.trace_id = context.trace_id();
        event.span_id = context.span_id();
        event.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
        log_.push_back(event);

        auto typed = subscribers_.find(type);
        if (typed != subscribers_.end()) {
            handlers = typed->second;
        }
        auto any = subscribers_.find(protocol::event_types::kAny);
        if (any != subscribers_.end() && type != protocol::event_types::kAny) {
            handlers.insert(handlers.end(), any->second.begin(), any->second.end());
        }
    }

    KEEL_LOG_DEBUG("EVENT: " + type + " [span: " + event.span_id + "]");
    dispatch(handlers, event, context);
    return event;
}

void EventBus::dispatch(const std::vector<EventHandler>& handlers,
                        const Event& event, const Context& context) {
    for (const auto& handler : handlers) {
        std::string failure;
        try {
            auto status = handler(event, context);
            if (core::errors::is_error(status)) {
                const auto& err = core::errors::get_error(status);
                failure = "[" + err.code + "] " + err.message;
            }
        } catch (const std::exception& ex) {
            failure = std::string("threw: ") + ex.what();
        }

        if (failure.empty()) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++subscriber_failures_;
        }
        KEEL_LOG_WARN("EventBus: subscriber for '" + event.type + "' failed on span " +
                      event.span_id + ": " + failure);
    }
}

void EventBus::subscribe(const std::string& type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[type].push_back(std::move(handler));
}

std::vector<Event> EventBus::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

std::size_t EventBus::event_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}

std::vector<Event> EventBus::events_for_span(const std::string& span_prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> matches;
    for (const auto& event : log_) {
        if (protocol::span_descends_from(event.span_id, span_prefix)) {
            matches.push_back(event);
        }
    }
    return matches;
}

std::size_t EventBus::subscriber_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriber_failures_;
}

}  // namespace keel::runtime
