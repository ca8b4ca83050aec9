#include "protocol/context.hpp"

#include <utility>

namespace keel::protocol {

std::string to_string(const ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Firefighter:
            return "firefighter";
        case ExecutionMode::Surgeon:
            return "surgeon";
        case ExecutionMode::Architect:
            return "architect";
        case ExecutionMode::Student:
            return "student";
        case ExecutionMode::Manager:
            return "manager";
        default:
            return "unknown";
    }
}

std::optional<ExecutionMode> parse_execution_mode(const std::string& text) {
    if (text == "firefighter") {
        return ExecutionMode::Firefighter;
    }
    if (text == "surgeon") {
        return ExecutionMode::Surgeon;
    }
    if (text == "architect") {
        return ExecutionMode::Architect;
    }
    if (text == "student") {
        return ExecutionMode::Student;
    }
    if (text == "manager") {
        return ExecutionMode::Manager;
    }
    return std::nullopt;
}

Context::Context(std::string trace_id, std::string span_id,
                 const ExecutionMode mode, Metadata metadata)
    : trace_id_(std::move(trace_id)),
      span_id_(std::move(span_id)),
      mode_(mode),
      metadata_(std::move(metadata)) {}

Context Context::root(std::string trace_id, const ExecutionMode mode,
                      Metadata metadata) {
    return Context(std::move(trace_id), kRootSpan, mode, std::move(metadata));
}

Context Context::derive_child(const std::string& operation_name) const {
    Metadata child_metadata = metadata_;
    child_metadata[kParentSpanKey] = span_id_;
    return Context(trace_id_, span_id_ + "." + operation_name, mode_,
                   std::move(child_metadata));
}

bool Context::is_descendant_of(const Context& ancestor) const {
    return trace_id_ == ancestor.trace_id_ &&
           span_descends_from(span_id_, ancestor.span_id_) &&
           span_id_ != ancestor.span_id_;
}

bool span_descends_from(const std::string& span, const std::string& ancestor_span) {
    if (span.size() < ancestor_span.size()) {
        return false;
    }
    if (span.compare(0, ancestor_span.size(), ancestor_span) != 0) {
        return false;
    }
    return span.size() == ancestor_span.size() || span[ancestor_span.size()] == '.';
}

}  // namespace keel::protocol
