#pragma once

#include <map>
#include <optional>
#include <string>

namespace keel::protocol {

// Execution mode tag carried by every context in a run.
enum class ExecutionMode {
    Firefighter,  // Emergency, fast execution
    Surgeon,      // Precise, minimal changes
    Architect,    // Systematic, complete
    Student,      // Exploratory
    Manager       // Strategic overview
};

std::string to_string(ExecutionMode mode);
std::optional<ExecutionMode> parse_execution_mode(const std::string& text);

using Metadata = std::map<std::string, std::string>;

// Immutable point in the causal tree of a run. Copies are cheap and share
// nothing, so sibling tasks never observe each other's context.
class Context {
public:
    static constexpr const char* kRootSpan = "root";
    static constexpr const char* kParentSpanKey = "parent_span";

    static Context root(std::string trace_id, ExecutionMode mode,
                        Metadata metadata = {});

    // Child for a named sub-operation. Same trace id, span extended with
    // ".<operation_name>", metadata gains parent_span. Sibling names must be
    // unique within one scope; that is not checked here.
    Context derive_child(const std::string& operation_name) const;

    // True when this context sits strictly below `ancestor` in the same trace.
    bool is_descendant_of(const Context& ancestor) const;

    const std::string& trace_id() const { return trace_id_; }
    const std::string& span_id() const { return span_id_; }
    ExecutionMode mode() const { return mode_; }
    const Metadata& metadata() const { return metadata_; }

private:
    Context(std::string trace_id, std::string span_id, ExecutionMode mode,
            Metadata metadata);

    std::string trace_id_;
    std::string span_id_;
    ExecutionMode mode_;
    Metadata metadata_;
};

// Dotted-path ancestry test on raw span ids.
bool span_descends_from(const std::string& span, const std::string& ancestor_span);

}  // namespace keel::protocol
