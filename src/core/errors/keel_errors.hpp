#pragma once
#include <string>
#include <utility>
#include <variant>

namespace keel::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,        // E.g., bad CLI flag or malformed config file
        Execution,    // E.g., a shell action exited non-zero
        Policy,       // E.g., a gateway veto outside the self-preservation set
        Cancellation, // Cooperative stop request. Not a failure.
        Internal      // E.g., fork/pipe failure or a logic bug
    };

    // The standardized error payload
    struct KeelError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
            std::string task = "";  // Set when a task failure is surfaced to its scope
            std::string span = "";
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a KeelError.
    template <typename T>
    using Result = std::variant<T, KeelError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<KeelError>(result);
    }

    template <typename T>
    const KeelError& get_error(const Result<T>& result) {
        return std::get<KeelError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline bool is_cancellation(const KeelError& error) {
        return error.category == ErrorCategory::Cancellation;
    }

    template <typename T>
    bool is_cancelled(const Result<T>& result) {
        return is_error(result) && is_cancellation(get_error(result));
    }

    inline KeelError cancellation(std::string message,
                                  std::string code = "cancelled") {
        return KeelError{ErrorCategory::Cancellation, std::move(message),
                         std::move(code)};
    }

    // Attaches the failing task's identity before the error reaches its scope.
    inline KeelError wrap_task_error(KeelError error, const std::string& task,
                                     const std::string& span) {
        if (error.task.empty()) {
            error.task = task;
            error.span = span;
            error.message = "task '" + task + "' [" + span + "]: " + error.message;
        }
        return error;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Execution:    return "execution";
            case ErrorCategory::Policy:       return "policy";
            case ErrorCategory::Cancellation: return "cancellation";
            case ErrorCategory::Internal:     return "internal";
            default: return "unknown";
        }
    }

} // namespace keel::core::errors
