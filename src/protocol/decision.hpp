#pragma once

#include <string>
#include <variant>
#include <vector>
#include "core/errors/keel_errors.hpp"

namespace keel::protocol {

enum class RejectionCategory {
    SelfPreservation,  // Converts into cancellation at the call site
    PolicyOther        // Converts into an ordinary policy error
};

// Advisory warnings ride along with an allowed action. They never block.
struct Allowed {
    std::vector<std::string> warnings;
};

struct Rejected {
    RejectionCategory category;
    std::string reason;
};

using Decision = std::variant<Allowed, Rejected>;

inline bool is_allowed(const Decision& decision) {
    return std::holds_alternative<Allowed>(decision);
}

inline std::string to_string(const RejectionCategory category) {
    switch (category) {
        case RejectionCategory::SelfPreservation:
            return "self_preservation";
        case RejectionCategory::PolicyOther:
            return "policy_other";
        default:
            return "unknown";
    }
}

// Error a caller raises for a rejected decision: self-preservation vetoes
// become cancellation, anything else a policy failure.
inline core::errors::KeelError to_error(const Rejected& rejected) {
    if (rejected.category == RejectionCategory::SelfPreservation) {
        return core::errors::cancellation(rejected.reason, "self_preservation_veto");
    }
    return core::errors::KeelError{core::errors::ErrorCategory::Policy,
                                   rejected.reason, "policy_rejected"};
}

}  // namespace keel::protocol
