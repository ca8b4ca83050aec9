#include "policy/validation_gateway.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"

namespace keel::policy {

using protocol::Allowed;
using protocol::Context;
using protocol::Decision;
using protocol::RejectionCategory;
using protocol::Rejected;

ValidationGateway::ValidationGateway(GatewayPolicy policy)
    : policy_(std::move(policy)) {}

std::string ValidationGateway::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool ValidationGateway::contains_pattern(const std::string& lowered_text,
                                         const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    return lowered_text.find(lowercase(pattern)) != std::string::npos;
}

Decision ValidationGateway::validate(const std::string& action,
                                     const std::string& intent,
                                     const Context& context) const {
    const std::string lowered_action = lowercase(action);
    for (const auto& pattern : policy_.self_preservation) {
        if (!contains_pattern(lowered_action, pattern)) {
            continue;
        }
        KEEL_LOG_WARN("ValidationGateway: self-preservation veto on span " +
                      context.span_id() + " (pattern '" + pattern + "')");
        return Rejected{RejectionCategory::SelfPreservation,
                        "Action would harm system integrity (matched '" + pattern +
                            "'). Operation rejected."};
    }

    Allowed allowed;
    const std::string lowered_intent = lowercase(intent);
    for (const auto& marker : policy_.advisory) {
        if (contains_pattern(lowered_action, marker) ||
            contains_pattern(lowered_intent, marker)) {
            allowed.warnings.push_back("elevated torsion: '" + marker + "'");
        }
    }
    for (const auto& marker : policy_.alignment) {
        if (contains_pattern(lowered_action, marker) ||
            contains_pattern(lowered_intent, marker)) {
            allowed.warnings.push_back("alignment marker: '" + marker + "'");
        }
    }
    if (action.size() > policy_.complexity_limit &&
        lowered_action.find("echo") == std::string::npos) {
        allowed.warnings.push_back("complex action (" + std::to_string(action.size()) +
                                   " chars)");
    }

    for (const auto& warning : allowed.warnings) {
        KEEL_LOG_WARN("ValidationGateway: " + warning + " on span " +
                      context.span_id() + ", proceeding with caution");
    }
    return allowed;
}

Decision ValidationGateway::validate(const std::string& action,
                                     const std::string& intent,
                                     const double estimated_complexity,
                                     const Context& context) const {
    Decision decision = validate(action, intent, context);
    auto* allowed = std::get_if<Allowed>(&decision);
    if (allowed != nullptr &&
        estimated_complexity > policy_.complexity_warning_threshold) {
        allowed->warnings.push_back("estimated complexity " +
                                    std::to_string(estimated_complexity) +
                                    " above threshold");
        KEEL_LOG_WARN("ValidationGateway: high estimated complexity on span " +
                      context.span_id());
    }
    return decision;
}

Decision ValidationGateway::check_working_directory(
    const std::filesystem::path& repo_root,
    const std::filesystem::path& working_directory,
    const Context& context) const {
    const std::filesystem::path root = repo_root.lexically_normal();
    const std::filesystem::path target =
        (working_directory.is_absolute() ? working_directory : root / working_directory)
            .lexically_normal();

    // Symlinks are not resolved; the runner still has to find the directory.
    const std::filesystem::path relative = target.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        KEEL_LOG_WARN("ValidationGateway: working directory " + target.string() +
                      " leaves " + root.string() + " on span " + context.span_id());
        return Rejected{RejectionCategory::PolicyOther,
                        "Working directory escapes the repository: " +
                            working_directory.string()};
    }
    return Allowed{};
}

}  // namespace keel::policy
