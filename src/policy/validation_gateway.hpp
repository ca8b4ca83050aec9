#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "protocol/context.hpp"
#include "protocol/decision.hpp"

namespace keel::policy {

// Pattern tables are configuration data. Matching is a case-insensitive
// substring test.
struct GatewayPolicy {
    // Hard veto: actions that would damage the system's own integrity.
    std::vector<std::string> self_preservation = {
        "rm -rf /",
        "sudo rm",
        "delete --force",
        ":(){:|:&};:",
        ":(){ :|:& };:",
        "mkfs",
        "dd if=/dev/zero of=/dev/",
        "delete safety",
        "disable heart",
        "remove validation",
        "shutdown sovereign",
        "bypass alignment",
        "ignore love",
        "remove heart",
        "disable conscience"};

    // Advisory only, checked against action and intent.
    std::vector<std::string> advisory = {"hack", "bypass", "force"};

    // Advisory only: attempts to talk the system out of its baseline.
    std::vector<std::string> alignment = {
        "ignore previous",
        "disregard safety",
        "jailbreak",
        "pretend",
        "roleplay bypass",
        "forget rules"};

    // Actions longer than this (and not a plain echo) draw a warning.
    std::size_t complexity_limit = 1000;

    // Planner estimates above this draw a warning.
    double complexity_warning_threshold = 0.5;
};

class ValidationGateway {
public:
    explicit ValidationGateway(GatewayPolicy policy = {});

    // Only a self-preservation match rejects. Every other check attaches a
    // warning to the Allowed decision.
    protocol::Decision validate(const std::string& action,
                                const std::string& intent,
                                const protocol::Context& context) const;

    // Same protocol with the planner's complexity estimate as an extra
    // advisory input.
    protocol::Decision validate(const std::string& action,
                                const std::string& intent,
                                double estimated_complexity,
                                const protocol::Context& context) const;

    // Lexical containment check for the directory an action runs in. A
    // working directory that leaves `repo_root` is rejected as PolicyOther.
    protocol::Decision check_working_directory(const std::filesystem::path& repo_root,
                                               const std::filesystem::path& working_directory,
                                               const protocol::Context& context) const;

    const GatewayPolicy& policy() const { return policy_; }

private:
    static std::string lowercase(std::string value);
    static bool contains_pattern(const std::string& lowered_text,
                                 const std::string& pattern);

    GatewayPolicy policy_;
};

}  // namespace keel::policy
