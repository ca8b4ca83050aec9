#include <filesystem>
#include <initializer_list>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "policy/validation_gateway.hpp"
#include "protocol/context.hpp"
#include "protocol/decision.hpp"

namespace {

using keel::core::errors::ErrorCategory;
using keel::policy::GatewayPolicy;
using keel::policy::ValidationGateway;
using keel::protocol::Allowed;
using keel::protocol::Context;
using keel::protocol::Decision;
using keel::protocol::ExecutionMode;
using keel::protocol::RejectionCategory;
using keel::protocol::Rejected;

Context make_context() {
    return Context::root("trace_gateway", ExecutionMode::Architect).derive_child("commit");
}

TEST(ValidationGatewayTest, RejectsSelfPreservationPattern) {
    ValidationGateway gateway;
    const Decision decision = gateway.validate("sudo rm -rf /", "cleanup", make_context());

    ASSERT_TRUE(std::holds_alternative<Rejected>(decision));
    const auto& rejected = std::get<Rejected>(decision);
    EXPECT_EQ(rejected.category, RejectionCategory::SelfPreservation);
    EXPECT_NE(rejected.reason.find("Operation rejected"), std::string::npos);

    const auto err = keel::protocol::to_error(rejected);
    EXPECT_EQ(err.category, ErrorCategory::Cancellation);
    EXPECT_EQ(err.code, "self_preservation_veto");
}

TEST(ValidationGatewayTest, MatchingIsCaseInsensitive) {
    ValidationGateway gateway;
    const Decision decision = gateway.validate("MKFS.ext4 /dev/sda1", "", make_context());
    EXPECT_FALSE(keel::protocol::is_allowed(decision));
}

TEST(ValidationGatewayTest, AdvisoryMarkersWarnButAllow) {
    ValidationGateway gateway;
    const Decision decision =
        gateway.validate("git push --force", "bypass review", make_context());

    ASSERT_TRUE(keel::protocol::is_allowed(decision));
    const auto& warnings = std::get<Allowed>(decision).warnings;
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], "elevated torsion: 'bypass'");
    EXPECT_EQ(warnings[1], "elevated torsion: 'force'");
}

TEST(ValidationGatewayTest, AlignmentMarkersInIntentWarn) {
    ValidationGateway gateway;
    const Decision decision =
        gateway.validate("git status", "Ignore previous guidance", make_context());

    ASSERT_TRUE(keel::protocol::is_allowed(decision));
    const auto& warnings = std::get<Allowed>(decision).warnings;
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "alignment marker: 'ignore previous'");
}

TEST(ValidationGatewayTest, PlainActionHasNoWarnings) {
    ValidationGateway gateway;
    const Decision decision = gateway.validate("git add .", "Deploy step: git add .", make_context());

    ASSERT_TRUE(keel::protocol::is_allowed(decision));
    EXPECT_TRUE(std::get<Allowed>(decision).warnings.empty());
}

TEST(ValidationGatewayTest, LongActionWarnsUnlessEcho) {
    GatewayPolicy policy;
    policy.complexity_limit = 10;
    ValidationGateway gateway(policy);

    const Decision long_action = gateway.validate("git commit -m 'long message'", "", make_context());
    ASSERT_TRUE(keel::protocol::is_allowed(long_action));
    ASSERT_EQ(std::get<Allowed>(long_action).warnings.size(), 1u);
    EXPECT_EQ(std::get<Allowed>(long_action).warnings[0], "complex action (28 chars)");

    const Decision echo = gateway.validate("echo 'a long line of output'", "", make_context());
    ASSERT_TRUE(keel::protocol::is_allowed(echo));
    EXPECT_TRUE(std::get<Allowed>(echo).warnings.empty());
}

TEST(ValidationGatewayTest, ComplexityEstimateAddsWarning) {
    ValidationGateway gateway;
    const Decision high = gateway.validate("implement_core", "Execute implement_core as Surgeon",
                                           0.8, make_context());
    const Decision low = gateway.validate("analyze_requirements",
                                          "Execute analyze_requirements as Student", 0.3,
                                          make_context());

    ASSERT_TRUE(keel::protocol::is_allowed(high));
    ASSERT_EQ(std::get<Allowed>(high).warnings.size(), 1u);
    EXPECT_NE(std::get<Allowed>(high).warnings[0].find("estimated complexity"), std::string::npos);
    ASSERT_TRUE(keel::protocol::is_allowed(low));
    EXPECT_TRUE(std::get<Allowed>(low).warnings.empty());
}

TEST(ValidationGatewayTest, DecisionIsDeterministic) {
    ValidationGateway gateway;
    const Context ctx = make_context();
    for (int i = 0; i < 3; ++i) {
        const Decision decision = gateway.validate("delete --force backups", "hack", ctx);
        ASSERT_TRUE(std::holds_alternative<Rejected>(decision));
        EXPECT_EQ(std::get<Rejected>(decision).reason,
                  "Action would harm system integrity (matched 'delete --force'). "
                  "Operation rejected.");
    }
}

TEST(ValidationGatewayTest, CustomPolicyReplacesDefaults) {
    GatewayPolicy policy;
    policy.self_preservation = {"drop table"};
    policy.advisory.clear();
    ValidationGateway gateway(policy);

    EXPECT_TRUE(keel::protocol::is_allowed(gateway.validate("sudo rm -rf /tmp/x", "", make_context())));
    EXPECT_FALSE(keel::protocol::is_allowed(gateway.validate("DROP TABLE users", "", make_context())));
}

TEST(ValidationGatewayTest, AllowsWorkingDirectoryInsideRepository) {
    ValidationGateway gateway;
    const std::filesystem::path repo = "/srv/app";

    EXPECT_TRUE(keel::protocol::is_allowed(gateway.check_working_directory(repo, ".", make_context())));
    EXPECT_TRUE(keel::protocol::is_allowed(gateway.check_working_directory(repo, "services/api", make_context())));
    EXPECT_TRUE(keel::protocol::is_allowed(gateway.check_working_directory(repo, "docs/../web", make_context())));
    EXPECT_TRUE(keel::protocol::is_allowed(gateway.check_working_directory(repo, "/srv/app/web", make_context())));
}

TEST(ValidationGatewayTest, RejectsWorkingDirectoryOutsideRepository) {
    ValidationGateway gateway;
    const std::filesystem::path repo = "/srv/app";

    for (const char* escape : {"..", "../other", "web/../../other", "/srv/application", "/etc"}) {
        const Decision decision = gateway.check_working_directory(repo, escape, make_context());
        ASSERT_TRUE(std::holds_alternative<Rejected>(decision)) << escape;
        const auto& rejected = std::get<Rejected>(decision);
        EXPECT_EQ(rejected.category, RejectionCategory::PolicyOther);
        EXPECT_NE(rejected.reason.find(escape), std::string::npos);
    }
}

TEST(ValidationGatewayTest, EscapingWorkingDirectoryIsPolicyFailure) {
    ValidationGateway gateway;
    const Decision decision = gateway.check_working_directory("/srv/app", "../other", make_context());
    ASSERT_TRUE(std::holds_alternative<Rejected>(decision));

    const auto error = keel::protocol::to_error(std::get<Rejected>(decision));
    EXPECT_EQ(error.category, ErrorCategory::Policy);
    EXPECT_EQ(error.code, "policy_rejected");
}

}  // namespace
