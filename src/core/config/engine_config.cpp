#include "core/config/engine_config.hpp"

#include <fstream>
#include <limits>
#include <utility>
#include <vector>

namespace keel::core::config {

using errors::ErrorCategory;
using errors::KeelError;
using nlohmann::json;

namespace {

KeelError invalid(const std::string& key, const std::string& expected) {
    return KeelError{ErrorCategory::Input,
                     "Config key '" + key + "' must be " + expected + ".",
                     "invalid_config"};
}

std::optional<KeelError> read_string_list(const json& document, const std::string& key,
                                          std::vector<std::string>& out) {
    if (!document.contains(key)) {
        return std::nullopt;
    }
    const json& value = document.at(key);
    if (!value.is_array()) {
        return invalid(key, "an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid(key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return std::nullopt;
}

std::optional<KeelError> apply_policy(const json& document, policy::GatewayPolicy& policy) {
    if (!document.is_object()) {
        return invalid("policy", "an object");
    }
    if (auto err = read_string_list(document, "self_preservation", policy.self_preservation)) {
        return err;
    }
    if (auto err = read_string_list(document, "advisory", policy.advisory)) {
        return err;
    }
    if (auto err = read_string_list(document, "alignment", policy.alignment)) {
        return err;
    }
    if (document.contains("complexity_limit")) {
        const json& value = document.at("complexity_limit");
        if (!value.is_number_unsigned()) {
            return invalid("policy.complexity_limit", "a non-negative integer");
        }
        policy.complexity_limit = value.get<std::size_t>();
    }
    if (document.contains("complexity_warning_threshold")) {
        const json& value = document.at("complexity_warning_threshold");
        if (!value.is_number()) {
            return invalid("policy.complexity_warning_threshold", "a number");
        }
        policy.complexity_warning_threshold = value.get<double>();
    }
    return std::nullopt;
}

}  // namespace

errors::Result<EngineConfig> apply_config_json(const json& document, EngineConfig base) {
    if (!document.is_object()) {
        return KeelError{ErrorCategory::Input, "Config document must be a JSON object.",
                         "invalid_config"};
    }

    if (document.contains("repo_path")) {
        const json& value = document.at("repo_path");
        if (!value.is_string()) {
            return invalid("repo_path", "a string");
        }
        base.repo_path = value.get<std::string>();
    }
    if (document.contains("remote_url")) {
        const json& value = document.at("remote_url");
        if (value.is_null()) {
            base.remote_url.reset();
        } else if (value.is_string()) {
            base.remote_url = value.get<std::string>();
        } else {
            return invalid("remote_url", "a string or null");
        }
    }
    if (document.contains("mode")) {
        const json& value = document.at("mode");
        if (!value.is_string()) {
            return invalid("mode", "a string");
        }
        auto mode = protocol::parse_execution_mode(value.get<std::string>());
        if (!mode.has_value()) {
            return KeelError{ErrorCategory::Input,
                             "Unknown execution mode: " + value.get<std::string>(),
                             "invalid_config",
                             "One of firefighter, surgeon, architect, student, manager."};
        }
        base.mode = mode.value();
    }
    if (document.contains("command_timeout_ms")) {
        const json& value = document.at("command_timeout_ms");
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0 ||
            value.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            return invalid("command_timeout_ms", "a positive integer");
        }
        base.command_timeout_ms = value.get<std::uint32_t>();
    }
    if (document.contains("artifact_dir")) {
        const json& value = document.at("artifact_dir");
        if (!value.is_string()) {
            return invalid("artifact_dir", "a string");
        }
        base.artifact_dir = value.get<std::string>();
    }
    if (document.contains("log_level")) {
        const json& value = document.at("log_level");
        logging::LogLevel level = logging::LogLevel::INFO;
        if (!value.is_string() || !logging::parse_log_level(value.get<std::string>(), level)) {
            return invalid("log_level", "one of debug, info, warn, error");
        }
        base.log_level = level;
    }
    if (document.contains("policy")) {
        if (auto err = apply_policy(document.at("policy"), base.policy)) {
            return *err;
        }
    }
    return base;
}

errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return KeelError{ErrorCategory::Input,
                         "Unable to open config file: " + path.string(),
                         "config_not_found"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return KeelError{ErrorCategory::Input,
                         "Config file is not valid JSON: " + path.string(),
                         "invalid_config"};
    }
    return apply_config_json(document, std::move(base));
}

}  // namespace keel::core::config
