#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/keel_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/validation_gateway.hpp"
#include "protocol/context.hpp"

namespace keel::core::config {

struct EngineConfig {
    std::filesystem::path repo_path = std::filesystem::current_path();
    std::optional<std::string> remote_url;
    protocol::ExecutionMode mode = protocol::ExecutionMode::Architect;
    std::uint32_t command_timeout_ms = 300000;
    std::filesystem::path artifact_dir = ".keel_runs";  // Empty disables the JSONL log
    logging::LogLevel log_level = logging::LogLevel::INFO;
    policy::GatewayPolicy policy;
};

// Overlays the keys present in `document` onto `base`. Unknown keys are
// ignored; a known key with the wrong type is an invalid_config error.
errors::Result<EngineConfig> apply_config_json(const nlohmann::json& document,
                                               EngineConfig base = {});

errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base = {});

}  // namespace keel::core::config
