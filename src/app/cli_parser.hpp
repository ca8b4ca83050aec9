#pragma once
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/keel_errors.hpp"

namespace keel::app::cli {

    enum class CommandKind {
        Deploy,
        Plan
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Deploy;
        core::config::EngineConfig config;
        std::string goal;   // plan only
        bool verbose = false;
    };

    keel::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

} // namespace keel::app::cli
