#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace keel::protocol {

    // One externally visible action a task body asks the runner to perform.
    struct ActionRequest {
        std::string command;
        std::string intent;                                 // Why, for the gateway
        std::filesystem::path working_directory = ".";      // Relative to the workspace
        std::uint32_t timeout_ms = 300000;
    };

    // How the runner replies when the action succeeded.
    struct ActionOutput {
        std::string output;         // stdout
        std::string error_output;   // stderr
        int exit_code = 0;
        double duration_ms = 0.0;
    };

} // namespace keel::protocol
