#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace keel::app::cli {

    using namespace keel::core::errors;
    using keel::core::config::EngineConfig;

    // 1. Raw options (internal only)
    struct RawCliOptions {
        std::optional<std::string> repo;
        std::optional<std::string> remote;
        std::optional<std::string> mode;
        std::optional<std::string> config_file;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> artifact_dir;
        std::optional<std::string> goal;
        bool verbose = false;
    };

    namespace {

    const char* kUsage =
        "Usage: keel deploy [--repo DIR] [--remote URL] [--mode NAME] [--config FILE] "
        "[--timeout-ms N] [--artifact-dir DIR] [--verbose]\n"
        "       keel plan --goal \"...\" [--mode NAME] [--verbose]";

    Result<std::filesystem::path> validate_directory(const std::string& raw) {
        std::filesystem::path p(raw);
        std::error_code path_ec;
        const bool exists = std::filesystem::exists(p, path_ec);
        if (path_ec || !exists) {
            return KeelError{ErrorCategory::Input, "Repository directory does not exist or is not a directory", "invalid_path"};
        }

        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return KeelError{ErrorCategory::Input, "Repository directory does not exist or is not a directory", "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return KeelError{ErrorCategory::Input, "Failed to canonicalize repository directory", "invalid_path"};
        }
        return canonical_path;
    }

    } // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return KeelError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliCommand cmd;
        std::string command = argv[1];
        if (command == "deploy") {
            cmd.kind = CommandKind::Deploy;
        } else if (command == "plan") {
            cmd.kind = CommandKind::Plan;
        } else {
            return KeelError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser phase: just read the raw strings
        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* slot = nullptr;
            if (flag == "--repo") slot = &raw.repo;
            else if (flag == "--remote") slot = &raw.remote;
            else if (flag == "--mode") slot = &raw.mode;
            else if (flag == "--config") slot = &raw.config_file;
            else if (flag == "--timeout-ms") slot = &raw.timeout_ms;
            else if (flag == "--artifact-dir") slot = &raw.artifact_dir;
            else if (flag == "--goal") slot = &raw.goal;
            else if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return KeelError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (!take_value(i, *slot)) {
                return KeelError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator phase: config file first, flags override it
        cmd.verbose = raw.verbose;

        if (cmd.kind == CommandKind::Plan) {
            if (!raw.goal.has_value() || raw.goal->empty()) {
                return KeelError{ErrorCategory::Input, "plan requires --goal", "missing_required_flag"};
            }
            if (raw.repo || raw.remote || raw.timeout_ms) {
                return KeelError{ErrorCategory::Input, "--repo, --remote and --timeout-ms only apply to deploy", "conflicting_flags"};
            }
            cmd.goal = raw.goal.value();
        } else if (raw.goal.has_value()) {
            return KeelError{ErrorCategory::Input, "--goal only applies to plan", "conflicting_flags"};
        }

        EngineConfig config;
        if (raw.config_file) {
            auto loaded = core::config::load_config_file(raw.config_file.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            config = get_value(loaded);
        }

        if (raw.mode) {
            auto mode = protocol::parse_execution_mode(raw.mode.value());
            if (!mode.has_value()) {
                return KeelError{ErrorCategory::Input, "Unknown mode: " + raw.mode.value(), "invalid_mode",
                                 "One of firefighter, surgeon, architect, student, manager."};
            }
            config.mode = mode.value();
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return KeelError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0) {
                return KeelError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be at least 1."};
            }
            config.command_timeout_ms = timeout;
        }

        if (raw.remote) config.remote_url = raw.remote.value();
        if (raw.artifact_dir) config.artifact_dir = raw.artifact_dir.value();
        if (raw.verbose) config.log_level = core::logging::LogLevel::DEBUG;

        // Path validation applies to the file value too.
        const std::string repo_raw = raw.repo ? raw.repo.value() : config.repo_path.string();
        auto repo = validate_directory(repo_raw);
        if (is_error(repo)) {
            return get_error(repo);
        }
        config.repo_path = get_value(repo);

        cmd.config = std::move(config);
        return cmd;
    }

} // namespace keel::app::cli
