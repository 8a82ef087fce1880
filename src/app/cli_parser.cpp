#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <vector>
#include "handlers/permission_engine.hpp"

namespace acpbridge::app::cli {

    using namespace acpbridge::core::errors;
    using acpbridge::core::config::AdapterConfig;

    struct RawCliOptions {
        std::optional<std::string> prompt;
        std::optional<std::string> agent;
        std::vector<std::string> agent_args;
        std::optional<std::string> timeout;
        std::optional<std::string> permission_mode;
        std::vector<std::string> allow;
        std::optional<std::string> config_file;
        std::optional<std::string> cwd;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: acp_run run --prompt \"...\" [--agent CMD] [--agent-arg ARG]... "
               "[--timeout SECONDS] [--permission-mode MODE] [--allow PATTERN]... "
               "[--cwd DIR] [--config FILE] [--verbose]";
    }

    namespace {

        BridgeError missing_value(const std::string& flag) {
            return BridgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        std::string command = argv[1];
        if (command != "run") {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool has_value = i + 1 < args.size();
            if (flag == "--prompt") {
                if (!has_value) return missing_value(flag);
                raw.prompt = args[++i];
            } else if (flag == "--agent") {
                if (!has_value) return missing_value(flag);
                raw.agent = args[++i];
            } else if (flag == "--agent-arg") {
                if (!has_value) return missing_value(flag);
                raw.agent_args.push_back(args[++i]);
            } else if (flag == "--timeout") {
                if (!has_value) return missing_value(flag);
                raw.timeout = args[++i];
            } else if (flag == "--permission-mode") {
                if (!has_value) return missing_value(flag);
                raw.permission_mode = args[++i];
            } else if (flag == "--allow") {
                if (!has_value) return missing_value(flag);
                raw.allow.push_back(args[++i]);
            } else if (flag == "--cwd") {
                if (!has_value) return missing_value(flag);
                raw.cwd = args[++i];
            } else if (flag == "--config") {
                if (!has_value) return missing_value(flag);
                raw.config_file = args[++i];
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
        }

        if (!raw.prompt.has_value() || raw.prompt->empty()) {
            return BridgeError{ErrorCategory::Input, "Must provide --prompt", "missing_required_flag"};
        }

        AdapterConfig config;
        if (raw.config_file) {
            auto loaded = core::config::load_config_file(*raw.config_file, config);
            if (is_error(loaded)) return get_error(loaded);
            config = get_value(loaded);
        }

        auto with_env = core::config::apply_env_overrides(config);
        if (is_error(with_env)) return get_error(with_env);
        config = get_value(with_env);

        if (raw.agent) {
            if (raw.agent->empty()) {
                return BridgeError{ErrorCategory::Input, "--agent cannot be empty", "invalid_value"};
            }
            config.agent_command = *raw.agent;
        }
        if (!raw.agent_args.empty()) config.agent_args = raw.agent_args;
        if (!raw.allow.empty()) config.permission_allowlist = raw.allow;

        if (raw.timeout) {
            double seconds = 0.0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_number", "Provide a positive number of seconds."};
            }
            if (seconds <= 0.0) {
                return BridgeError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be greater than zero."};
            }
            config.timeout_seconds = seconds;
        }

        if (raw.permission_mode) config.permission_mode = *raw.permission_mode;
        try {
            static_cast<void>(handlers::parse_permission_mode(config.permission_mode));
        } catch (const std::invalid_argument& e) {
            return BridgeError{ErrorCategory::Input, e.what(), "invalid_permission_mode", "Use auto_approve, deny_all, allowlist or interactive."};
        }

        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return BridgeError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return BridgeError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            config.working_directory = std::move(canonical_path);
        }

        CliRequest request;
        request.config = std::move(config);
        request.prompt = *raw.prompt;
        request.verbose = raw.verbose;
        return request;
    }

} // namespace acpbridge::app::cli
