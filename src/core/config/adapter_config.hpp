#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::core::config {

    // Everything needed to launch and drive one ACP agent.
    struct AdapterConfig {
        std::string agent_command = "gemini";
        std::vector<std::string> agent_args;
        double timeout_seconds = 300.0;
        std::string permission_mode = "auto_approve";
        std::vector<std::string> permission_allowlist;
        std::optional<std::filesystem::path> working_directory;
    };

    // Unknown keys are ignored; a key of the wrong type is an Input error.
    errors::Result<AdapterConfig> config_from_json(const nlohmann::json& document,
                                                   AdapterConfig base = {});

    errors::Result<AdapterConfig> load_config_file(const std::filesystem::path& path,
                                                   AdapterConfig base = {});

    // ACPBRIDGE_AGENT_COMMAND, ACPBRIDGE_TIMEOUT, ACPBRIDGE_PERMISSION_MODE.
    errors::Result<AdapterConfig> apply_env_overrides(AdapterConfig config);

    nlohmann::json config_to_json(const AdapterConfig& config);

} // namespace acpbridge::core::config
