#include "core/config/adapter_config.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace acpbridge::core::config {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError config_error(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, "invalid_config",
                       "Check the adapter configuration file."};
}

bool read_string_list(const json& value, std::vector<std::string>& out) {
    if (!value.is_array()) {
        return false;
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
        items.push_back(item.get<std::string>());
    }
    out = std::move(items);
    return true;
}

bool parse_seconds(const std::string& text, double& seconds) {
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || parsed <= 0) {
        return false;
    }
    seconds = parsed;
    return true;
}

}  // namespace

errors::Result<AdapterConfig> config_from_json(const json& document, AdapterConfig base) {
    if (!document.is_object()) {
        return config_error("Adapter configuration must be a JSON object.");
    }

    AdapterConfig config = std::move(base);
    if (document.contains("agent_command")) {
        const json& value = document.at("agent_command");
        if (!value.is_string() || value.get<std::string>().empty()) {
            return config_error("agent_command must be a non-empty string.");
        }
        config.agent_command = value.get<std::string>();
    }
    if (document.contains("agent_args") &&
        !read_string_list(document.at("agent_args"), config.agent_args)) {
        return config_error("agent_args must be a list of strings.");
    }
    if (document.contains("timeout")) {
        const json& value = document.at("timeout");
        if (!value.is_number() || value.get<double>() <= 0) {
            return config_error("timeout must be a positive number of seconds.");
        }
        config.timeout_seconds = value.get<double>();
    }
    if (document.contains("permission_mode")) {
        const json& value = document.at("permission_mode");
        if (!value.is_string()) {
            return config_error("permission_mode must be a string.");
        }
        config.permission_mode = value.get<std::string>();
    }
    if (document.contains("permission_allowlist") &&
        !read_string_list(document.at("permission_allowlist"),
                          config.permission_allowlist)) {
        return config_error("permission_allowlist must be a list of strings.");
    }
    if (document.contains("working_directory")) {
        const json& value = document.at("working_directory");
        if (!value.is_string()) {
            return config_error("working_directory must be a string.");
        }
        config.working_directory = std::filesystem::path(value.get<std::string>());
    }
    return config;
}

errors::Result<AdapterConfig> load_config_file(const std::filesystem::path& path,
                                               AdapterConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to open config file: " + path.string(),
                           "config_not_found"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return config_error("Config file is not valid JSON: " + path.string());
    }
    return config_from_json(document, std::move(base));
}

errors::Result<AdapterConfig> apply_env_overrides(AdapterConfig config) {
    if (const char* command = std::getenv("ACPBRIDGE_AGENT_COMMAND")) {
        if (*command != '\0') {
            config.agent_command = command;
        }
    }
    if (const char* timeout = std::getenv("ACPBRIDGE_TIMEOUT")) {
        if (!parse_seconds(timeout, config.timeout_seconds)) {
            return config_error("ACPBRIDGE_TIMEOUT must be a positive number.");
        }
    }
    if (const char* mode = std::getenv("ACPBRIDGE_PERMISSION_MODE")) {
        if (*mode != '\0') {
            config.permission_mode = mode;
        }
    }
    return config;
}

json config_to_json(const AdapterConfig& config) {
    json payload;
    payload["agent_command"] = config.agent_command;
    payload["agent_args"] = config.agent_args;
    payload["timeout"] = config.timeout_seconds;
    payload["permission_mode"] = config.permission_mode;
    payload["permission_allowlist"] = config.permission_allowlist;
    if (config.working_directory.has_value()) {
        payload["working_directory"] = config.working_directory->string();
    }
    return payload;
}

}  // namespace acpbridge::core::config
