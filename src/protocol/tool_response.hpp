#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace acpbridge::protocol {

    // Uniform outcome handed back to the orchestration loop. Every execute
    // path (success, subprocess death, timeout) ends in one of these.
    struct ToolResponse {
        bool success = false;
        std::string output;
        std::optional<std::string> error;
        nlohmann::json metadata = nlohmann::json::object();
    };

    struct ExecuteOptions {
        // Overrides the adapter's configured timeout for this prompt turn.
        std::optional<double> timeout_seconds;
    };

} // namespace acpbridge::protocol
