#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "handlers/file_handlers.hpp"
#include "handlers/permission_engine.hpp"
#include "handlers/terminal_manager.hpp"

namespace acpbridge::handlers {

// Answers the requests an agent sends back into the orchestrator. Outlives
// any single client or session.
class CallbackHandlers {
public:
    explicit CallbackHandlers(const std::string& permission_mode = "auto_approve",
                              std::vector<std::string> permission_allowlist = {},
                              PermissionLogFn on_permission_log = nullptr,
                              TerminalPrompt prompt = TerminalPrompt::standard());

    // Routes one agent->orchestrator call. std::nullopt for methods this
    // object does not serve.
    std::optional<core::errors::Result<nlohmann::json>> handle(const std::string& method,
                                                               const nlohmann::json& params);

    nlohmann::json handle_request_permission(const nlohmann::json& params) {
        return permissions_.handle_request_permission(params);
    }

    PermissionEngine& permissions() { return permissions_; }
    const PermissionEngine& permissions() const { return permissions_; }
    const FileHandlers& files() const { return files_; }
    TerminalManager& terminals() { return terminals_; }

private:
    PermissionEngine permissions_;
    FileHandlers files_;
    TerminalManager terminals_;
};

}  // namespace acpbridge::handlers
