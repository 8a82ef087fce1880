#include "handlers/callback_handlers.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/acp_methods.hpp"

namespace acpbridge::handlers {

namespace methods = protocol::methods;
using nlohmann::json;

CallbackHandlers::CallbackHandlers(const std::string& permission_mode,
                                   std::vector<std::string> permission_allowlist,
                                   PermissionLogFn on_permission_log, TerminalPrompt prompt)
    : permissions_(permission_mode, std::move(permission_allowlist),
                   std::move(on_permission_log), std::move(prompt)) {}

std::optional<core::errors::Result<json>> CallbackHandlers::handle(const std::string& method,
                                                                   const json& params) {
    LOG_DEBUG("CallbackHandlers: " + method);

    if (method == methods::kRequestPermission) {
        return core::errors::Result<json>{permissions_.handle_request_permission(params)};
    }
    if (method == methods::kReadTextFile) {
        return files_.handle_read_file(params);
    }
    if (method == methods::kWriteTextFile) {
        return files_.handle_write_file(params);
    }
    if (method == methods::kTerminalCreate) {
        return terminals_.handle_create(params);
    }
    if (method == methods::kTerminalOutput) {
        return terminals_.handle_output(params);
    }
    if (method == methods::kTerminalWaitForExit) {
        return terminals_.handle_wait_for_exit(params);
    }
    if (method == methods::kTerminalKill) {
        return terminals_.handle_kill(params);
    }
    if (method == methods::kTerminalRelease) {
        return terminals_.handle_release(params);
    }
    return std::nullopt;
}

}  // namespace acpbridge::handlers
