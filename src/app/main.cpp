#include <iostream>
#include <string>
#include "adapter/acp_adapter.hpp"
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    acpbridge::core::logging::Logger::get().set_context(
        acpbridge::core::config::generate_id("run"));

    auto parsed = acpbridge::app::cli::parse_and_validate(argc, argv);
    if (acpbridge::core::errors::is_error(parsed)) {
        const auto& err = acpbridge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& req = acpbridge::core::errors::get_value(parsed);
    if (req.verbose) {
        acpbridge::core::logging::Logger::get().set_min_level(
            acpbridge::core::logging::LogLevel::DEBUG);
    }

    acpbridge::adapter::AcpAdapter adapter(
        req.config, [](const std::string& line) { LOG_INFO(line); });
    LOG_INFO("Adapter: " + adapter.describe());
    if (!adapter.available()) {
        LOG_ERROR("Agent command not found: " + req.config.agent_command);
        return 3;
    }

    adapter.install_signal_handlers();
    const auto response = adapter.execute(req.prompt);
    adapter.restore_signal_handlers();

    if (!response.output.empty()) {
        std::cout << response.output << std::endl;
    }
    LOG_DEBUG("Metadata: " + response.metadata.dump());

    const auto stats = adapter.permission_stats();
    LOG_INFO("Permissions: " + stats.at("approved_count").dump() + " approved, " +
             stats.at("denied_count").dump() + " denied");
    adapter.shutdown();

    if (!response.success) {
        LOG_ERROR(response.error.value_or("ACP execution failed"));
        return 1;
    }
    return 0;
}
