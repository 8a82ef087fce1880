#pragma once
#include <string>
#include "core/config/adapter_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::app::cli {

    struct CliRequest {
        core::config::AdapterConfig config;
        std::string prompt;
        bool verbose = false;
    };

    // Layering: defaults, then --config file, then environment, then flags.
    core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
