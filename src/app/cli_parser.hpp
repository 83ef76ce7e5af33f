#pragma once
#include "core/config/gateway_options.hpp"
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"

namespace toolgate::app::cli {
    // Flags win over TOOLGATE_* environment defaults read through `env`.
    toolgate::core::errors::Result<toolgate::core::config::GatewayOptions> parse_and_validate(
        int argc, char* argv[],
        const toolgate::core::config::EnvLookup& env = toolgate::core::config::process_env);
}
