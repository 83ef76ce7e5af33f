#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace toolgate::core::config {

    // Validated startup options. Unset collaborators stay unregistered and the
    // tools that need them report not_ready.
    struct GatewayOptions {
        std::optional<std::filesystem::path> catalog_path;
        std::optional<std::filesystem::path> memory_file;
        std::optional<std::string> consultant_skill;
        logging::LogLevel log_level = logging::LogLevel::WARN;
        std::uint32_t background_workers = 2;
    };

} // namespace toolgate::core::config
