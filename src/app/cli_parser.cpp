#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace toolgate::app::cli {

    using namespace toolgate::core::errors;
    using toolgate::core::config::EnvLookup;
    using toolgate::core::config::GatewayOptions;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> catalog;
        std::optional<std::string> memory_file;
        std::optional<std::string> consultant_skill;
        std::optional<std::string> log_level;
        std::optional<std::string> workers;
    };

    namespace {

        std::optional<std::string> env_default(const EnvLookup& env, const char* name) {
            if (!env) {
                return std::nullopt;
            }
            auto value = env(name);
            if (value.has_value() && value->empty()) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    Result<GatewayOptions> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // `serve` is the only command and may be omitted.
        if (!args.empty() && args.front() == "serve") {
            args.erase(args.begin());
        } else if (!args.empty() && args.front().rfind("--", 0) != 0) {
            return GatewayError{ErrorCategory::Input, "Unknown command: " + args.front(), "unknown_command", "Usage: toolgate [serve] [--catalog PATH] [--memory-file PATH] [--consultant-skill NAME] [--log-level LEVEL] [--workers N]"};
        }

        RawCliOptions raw;
        raw.catalog = env_default(env, "TOOLGATE_CATALOG");
        raw.memory_file = env_default(env, "TOOLGATE_MEMORY_FILE");
        raw.consultant_skill = env_default(env, "TOOLGATE_CONSULTANT_SKILL");
        raw.log_level = env_default(env, "TOOLGATE_LOG_LEVEL");

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--catalog") {
                if (i + 1 < args.size()) raw.catalog = args[++i];
                else return GatewayError{ErrorCategory::Input, "Missing value for --catalog", "missing_value"};
            } else if (args[i] == "--memory-file") {
                if (i + 1 < args.size()) raw.memory_file = args[++i];
                else return GatewayError{ErrorCategory::Input, "Missing value for --memory-file", "missing_value"};
            } else if (args[i] == "--consultant-skill") {
                if (i + 1 < args.size()) raw.consultant_skill = args[++i];
                else return GatewayError{ErrorCategory::Input, "Missing value for --consultant-skill", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return GatewayError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--workers") {
                if (i + 1 < args.size()) raw.workers = args[++i];
                else return GatewayError{ErrorCategory::Input, "Missing value for --workers", "missing_value"};
            } else {
                return GatewayError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        GatewayOptions options;

        if (raw.log_level) {
            const auto level = toolgate::core::logging::parse_level(raw.log_level.value());
            if (!level.has_value()) {
                return GatewayError{ErrorCategory::Input, "Invalid log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn, error or off."};
            }
            options.log_level = level.value();
        }

        // Exception-free integer parsing
        if (raw.workers) {
            uint32_t workers = 0;
            const char* begin = raw.workers->data();
            const char* end = raw.workers->data() + raw.workers->size();
            auto [ptr, ec] = std::from_chars(begin, end, workers);
            if (ec != std::errc() || ptr != end) {
                return GatewayError{ErrorCategory::Input, "Invalid number for --workers", "invalid_integer", "Provide a positive integer."};
            }
            if (workers == 0 || workers > 64) {
                return GatewayError{ErrorCategory::Input, "--workers out of bounds", "bounds_error", "Must be between 1 and 64."};
            }
            options.background_workers = workers;
        }

        if (raw.consultant_skill) {
            if (raw.consultant_skill->empty()) {
                return GatewayError{ErrorCategory::Input, "Consultant skill name cannot be empty", "missing_value"};
            }
            options.consultant_skill = raw.consultant_skill.value();
        }

        // Path validation
        if (raw.catalog) {
            std::filesystem::path p(raw.catalog.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return GatewayError{ErrorCategory::Input, "Skill catalog does not exist or is not a file", "invalid_path"};
            }
            options.catalog_path = std::move(p);
        }

        if (raw.memory_file) {
            std::filesystem::path p(raw.memory_file.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (is_dir) {
                return GatewayError{ErrorCategory::Input, "Memory file path is a directory", "invalid_path"};
            }
            options.memory_file = std::move(p);
        }

        return options;
    }

} // namespace toolgate::app::cli
