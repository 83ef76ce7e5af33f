#pragma once
#include <string>
#include <variant>

namespace toolgate::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., a tool call is missing a required argument
        Execution,     // E.g., a skill answered with a JSON-RPC error
        Collaborator,  // E.g., the memory store or consultant is unavailable
        Routing,       // E.g., no tool registered under the requested name
        Protocol,      // E.g., a skill wrote something that is not JSON-RPC
        Internal       // E.g., pipe/fork failure or a C++ logic bug
    };

    // The standardized error payload
    struct GatewayError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a GatewayError.
    template <typename T>
    using Result = std::variant<T, GatewayError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok_status() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GatewayError>(result);
    }

    template <typename T>
    const GatewayError& get_error(const Result<T>& result) {
        return std::get<GatewayError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Collaborator: return "collaborator";
            case ErrorCategory::Routing: return "routing";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace toolgate::core::errors
