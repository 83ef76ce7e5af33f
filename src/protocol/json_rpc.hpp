#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"

namespace toolgate::protocol {

namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kToolExecutionError = -32000;
}  // namespace error_code

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";

// Decoded envelopes. The dispatcher matches on this closed set; a method the
// gateway does not know still lands in a named alternative.
struct InitializeRequest {
    nlohmann::json id;
    nlohmann::json params;
};

struct ToolsListRequest {
    nlohmann::json id;
};

struct ToolsCallRequest {
    nlohmann::json id;
    nlohmann::json params;
};

struct UnknownMethodRequest {
    nlohmann::json id;
    std::string method;
};

struct Notification {
    std::string method;
    nlohmann::json params;
};

struct MalformedEnvelope {
    std::string reason;
};

using Envelope = std::variant<InitializeRequest, ToolsListRequest, ToolsCallRequest,
                              UnknownMethodRequest, Notification, MalformedEnvelope>;

core::errors::Result<nlohmann::json> decode_line(const std::string& line);
Envelope classify(const nlohmann::json& message);

nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

// {content:[{type:"text", text:...}]}
nlohmann::json make_tool_response(const std::string& text);

// Objects are pretty-printed, strings pass through, everything else is
// rendered as compact JSON text.
std::string format_result(const nlohmann::json& result);

// Single line of JSON, never throws on invalid UTF-8.
std::string encode(const nlohmann::json& message);

}  // namespace toolgate::protocol
