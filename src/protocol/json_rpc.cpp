#include "protocol/json_rpc.hpp"

namespace toolgate::protocol {

using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;

core::errors::Result<json> decode_line(const std::string& line) {
    try {
        return json::parse(line);
    } catch (const json::exception& e) {
        // Syntax errors and out-of-range numbers such as 1e999.
        return GatewayError{ErrorCategory::Protocol,
                            std::string("JSON parse error: ") + e.what(),
                            "parse_error"};
    }
}

Envelope classify(const json& message) {
    if (!message.is_object()) {
        return MalformedEnvelope{"Envelope is not a JSON object"};
    }
    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return MalformedEnvelope{"Missing or invalid method"};
    }

    const std::string method = method_it->get<std::string>();
    const auto params_it = message.find("params");
    const json params = params_it != message.end() ? *params_it : json();
    const auto id_it = message.find("id");
    if (id_it == message.end()) {
        return Notification{method, params};
    }

    const json& id = *id_it;
    if (method == "initialize") {
        return InitializeRequest{id, params};
    }
    if (method == "tools/list") {
        return ToolsListRequest{id};
    }
    if (method == "tools/call") {
        return ToolsCallRequest{id, params};
    }
    return UnknownMethodRequest{id, method};
}

json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

json make_error(const json& id, const int code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

json make_tool_response(const std::string& text) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", text}
    });
    return {{"content", content}};
}

std::string format_result(const json& result) {
    if (result.is_object()) {
        return result.dump(2, ' ', false, json::error_handler_t::replace);
    }
    if (result.is_string()) {
        return result.get<std::string>();
    }
    return result.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace toolgate::protocol
