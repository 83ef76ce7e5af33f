#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolgate::protocol {

    // One catalog entry, as advertised by tools/list
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // What a tools/call asks the gateway to run
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    inline nlohmann::json to_json(const ToolDescriptor& tool) {
        return {
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        };
    }

    inline nlohmann::json empty_input_schema() {
        return {{"type", "object"}, {"properties", nlohmann::json::object()}};
    }

} // namespace toolgate::protocol
