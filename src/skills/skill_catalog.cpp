#include "skills/skill_catalog.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace toolgate::skills {

using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

GatewayError invalid_catalog(const std::string& message) {
    return GatewayError{ErrorCategory::Input, message, "invalid_catalog",
                        "Each skill needs a \"command\" string; \"args\", \"env\" and "
                        "\"tools\" are optional."};
}

core::errors::Result<protocol::ToolDescriptor> parse_tool(const std::string& skill_name,
                                                          const json& entry) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        return invalid_catalog("Skill '" + skill_name + "' has a tool without a name.");
    }

    protocol::ToolDescriptor tool;
    tool.name = entry["name"].get<std::string>();
    if (tool.name.empty()) {
        return invalid_catalog("Skill '" + skill_name + "' has a tool with an empty name.");
    }
    if (entry.contains("description") && entry["description"].is_string()) {
        tool.description = entry["description"].get<std::string>();
    }
    if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
        tool.input_schema = entry["inputSchema"];
    } else {
        tool.input_schema = protocol::empty_input_schema();
    }
    return tool;
}

core::errors::Result<SkillSpec> parse_skill(const std::string& name, const json& config) {
    if (!config.is_object()) {
        return invalid_catalog("Skill '" + name + "' must be an object.");
    }
    if (!config.contains("command") || !config["command"].is_string() ||
        config["command"].get<std::string>().empty()) {
        return invalid_catalog("Skill '" + name + "' is missing 'command'.");
    }

    SkillSpec spec;
    spec.name = name;
    spec.command = config["command"].get<std::string>();

    if (config.contains("args")) {
        if (!config["args"].is_array()) {
            return invalid_catalog("Skill '" + name + "': 'args' must be an array.");
        }
        for (const auto& arg : config["args"]) {
            if (!arg.is_string()) {
                return invalid_catalog("Skill '" + name + "': 'args' must contain strings.");
            }
            spec.args.push_back(arg.get<std::string>());
        }
    }

    if (config.contains("env")) {
        if (!config["env"].is_object()) {
            return invalid_catalog("Skill '" + name + "': 'env' must be an object.");
        }
        for (const auto& [key, value] : config["env"].items()) {
            if (value.is_string()) {
                spec.env[key] = interpolate_env(value.get<std::string>());
            } else {
                spec.env[key] = value.dump();
            }
        }
    }

    if (config.contains("tools")) {
        if (!config["tools"].is_array()) {
            return invalid_catalog("Skill '" + name + "': 'tools' must be an array.");
        }
        for (const auto& entry : config["tools"]) {
            auto tool = parse_tool(name, entry);
            if (core::errors::is_error(tool)) {
                return core::errors::get_error(tool);
            }
            spec.tools.push_back(core::errors::get_value(tool));
        }
    }
    return spec;
}

}  // namespace

std::string interpolate_env(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        const auto end = value.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);
        const std::string var_name = value.substr(start + 2, end - start - 2);
        const char* var_value = std::getenv(var_name.c_str());
        if (var_value != nullptr) {
            out.append(var_value);
        }
        pos = end + 1;
    }
    return out;
}

core::errors::Result<SkillCatalog> parse_skill_catalog(const json& document) {
    if (!document.is_object()) {
        return invalid_catalog("Skill catalog must be a JSON object keyed by skill name.");
    }

    SkillCatalog catalog;
    for (const auto& [name, config] : document.items()) {
        if (name.empty()) {
            return invalid_catalog("Skill catalog contains an empty skill name.");
        }
        auto skill = parse_skill(name, config);
        if (core::errors::is_error(skill)) {
            return core::errors::get_error(skill);
        }
        catalog.skills.push_back(core::errors::get_value(skill));
    }
    return catalog;
}

core::errors::Result<SkillCatalog> load_skill_catalog(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return GatewayError{ErrorCategory::Input,
                            "Skill catalog does not exist: " + path.string(),
                            "catalog_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return GatewayError{ErrorCategory::Input,
                            "Failed to open skill catalog: " + path.string(),
                            "catalog_open_failed"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return invalid_catalog("Skill catalog is not valid JSON: " + path.string());
    }
    return parse_skill_catalog(document);
}

}  // namespace toolgate::skills
