#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::skills {

struct SkillSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<protocol::ToolDescriptor> tools;

    // Same process launch parameters; tools may differ.
    bool same_launch(const SkillSpec& other) const {
        return command == other.command && args == other.args && env == other.env;
    }
};

struct SkillCatalog {
    std::vector<SkillSpec> skills;
};

// Parses {"<skill>": {"command": ..., "args": [...], "env": {...}, "tools": [...]}}.
core::errors::Result<SkillCatalog> parse_skill_catalog(const nlohmann::json& document);

core::errors::Result<SkillCatalog> load_skill_catalog(const std::filesystem::path& path);

// Replaces ${VAR} with the gateway's environment value (empty when unset).
std::string interpolate_env(const std::string& value);

}  // namespace toolgate::skills
