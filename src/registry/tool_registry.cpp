#include "registry/tool_registry.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace toolgate::registry {

using nlohmann::json;

namespace {

protocol::ToolDescriptor ask_descriptor() {
    protocol::ToolDescriptor tool;
    tool.name = kAskTool;
    tool.description =
        "Consult the memory-backed assistant. Relevant memories are retrieved and passed "
        "along with the query.";
    tool.input_schema = {
        {"type", "object"},
        {"properties",
         {{"query", {{"type", "string"}, {"description", "The question to ask"}}}}},
        {"required", json::array({"query"})}};
    return tool;
}

protocol::ToolDescriptor store_descriptor() {
    protocol::ToolDescriptor tool;
    tool.name = kStoreTool;
    tool.description = "Store a fact, action, observation or plan in memory.";
    tool.input_schema = {
        {"type", "object"},
        {"properties",
         {{"content", {{"type", "string"}}},
          {"category",
           {{"type", "string"},
            {"enum", json::array({"fact", "action", "observation", "plan"})}}},
          {"importance", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}}}},
        {"required", json::array({"content", "category"})}};
    return tool;
}

protocol::ToolDescriptor reload_descriptor() {
    protocol::ToolDescriptor tool;
    tool.name = kReloadTool;
    tool.description = "Re-read the skill catalog and refresh the tool list.";
    tool.input_schema = protocol::empty_input_schema();
    return tool;
}

InternalTool internal_kind(const std::string& name) {
    if (name == kAskTool) {
        return InternalTool::Ask;
    }
    if (name == kStoreTool) {
        return InternalTool::Store;
    }
    return InternalTool::Reload;
}

}  // namespace

RouteTarget RegistrySnapshot::resolve(const std::string& name) const {
    auto it = routes.find(name);
    if (it == routes.end()) {
        return NotFoundRoute{};
    }
    return it->second;
}

std::vector<std::string> RegistrySnapshot::tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools.size());
    for (const auto& tool : tools) {
        names.push_back(tool.name);
    }
    return names;
}

const std::vector<protocol::ToolDescriptor>& ToolRegistry::internal_tools() {
    static const std::vector<protocol::ToolDescriptor> tools = {
        ask_descriptor(), store_descriptor(), reload_descriptor()};
    return tools;
}

CatalogLoader empty_catalog_loader() {
    return []() -> core::errors::Result<skills::SkillCatalog> { return skills::SkillCatalog{}; };
}

ToolRegistry::ToolRegistry(std::shared_ptr<skills::SkillSupervisor> supervisor,
                           CatalogLoader loader)
    : supervisor_(std::move(supervisor)),
      loader_(std::move(loader)),
      snapshot_(build(skills::SkillCatalog{}, 0)) {}

core::errors::Status ToolRegistry::reload() {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);
    auto catalog = loader_();
    if (core::errors::is_error(catalog)) {
        const auto& error = core::errors::get_error(catalog);
        LOG_WARN("ToolRegistry: reload failed, keeping previous tools: " + error.message);
        return error;
    }

    supervisor_->replace(core::errors::get_value(catalog));
    const std::uint64_t generation = snapshot()->generation + 1;
    auto next = build(core::errors::get_value(catalog), generation);
    const std::size_t count = next->tools.size();
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = std::move(next);
    }
    LOG_INFO("ToolRegistry: generation " + std::to_string(generation) + " with " +
             std::to_string(count) + " tools");
    return core::errors::ok_status();
}

std::shared_ptr<const RegistrySnapshot> ToolRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::vector<protocol::ToolDescriptor> ToolRegistry::list_all() const {
    return snapshot()->tools;
}

RouteTarget ToolRegistry::resolve(const std::string& name) const {
    return snapshot()->resolve(name);
}

std::shared_ptr<const RegistrySnapshot> ToolRegistry::build(const skills::SkillCatalog& catalog,
                                                            const std::uint64_t generation) const {
    auto next = std::make_shared<RegistrySnapshot>();
    next->generation = generation;

    for (const auto& tool : internal_tools()) {
        next->tools.push_back(tool);
        next->routes.emplace(tool.name, InternalRoute{internal_kind(tool.name)});
    }

    for (const auto& skill : catalog.skills) {
        auto channel = supervisor_->find(skill.name);
        for (const auto& tool : skill.tools) {
            protocol::ToolDescriptor exposed = tool;
            exposed.name = skill.name + "_" + tool.name;
            if (next->routes.count(exposed.name) != 0) {
                LOG_WARN("ToolRegistry: duplicate tool name '" + exposed.name + "' from skill '" +
                         skill.name + "' skipped");
                continue;
            }
            next->routes.emplace(exposed.name, SkillRoute{skill.name, tool.name, channel});
            next->tools.push_back(std::move(exposed));
        }
    }
    return next;
}

}  // namespace toolgate::registry
