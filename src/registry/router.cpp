#include "registry/router.hpp"

#include <string>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace toolgate::registry {

using core::errors::ErrorCategory;
using core::errors::GatewayError;

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

}  // namespace

Router::Router(std::shared_ptr<ToolRegistry> registry,
               std::shared_ptr<handlers::InternalHandlers> handlers,
               std::shared_ptr<skills::SkillClient> skill_client)
    : registry_(std::move(registry)),
      handlers_(std::move(handlers)),
      skill_client_(std::move(skill_client)) {}

core::errors::Result<nlohmann::json> Router::execute(const protocol::ToolCall& call,
                                                     const core::config::CallBudget& budget) const {
    const auto snapshot = registry_->snapshot();
    const RouteTarget target = snapshot->resolve(call.name);

    if (const auto* internal = std::get_if<InternalRoute>(&target)) {
        LOG_DEBUG("Router: " + call.name + " -> internal");
        switch (internal->tool) {
            case InternalTool::Ask:
                return handlers_->ask(call.arguments, budget);
            case InternalTool::Store:
                return handlers_->store(call.arguments, budget);
            case InternalTool::Reload:
                return handlers_->reload();
        }
    }

    if (const auto* skill = std::get_if<SkillRoute>(&target)) {
        LOG_DEBUG("Router: " + call.name + " -> skill " + skill->skill_name);
        return skill_client_->call(*skill, call.arguments, budget);
    }

    return GatewayError{ErrorCategory::Routing,
                        "Tool '" + call.name + "' not found. Available tools: " +
                            join_names(snapshot->tool_names()),
                        "tool_not_found"};
}

}  // namespace toolgate::registry
