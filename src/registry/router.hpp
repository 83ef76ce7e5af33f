#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"
#include "handlers/internal_handlers.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/tool_registry.hpp"
#include "skills/skill_client.hpp"

namespace toolgate::registry {

class Router {
public:
    Router(std::shared_ptr<ToolRegistry> registry,
           std::shared_ptr<handlers::InternalHandlers> handlers,
           std::shared_ptr<skills::SkillClient> skill_client);

    // Resolves against one registry snapshot and runs the call.
    core::errors::Result<nlohmann::json> execute(const protocol::ToolCall& call,
                                                 const core::config::CallBudget& budget) const;

private:
    std::shared_ptr<ToolRegistry> registry_;
    std::shared_ptr<handlers::InternalHandlers> handlers_;
    std::shared_ptr<skills::SkillClient> skill_client_;
};

}  // namespace toolgate::registry
