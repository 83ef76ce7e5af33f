#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"
#include "registry/route_target.hpp"

namespace toolgate::skills {

// Forwards a routed tool call to its skill process as a JSON-RPC
// `tools/call`, bounded by the per-call budget.
class SkillClient {
public:
    explicit SkillClient(std::shared_ptr<core::config::TimeoutHierarchy> timeouts);

    core::errors::Result<nlohmann::json> call(const registry::SkillRoute& route,
                                              const nlohmann::json& arguments,
                                              const core::config::CallBudget& budget) const;

private:
    std::shared_ptr<core::config::TimeoutHierarchy> timeouts_;
};

}  // namespace toolgate::skills
