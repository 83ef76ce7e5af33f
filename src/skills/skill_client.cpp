#include "skills/skill_client.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <utility>
#include "core/logging/logger.hpp"
#include "resilience/defensive.hpp"
#include "skills/skill_channel.hpp"

namespace toolgate::skills {

using core::config::TimeoutClass;
using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;

SkillClient::SkillClient(std::shared_ptr<core::config::TimeoutHierarchy> timeouts)
    : timeouts_(std::move(timeouts)) {}

core::errors::Result<json> SkillClient::call(const registry::SkillRoute& route,
                                             const json& arguments,
                                             const core::config::CallBudget& budget) const {
    auto channel = route.channel.lock();
    if (!channel) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Skill '" + route.skill_name + "' is no longer available.",
                            "skill_not_alive"};
    }

    const auto connect = timeouts_->nested(budget, TimeoutClass::Connect);
    const auto started = channel->ensure_started(connect.timeout);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    const auto per_call = timeouts_->nested(budget, TimeoutClass::PerCall);
    json params;
    params["name"] = route.tool_name;
    params["arguments"] = arguments;

    LOG_DEBUG("SkillClient: " + route.skill_name + "." + route.tool_name + " (budget " +
              std::to_string(per_call.timeout.count()) + " ms)");

    const auto request_timeout = per_call.timeout;
    auto outcome = resilience::safe_call<SkillChannel>(
        std::weak_ptr<SkillChannel>(channel),
        [params, request_timeout](SkillChannel& target, const resilience::CancelToken& token) {
            return target.request("tools/call", params, request_timeout, token);
        },
        // Outer bound for a worker stuck past the channel's own deadline.
        per_call.timeout + std::chrono::milliseconds(250));
    channel.reset();

    if (resilience::is_ok(outcome)) {
        return resilience::take_ok(std::move(outcome));
    }
    if (std::holds_alternative<resilience::Timeout>(outcome)) {
        return GatewayError{ErrorCategory::Execution,
                            "Skill '" + route.skill_name + "' timed out after " +
                                std::to_string(per_call.timeout.count()) + " ms",
                            "skill_timeout"};
    }
    return GatewayError{ErrorCategory::Collaborator,
                        "Skill '" + route.skill_name + "' call failed: " +
                            resilience::describe(outcome),
                        "skill_unavailable"};
}

}  // namespace toolgate::skills
