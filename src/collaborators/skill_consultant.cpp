#include "collaborators/skill_consultant.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace toolgate::collaborators {

using core::config::TimeoutClass;
using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;
using resilience::Readiness;

std::string tool_result_text(const json& result) {
    if (result.is_object() && result.contains("content") && result["content"].is_array() &&
        !result["content"].empty()) {
        const json& first = result["content"][0];
        if (first.is_object() && first.contains("text") && first["text"].is_string()) {
            return first["text"].get<std::string>();
        }
    }
    if (result.is_string()) {
        return result.get<std::string>();
    }
    return result.dump(-1, ' ', false, json::error_handler_t::replace);
}

SkillConsultant::SkillConsultant(std::shared_ptr<skills::SkillSupervisor> supervisor,
                                 std::string skill_name,
                                 std::shared_ptr<core::config::TimeoutHierarchy> timeouts)
    : Consultant(kConsultantServiceName),
      supervisor_(std::move(supervisor)),
      skill_name_(std::move(skill_name)),
      timeouts_(std::move(timeouts)) {}

Readiness SkillConsultant::readiness() const {
    const auto channel = supervisor_->find(skill_name_);
    if (!channel) {
        return Readiness::NotStarted;
    }
    // A channel that has not been spawned yet is started on first consult.
    const Readiness state = channel->readiness();
    if (state == Readiness::Crashed) {
        return Readiness::Crashed;
    }
    return Readiness::Ready;
}

core::errors::Result<std::string> SkillConsultant::consult(
    const std::string& query, const std::vector<Memory>& memories,
    const core::config::CallBudget& budget, const resilience::CancelToken& cancel_token) {
    auto channel = supervisor_->find(skill_name_);
    if (!channel) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Consultant skill '" + skill_name_ + "' is not configured.",
                            "consultant_missing"};
    }

    const auto connect = timeouts_->nested(budget, TimeoutClass::Connect);
    const auto started = channel->ensure_started(connect.timeout);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    json memory_list = json::array();
    for (const auto& memory : memories) {
        memory_list.push_back(to_json(memory));
    }

    json params;
    params["name"] = kConsultToolName;
    params["arguments"] = {{"query", query}, {"memories", memory_list}};

    const auto llm = timeouts_->nested(budget, TimeoutClass::Llm);
    const auto result = channel->request("tools/call", params, llm.timeout, cancel_token);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    LOG_DEBUG("SkillConsultant: answered with " + std::to_string(memories.size()) +
              " memories");
    return tool_result_text(core::errors::get_value(result));
}

}  // namespace toolgate::collaborators
