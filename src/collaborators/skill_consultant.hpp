#pragma once

#include <memory>
#include <string>
#include <vector>
#include "collaborators/consultant.hpp"
#include "core/config/timeouts.hpp"
#include "skills/skill_supervisor.hpp"

namespace toolgate::collaborators {

inline constexpr const char* kConsultToolName = "consult";

// Consultant backed by a skill process: `ask` becomes a `tools/call` of the
// skill's `consult` tool with {query, memories}. Readiness follows the
// skill's channel as currently configured in the supervisor.
class SkillConsultant : public Consultant {
public:
    SkillConsultant(std::shared_ptr<skills::SkillSupervisor> supervisor,
                    std::string skill_name,
                    std::shared_ptr<core::config::TimeoutHierarchy> timeouts);

    resilience::Readiness readiness() const override;

    // Starts the skill within the connect budget nested in `budget`, then
    // waits at most the nested llm budget for the answer.
    core::errors::Result<std::string> consult(const std::string& query,
                                              const std::vector<Memory>& memories,
                                              const core::config::CallBudget& budget,
                                              const resilience::CancelToken& cancel_token) override;

private:
    std::shared_ptr<skills::SkillSupervisor> supervisor_;
    std::string skill_name_;
    std::shared_ptr<core::config::TimeoutHierarchy> timeouts_;
};

// Text of a tool result: content[0].text, a plain string, or compact JSON.
std::string tool_result_text(const nlohmann::json& result);

}  // namespace toolgate::collaborators
