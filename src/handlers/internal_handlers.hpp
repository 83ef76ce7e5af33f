#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"
#include "registry/tool_registry.hpp"
#include "resilience/service_locator.hpp"
#include "runtime/background_jobs.hpp"

namespace toolgate::handlers {

inline constexpr std::size_t kConsultMemoryLimit = 10;
inline constexpr std::size_t kSummaryAnswerChars = 200;
inline constexpr double kConsultationImportance = 0.7;

// The gateway's own tools. Collaborators are reached only through the
// service locator, so a missing or crashed one degrades instead of hanging.
class InternalHandlers {
public:
    InternalHandlers(std::shared_ptr<resilience::ServiceLocator> locator,
                     std::shared_ptr<runtime::BackgroundJobs> jobs,
                     std::shared_ptr<core::config::TimeoutHierarchy> timeouts,
                     std::shared_ptr<registry::ToolRegistry> registry);

    // {query} -> {answer, memories_consulted}
    core::errors::Result<nlohmann::json> ask(const nlohmann::json& arguments,
                                             const core::config::CallBudget& budget) const;

    // {content, category, importance?} -> {stored: true, id}
    core::errors::Result<nlohmann::json> store(const nlohmann::json& arguments,
                                               const core::config::CallBudget& budget) const;

    core::errors::Result<nlohmann::json> reload() const;

private:
    std::shared_ptr<resilience::ServiceLocator> locator_;
    std::shared_ptr<runtime::BackgroundJobs> jobs_;
    std::shared_ptr<core::config::TimeoutHierarchy> timeouts_;
    std::shared_ptr<registry::ToolRegistry> registry_;
};

// First `max_chars` UTF-8 characters of `text`; never splits a sequence.
std::string utf8_prefix(const std::string& text, std::size_t max_chars);

}  // namespace toolgate::handlers
