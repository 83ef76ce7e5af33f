#pragma once

#include <string>
#include <vector>
#include "collaborators/memory_store.hpp"
#include "core/config/timeouts.hpp"
#include "core/errors/gateway_errors.hpp"
#include "resilience/outcome.hpp"
#include "resilience/service_locator.hpp"

namespace toolgate::collaborators {

inline constexpr const char* kConsultantServiceName = "consultant";

// LLM consultation collaborator: answers a query given related memories.
// An implementation stays within `budget` and gives up once `cancel_token`
// is set.
class Consultant : public resilience::ServiceHandle {
public:
    using resilience::ServiceHandle::ServiceHandle;

    virtual core::errors::Result<std::string> consult(
        const std::string& query, const std::vector<Memory>& memories,
        const core::config::CallBudget& budget, const resilience::CancelToken& cancel_token) = 0;
};

}  // namespace toolgate::collaborators
