#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"
#include "resilience/service_locator.hpp"

namespace toolgate::collaborators {

inline constexpr const char* kMemoryServiceName = "memory";

struct Memory {
    std::string id;
    std::string content;
    std::string category;
    double importance = 0.5;
    double score = 0.0;
};

inline nlohmann::json to_json(const Memory& memory) {
    return {
        {"id", memory.id},
        {"content", memory.content},
        {"category", memory.category},
        {"importance", memory.importance},
        {"score", memory.score}
    };
}

// Persistence collaborator.
class MemoryStore : public resilience::ServiceHandle {
public:
    using resilience::ServiceHandle::ServiceHandle;

    virtual core::errors::Result<std::string> store(const std::string& content,
                                                    const std::string& category,
                                                    double importance) = 0;

    virtual core::errors::Result<std::vector<Memory>> search(const std::string& query,
                                                             std::size_t limit) = 0;
};

}  // namespace toolgate::collaborators
