#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "skills/skill_catalog.hpp"
#include "skills/skill_channel.hpp"

namespace toolgate::skills {

// Owns one SkillChannel per configured skill. Channels start lazily on first
// use; callers keep only weak references.
class SkillSupervisor {
public:
    SkillSupervisor() = default;
    ~SkillSupervisor();

    SkillSupervisor(const SkillSupervisor&) = delete;
    SkillSupervisor& operator=(const SkillSupervisor&) = delete;

    // Adopts `catalog`. A running channel is kept when its launch parameters
    // did not change and it has not crashed; everything else is replaced.
    void replace(const SkillCatalog& catalog);

    std::shared_ptr<SkillChannel> find(const std::string& skill_name) const;
    std::vector<std::string> skill_names() const;

    void shutdown_all();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SkillChannel>> channels_;
};

}  // namespace toolgate::skills
