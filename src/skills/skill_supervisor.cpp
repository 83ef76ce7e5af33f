#include "skills/skill_supervisor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::skills {

SkillSupervisor::~SkillSupervisor() {
    shutdown_all();
}

void SkillSupervisor::replace(const SkillCatalog& catalog) {
    std::map<std::string, std::shared_ptr<SkillChannel>> next;
    std::map<std::string, std::shared_ptr<SkillChannel>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& spec : catalog.skills) {
            auto it = channels_.find(spec.name);
            if (it != channels_.end() && it->second->spec().same_launch(spec) &&
                it->second->readiness() != resilience::Readiness::Crashed) {
                next[spec.name] = it->second;
                continue;
            }
            next[spec.name] = std::make_shared<SkillChannel>(spec);
            LOG_DEBUG("SkillSupervisor: prepared channel for '" + spec.name + "'");
        }
        for (auto& [name, channel] : channels_) {
            auto kept = next.find(name);
            if (kept == next.end() || kept->second != channel) {
                retired[name] = std::move(channel);
            }
        }
        channels_ = std::move(next);
    }

    // Retired channels close when their last in-flight call lets go.
    for (const auto& [name, channel] : retired) {
        LOG_INFO("SkillSupervisor: retiring channel '" + name + "'");
    }
}

std::shared_ptr<SkillChannel> SkillSupervisor::find(const std::string& skill_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(skill_name);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> SkillSupervisor::skill_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto& [name, channel] : channels_) {
        names.push_back(name);
    }
    return names;
}

void SkillSupervisor::shutdown_all() {
    std::map<std::string, std::shared_ptr<SkillChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
    }
    for (auto& [name, channel] : channels) {
        channel->close();
    }
}

}  // namespace toolgate::skills
