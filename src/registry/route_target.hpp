#pragma once

#include <memory>
#include <string>
#include <variant>

namespace toolgate::skills {
class SkillChannel;
}

namespace toolgate::registry {

enum class InternalTool {
    Ask,
    Store,
    Reload
};

struct InternalRoute {
    InternalTool tool;
};

// A tool provided by a skill process. The channel is held weakly: a reload
// may retire it while a call is being routed.
struct SkillRoute {
    std::string skill_name;
    std::string tool_name;
    std::weak_ptr<skills::SkillChannel> channel;
};

struct NotFoundRoute {};

using RouteTarget = std::variant<InternalRoute, SkillRoute, NotFoundRoute>;

}  // namespace toolgate::registry
