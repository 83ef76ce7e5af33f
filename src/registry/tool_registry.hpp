#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/gateway_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/route_target.hpp"
#include "skills/skill_catalog.hpp"
#include "skills/skill_supervisor.hpp"

namespace toolgate::registry {

inline constexpr const char* kAskTool = "ask";
inline constexpr const char* kStoreTool = "store_memory";
inline constexpr const char* kReloadTool = "reload_skills";

// Immutable view of the registry. Readers keep a snapshot for the duration
// of one request; reload publishes a new one.
struct RegistrySnapshot {
    std::vector<protocol::ToolDescriptor> tools;
    std::unordered_map<std::string, RouteTarget> routes;
    std::uint64_t generation = 0;

    RouteTarget resolve(const std::string& name) const;
    std::vector<std::string> tool_names() const;
};

using CatalogLoader = std::function<core::errors::Result<skills::SkillCatalog>()>;

class ToolRegistry {
public:
    ToolRegistry(std::shared_ptr<skills::SkillSupervisor> supervisor, CatalogLoader loader);

    // Re-reads the catalog and swaps in a new snapshot. On failure the
    // previous snapshot stays in place.
    core::errors::Status reload();

    std::shared_ptr<const RegistrySnapshot> snapshot() const;

    std::vector<protocol::ToolDescriptor> list_all() const;
    RouteTarget resolve(const std::string& name) const;

    static const std::vector<protocol::ToolDescriptor>& internal_tools();

private:
    std::shared_ptr<const RegistrySnapshot> build(const skills::SkillCatalog& catalog,
                                                  std::uint64_t generation) const;

    std::shared_ptr<skills::SkillSupervisor> supervisor_;
    CatalogLoader loader_;
    std::mutex reload_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const RegistrySnapshot> snapshot_;
};

// Loader for a gateway started without a catalog.
CatalogLoader empty_catalog_loader();

}  // namespace toolgate::registry
