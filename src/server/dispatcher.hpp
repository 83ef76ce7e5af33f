#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/timeouts.hpp"
#include "protocol/json_rpc.hpp"
#include "registry/router.hpp"
#include "registry/tool_registry.hpp"

namespace toolgate::server {

struct ServerInfo {
    std::string name = "toolgate";
    std::string version = "1.0.0";
};

// Turns one decoded envelope into at most one response. Notifications
// produce nothing.
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<registry::ToolRegistry> registry,
               std::shared_ptr<registry::Router> router,
               std::shared_ptr<core::config::TimeoutHierarchy> timeouts,
               ServerInfo info = {});

    std::optional<nlohmann::json> dispatch(const protocol::Envelope& envelope) const;

private:
    nlohmann::json handle(const protocol::InitializeRequest& request) const;
    nlohmann::json handle(const protocol::ToolsListRequest& request) const;
    nlohmann::json handle(const protocol::ToolsCallRequest& request) const;
    nlohmann::json handle(const protocol::UnknownMethodRequest& request) const;
    nlohmann::json handle(const protocol::MalformedEnvelope& envelope) const;

    std::shared_ptr<registry::ToolRegistry> registry_;
    std::shared_ptr<registry::Router> router_;
    std::shared_ptr<core::config::TimeoutHierarchy> timeouts_;
    ServerInfo info_;
};

}  // namespace toolgate::server
