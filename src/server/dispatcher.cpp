#include "server/dispatcher.hpp"

#include <type_traits>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "resilience/defensive.hpp"

namespace toolgate::server {

using core::config::TimeoutClass;
using nlohmann::json;
namespace error_code = protocol::error_code;

Dispatcher::Dispatcher(std::shared_ptr<registry::ToolRegistry> registry,
                       std::shared_ptr<registry::Router> router,
                       std::shared_ptr<core::config::TimeoutHierarchy> timeouts,
                       ServerInfo info)
    : registry_(std::move(registry)),
      router_(std::move(router)),
      timeouts_(std::move(timeouts)),
      info_(std::move(info)) {}

std::optional<json> Dispatcher::dispatch(const protocol::Envelope& envelope) const {
    return std::visit(
        [this](const auto& message) -> std::optional<json> {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, protocol::Notification>) {
                LOG_DEBUG("Dispatcher: notification '" + message.method + "' ignored");
                return std::nullopt;
            } else {
                return handle(message);
            }
        },
        envelope);
}

json Dispatcher::handle(const protocol::InitializeRequest& request) const {
    json result;
    result["protocolVersion"] = protocol::kProtocolVersion;
    result["capabilities"] = {{"tools", {{"listChanged", true}}}};
    result["serverInfo"] = {{"name", info_.name}, {"version", info_.version}};
    return protocol::make_result(request.id, result);
}

json Dispatcher::handle(const protocol::ToolsListRequest& request) const {
    json tools = json::array();
    for (const auto& tool : registry_->list_all()) {
        tools.push_back(protocol::to_json(tool));
    }
    return protocol::make_result(request.id, {{"tools", tools}});
}

json Dispatcher::handle(const protocol::ToolsCallRequest& request) const {
    const json& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return protocol::make_error(request.id, error_code::kToolExecutionError,
                                    "Missing required parameter: name");
    }

    protocol::ToolCall call;
    call.name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        call.arguments = params["arguments"];
    }

    const auto budget = timeouts_->budget(TimeoutClass::McpTool);
    auto router = router_;
    auto outcome = resilience::with_timeout(
        [router, call, budget]() { return router->execute(call, budget); }, budget.timeout);

    if (std::holds_alternative<resilience::Timeout>(outcome)) {
        LOG_WARN("Dispatcher: tool '" + call.name + "' exceeded " + budget.class_name + " budget");
        return protocol::make_error(request.id, error_code::kToolExecutionError,
                                    "Tool '" + call.name + "' timed out after " +
                                        std::to_string(budget.timeout.count()) + " ms");
    }
    if (!resilience::is_ok(outcome)) {
        return protocol::make_error(request.id, error_code::kToolExecutionError,
                                    "Tool '" + call.name + "' failed: " +
                                        resilience::describe(outcome));
    }

    const auto result = resilience::take_ok(std::move(outcome));
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_INFO("Dispatcher: tool '" + call.name + "' failed [" + error.code + "]: " +
                 error.message);
        return protocol::make_error(request.id, error_code::kToolExecutionError, error.message);
    }
    return protocol::make_result(
        request.id,
        protocol::make_tool_response(protocol::format_result(core::errors::get_value(result))));
}

json Dispatcher::handle(const protocol::UnknownMethodRequest& request) const {
    return protocol::make_error(request.id, error_code::kMethodNotFound,
                                "Method not found: " + request.method);
}

json Dispatcher::handle(const protocol::MalformedEnvelope& envelope) const {
    LOG_DEBUG("Dispatcher: malformed envelope: " + envelope.reason);
    return protocol::make_error(nullptr, error_code::kInvalidRequest, "Invalid Request");
}

}  // namespace toolgate::server
