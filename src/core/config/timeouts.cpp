#include "core/config/timeouts.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace toolgate::core::config {

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

const std::vector<TimeoutSpec>& timeout_table() {
    // Every default is strictly below the default of its enclosing class.
    static const std::vector<TimeoutSpec> kTable = {
        {TimeoutClass::McpTool, "mcp_tool", "TOOLGATE_TIMEOUT_MCP_TOOL", 300000, std::nullopt},
        {TimeoutClass::Query, "query", "TOOLGATE_TIMEOUT_QUERY", 45000, TimeoutClass::McpTool},
        {TimeoutClass::PerCall, "per_call", "TOOLGATE_TIMEOUT_PER_CALL", 15000, TimeoutClass::Query},
        {TimeoutClass::LlmSynthesis, "llm_synthesis", "TOOLGATE_TIMEOUT_LLM_SYNTHESIS", 30000,
         TimeoutClass::Query},
        {TimeoutClass::Llm, "llm", "TOOLGATE_TIMEOUT_LLM", 12000, TimeoutClass::PerCall},
        {TimeoutClass::Embedding, "embedding", "TOOLGATE_TIMEOUT_EMBEDDING", 10000,
         TimeoutClass::PerCall},
        {TimeoutClass::Http, "http", "TOOLGATE_TIMEOUT_HTTP", 10000, TimeoutClass::PerCall},
        {TimeoutClass::Database, "database", "TOOLGATE_TIMEOUT_DATABASE", 5000,
         TimeoutClass::PerCall},
        {TimeoutClass::Connect, "connect", "TOOLGATE_TIMEOUT_CONNECT", 5000, TimeoutClass::PerCall},
        {TimeoutClass::Short, "short", "TOOLGATE_TIMEOUT_SHORT", 2000, TimeoutClass::PerCall},
    };
    return kTable;
}

const TimeoutSpec& spec_for(const TimeoutClass timeout_class) {
    const auto& table = timeout_table();
    const auto it = std::find_if(table.begin(), table.end(), [timeout_class](const TimeoutSpec& spec) {
        return spec.timeout_class == timeout_class;
    });
    // The table covers every enumerator.
    return it != table.end() ? *it : table.front();
}

std::string to_string(const TimeoutClass timeout_class) {
    return spec_for(timeout_class).name;
}

TimeoutHierarchy::TimeoutHierarchy(EnvLookup env_lookup)
    : env_lookup_(std::move(env_lookup)) {}

std::optional<std::uint32_t> TimeoutHierarchy::parse_override(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0) {
        return std::nullopt;
    }
    return value;
}

std::chrono::milliseconds TimeoutHierarchy::timeout_for(const TimeoutClass timeout_class) const {
    const TimeoutSpec& spec = spec_for(timeout_class);
    if (env_lookup_) {
        const auto raw = env_lookup_(spec.env_var);
        if (raw.has_value()) {
            const auto parsed = parse_override(raw.value());
            if (parsed.has_value()) {
                return std::chrono::milliseconds(parsed.value());
            }
        }
    }
    return std::chrono::milliseconds(spec.default_ms);
}

CallBudget TimeoutHierarchy::budget(const TimeoutClass timeout_class) const {
    return CallBudget{timeout_for(timeout_class), to_string(timeout_class)};
}

CallBudget TimeoutHierarchy::nested(const CallBudget& enclosing,
                                    const TimeoutClass inner) const {
    CallBudget inner_budget = budget(inner);
    if (enclosing.timeout.count() > 0 && enclosing.timeout < inner_budget.timeout) {
        inner_budget.timeout = enclosing.timeout;
    }
    return inner_budget;
}

std::vector<std::string> TimeoutHierarchy::ordering_violations() const {
    std::vector<std::string> violations;
    for (const auto& spec : timeout_table()) {
        if (!spec.enclosing.has_value()) {
            continue;
        }
        const auto inner = timeout_for(spec.timeout_class);
        const auto outer = timeout_for(spec.enclosing.value());
        if (inner >= outer) {
            violations.push_back(std::string(spec.name) + " (" +
                                 std::to_string(inner.count()) + " ms) is not below " +
                                 to_string(spec.enclosing.value()) + " (" +
                                 std::to_string(outer.count()) + " ms)");
        }
    }
    return violations;
}

}  // namespace toolgate::core::config
