#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolgate::core::config {

enum class TimeoutClass {
    McpTool,
    Query,
    PerCall,
    LlmSynthesis,
    Llm,
    Embedding,
    Http,
    Database,
    Connect,
    Short
};

struct TimeoutSpec {
    TimeoutClass timeout_class;
    const char* name;
    const char* env_var;
    std::uint32_t default_ms;
    std::optional<TimeoutClass> enclosing;
};

// One budget, tagged with the class it was derived from.
struct CallBudget {
    std::chrono::milliseconds timeout{0};
    std::string class_name;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

const std::vector<TimeoutSpec>& timeout_table();
const TimeoutSpec& spec_for(TimeoutClass timeout_class);
std::string to_string(TimeoutClass timeout_class);

class TimeoutHierarchy {
public:
    explicit TimeoutHierarchy(EnvLookup env_lookup = process_env);

    // Override-or-default, re-read from the environment on every call.
    std::chrono::milliseconds timeout_for(TimeoutClass timeout_class) const;
    CallBudget budget(TimeoutClass timeout_class) const;

    // Budget for a call nested inside `enclosing`: never longer than it.
    CallBudget nested(const CallBudget& enclosing, TimeoutClass inner) const;

    // Human-readable list of classes whose effective budget is not strictly
    // below the effective budget of their enclosing class.
    std::vector<std::string> ordering_violations() const;

    static std::optional<std::uint32_t> parse_override(const std::string& text);

private:
    EnvLookup env_lookup_;
};

}  // namespace toolgate::core::config
