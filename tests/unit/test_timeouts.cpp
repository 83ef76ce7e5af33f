#include <string>
#include <gtest/gtest.h>
#include "core/config/timeouts.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::core::config::CallBudget;
using toolgate::core::config::TimeoutClass;
using toolgate::core::config::TimeoutHierarchy;
using toolgate::core::config::spec_for;
using toolgate::core::config::timeout_table;
using toolgate::testing::fake_env;

TEST(TimeoutHierarchyTest, DefaultsMatchTable) {
    TimeoutHierarchy timeouts(fake_env({}));
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::McpTool), 300000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Query), 45000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::PerCall), 15000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::LlmSynthesis), 30000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Llm), 12000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Embedding), 10000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Http), 10000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Database), 5000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Connect), 5000ms);
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Short), 2000ms);
}

TEST(TimeoutHierarchyTest, EveryDefaultIsBelowItsEnclosingDefault) {
    for (const auto& spec : timeout_table()) {
        if (!spec.enclosing.has_value()) {
            continue;
        }
        const auto& outer = spec_for(spec.enclosing.value());
        EXPECT_LT(spec.default_ms, outer.default_ms) << spec.name << " vs " << outer.name;
    }
    EXPECT_TRUE(TimeoutHierarchy(fake_env({})).ordering_violations().empty());
}

TEST(TimeoutHierarchyTest, ValidOverrideApplies) {
    TimeoutHierarchy timeouts(fake_env({{"TOOLGATE_TIMEOUT_PER_CALL", "250"}}));
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::PerCall), 250ms);
    EXPECT_EQ(timeouts.budget(TimeoutClass::PerCall).class_name, "per_call");
}

TEST(TimeoutHierarchyTest, InvalidOverridesFallBackToDefault) {
    for (const std::string bad : {"", "abc", "12ms", "-5", "0", " 100", "99999999999"}) {
        TimeoutHierarchy timeouts(fake_env({{"TOOLGATE_TIMEOUT_QUERY", bad}}));
        EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Query), 45000ms) << "override '" << bad << "'";
    }
}

TEST(TimeoutHierarchyTest, OverrideIsReadAtCallTime) {
    std::string value = "100";
    TimeoutHierarchy timeouts([&value](const std::string& name) -> std::optional<std::string> {
        if (name == "TOOLGATE_TIMEOUT_SHORT") {
            return value;
        }
        return std::nullopt;
    });
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Short), 100ms);
    value = "700";
    EXPECT_EQ(timeouts.timeout_for(TimeoutClass::Short), 700ms);
}

TEST(TimeoutHierarchyTest, NestedBudgetNeverExceedsEnclosing) {
    TimeoutHierarchy timeouts(fake_env({}));
    const CallBudget outer{1000ms, "query"};
    EXPECT_EQ(timeouts.nested(outer, TimeoutClass::PerCall).timeout, 1000ms);
    EXPECT_EQ(timeouts.nested(outer, TimeoutClass::PerCall).class_name, "per_call");

    const CallBudget roomy{60000ms, "query"};
    EXPECT_EQ(timeouts.nested(roomy, TimeoutClass::Database).timeout, 5000ms);
}

TEST(TimeoutHierarchyTest, ReportsOrderingViolationsOfOverrides) {
    TimeoutHierarchy timeouts(fake_env({{"TOOLGATE_TIMEOUT_DATABASE", "20000"}}));
    const auto violations = timeouts.ordering_violations();
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_NE(violations.front().find("database"), std::string::npos);
}

TEST(TimeoutHierarchyTest, ParseOverrideAcceptsOnlyWholePositiveIntegers) {
    EXPECT_EQ(TimeoutHierarchy::parse_override("42").value_or(0), 42u);
    EXPECT_FALSE(TimeoutHierarchy::parse_override("42 ").has_value());
    EXPECT_FALSE(TimeoutHierarchy::parse_override("0").has_value());
    EXPECT_FALSE(TimeoutHierarchy::parse_override("4294967296").has_value());
}

}  // namespace
