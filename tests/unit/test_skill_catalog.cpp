#include <cstdlib>
#include <string>
#include <gtest/gtest.h>
#include "skills/skill_catalog.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::skills::interpolate_env;
using toolgate::skills::load_skill_catalog;
using toolgate::skills::parse_skill_catalog;
using toolgate::testing::TempWorkspace;
using toolgate::testing::write_file;

TEST(SkillCatalogTest, ParsesFullEntry) {
    const json document = json::parse(R"({
        "search": {
            "command": "python3",
            "args": ["-m", "search_skill"],
            "env": {"MODE": "fast", "RETRIES": 3},
            "tools": [
                {"name": "query", "description": "Search the index",
                 "inputSchema": {"type": "object", "required": ["q"]}},
                {"name": "stats"}
            ]
        }
    })");
    const auto parsed = parse_skill_catalog(document);
    ASSERT_FALSE(is_error(parsed));
    const auto& catalog = get_value(parsed);
    ASSERT_EQ(catalog.skills.size(), 1u);

    const auto& skill = catalog.skills.front();
    EXPECT_EQ(skill.name, "search");
    EXPECT_EQ(skill.command, "python3");
    ASSERT_EQ(skill.args.size(), 2u);
    EXPECT_EQ(skill.env.at("MODE"), "fast");
    EXPECT_EQ(skill.env.at("RETRIES"), "3");
    ASSERT_EQ(skill.tools.size(), 2u);
    EXPECT_EQ(skill.tools[0].input_schema["required"][0], "q");
    EXPECT_EQ(skill.tools[1].input_schema["type"], "object");
}

TEST(SkillCatalogTest, RejectsBadShapes) {
    for (const char* text : {R"([])", R"({"s": "cmd"})", R"({"s": {}})", R"({"s": {"command": ""}})",
                             R"({"s": {"command": "x", "args": "y"}})",
                             R"({"s": {"command": "x", "args": [1]}})",
                             R"({"s": {"command": "x", "tools": [{"description": "no name"}]}})"}) {
        const auto parsed = parse_skill_catalog(json::parse(text));
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_catalog") << text;
    }
}

TEST(SkillCatalogTest, InterpolatesEnvironment) {
    ASSERT_EQ(setenv("TOOLGATE_TEST_TOKEN", "s3cret", 1), 0);
    EXPECT_EQ(interpolate_env("Bearer ${TOOLGATE_TEST_TOKEN}"), "Bearer s3cret");
    EXPECT_EQ(interpolate_env("${TOOLGATE_TEST_UNSET_VAR}-x"), "-x");
    EXPECT_EQ(interpolate_env("no vars"), "no vars");
    EXPECT_EQ(interpolate_env("${unterminated"), "${unterminated");
    unsetenv("TOOLGATE_TEST_TOKEN");
}

TEST(SkillCatalogTest, LoadsFromFile) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "skills.json";
    write_file(path, R"({"echo": {"command": "/bin/cat", "tools": [{"name": "say"}]}})");

    const auto loaded = load_skill_catalog(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).skills.front().tools.front().name, "say");
}

TEST(SkillCatalogTest, ReportsMissingAndInvalidFiles) {
    TempWorkspace workspace;
    const auto missing = load_skill_catalog(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "catalog_not_found");

    const auto path = workspace.root() / "broken.json";
    write_file(path, "{ not json");
    const auto broken = load_skill_catalog(path);
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_catalog");
}

TEST(SkillCatalogTest, SameLaunchIgnoresTools) {
    toolgate::skills::SkillSpec a;
    a.command = "/bin/cat";
    toolgate::skills::SkillSpec b = a;
    b.tools.push_back({"extra", "", json::object()});
    EXPECT_TRUE(a.same_launch(b));
    b.env["X"] = "1";
    EXPECT_FALSE(a.same_launch(b));
}

}  // namespace
