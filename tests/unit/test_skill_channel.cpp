#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <memory>
#include <signal.h>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "collaborators/skill_consultant.hpp"
#include "resilience/defensive.hpp"
#include "skills/skill_channel.hpp"
#include "skills/skill_client.hpp"
#include "skills/skill_supervisor.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using nlohmann::json;
using toolgate::collaborators::SkillConsultant;
using toolgate::core::config::CallBudget;
using toolgate::core::config::TimeoutHierarchy;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::registry::SkillRoute;
using toolgate::resilience::CancelToken;
using toolgate::resilience::Exited;
using toolgate::resilience::NotAlive;
using toolgate::resilience::Readiness;
using toolgate::resilience::safe_call;
using toolgate::skills::SkillChannel;
using toolgate::skills::SkillCatalog;
using toolgate::skills::SkillClient;
using toolgate::skills::SkillSpec;
using toolgate::skills::SkillSupervisor;
using toolgate::testing::TempWorkspace;
using toolgate::testing::fake_env;
using toolgate::testing::write_script;

// Line-delimited JSON-RPC skill: answers by tool name, see the case arms.
const char* kSkillScript = R"SH(#!/bin/sh
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\).*/\1/p')
  [ -z "$id" ] && continue
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05"}}\n' "$id" ;;
    *'"name":"slow"'*)
      sleep 1
      printf '{"jsonrpc":"2.0","id":%s,"result":"late"}\n' "$id" ;;
    *'"query":"wait'*)
      sleep 2
      printf '{"jsonrpc":"2.0","id":%s,"result":"late"}\n' "$id" ;;
    *'"name":"crash"'*)
      exit 3 ;;
    *'"name":"noisy"'*)
      echo "warming up"
      printf '{"jsonrpc":"2.0","method":"notifications/progress"}\n'
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"after noise"}]}}\n' "$id" ;;
    *'"name":"fail"'*)
      printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-1,"message":"tool failed"}}\n' "$id" ;;
    *'"name":"env"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":"%s"}\n' "$id" "$SKILL_GREETING" ;;
    *)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"echo"}]}}\n' "$id" ;;
  esac
done
)SH";

class SkillChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = workspace_.root() / "skill.sh";
        write_script(script_, kSkillScript);
    }

    SkillSpec spec(const std::string& name = "demo") const {
        SkillSpec result;
        result.name = name;
        result.command = script_.string();
        result.env["SKILL_GREETING"] = "hello from env";
        return result;
    }

    static json call_params(const std::string& tool) {
        return {{"name", tool}, {"arguments", json::object()}};
    }

    TempWorkspace workspace_;
    std::filesystem::path script_;
};

TEST_F(SkillChannelTest, StartsAndAnswersToolCalls) {
    auto channel = std::make_shared<SkillChannel>(spec());
    EXPECT_EQ(channel->readiness(), Readiness::NotStarted);
    ASSERT_FALSE(is_error(channel->start(5s)));
    EXPECT_EQ(channel->readiness(), Readiness::Ready);
    EXPECT_GT(channel->pid(), 0);

    const auto result = channel->request("tools/call", call_params("anything"), 5s, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"][0]["text"], "echo");
}

TEST_F(SkillChannelTest, PassesConfiguredEnvironment) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));
    const auto result = channel->request("tools/call", call_params("env"), 5s, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "hello from env");
}

TEST_F(SkillChannelTest, SkipsNoiseAndNotifications) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));
    const auto result = channel->request("tools/call", call_params("noisy"), 5s, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"][0]["text"], "after noise");
}

TEST_F(SkillChannelTest, SkillErrorBecomesGatewayError) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));
    const auto result = channel->request("tools/call", call_params("fail"), 5s, nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "tool failed");
    EXPECT_EQ(get_error(result).code, "skill_error");
}

TEST_F(SkillChannelTest, StaleResponseIsNotDeliveredToNextCall) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));

    const auto slow = channel->request("tools/call", call_params("slow"), 200ms, nullptr);
    ASSERT_TRUE(is_error(slow));
    EXPECT_EQ(get_error(slow).code, "skill_timeout");

    const auto next = channel->request("tools/call", call_params("anything"), 5s, nullptr);
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(get_value(next)["content"][0]["text"], "echo");
}

TEST_F(SkillChannelTest, AnswerWrittenJustBeforeExitIsDelivered) {
    const auto oneshot = workspace_.root() / "oneshot.sh";
    write_script(oneshot, R"SH(#!/bin/sh
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{}}\n' "$id" ;;
    *)
      printf '{"jsonrpc":"2.0","id":%s,"result":"final answer"}\n' "$id"
      exit 0 ;;
  esac
done
)SH");
    SkillSpec oneshot_spec = spec("oneshot");
    oneshot_spec.command = oneshot.string();

    for (int attempt = 0; attempt < 20; ++attempt) {
        SkillChannel channel(oneshot_spec);
        ASSERT_FALSE(is_error(channel.start(5s)));
        const auto result = channel.request("tools/call", call_params("anything"), 5s, nullptr);
        ASSERT_FALSE(is_error(result)) << "attempt " << attempt;
        EXPECT_EQ(get_value(result), "final answer");
    }
}

TEST_F(SkillChannelTest, ChannelIsCrashedAfterAnswerAndExit) {
    const auto oneshot = workspace_.root() / "answer_then_exit.sh";
    write_script(oneshot, R"SH(#!/bin/sh
read -r line
printf '{"jsonrpc":"2.0","id":1,"result":{}}\n'
read -r line
printf '{"jsonrpc":"2.0","id":2,"result":"done"}\n'
exit 0
)SH");
    SkillSpec oneshot_spec = spec("answer_then_exit");
    oneshot_spec.command = oneshot.string();

    SkillChannel channel(oneshot_spec);
    ASSERT_FALSE(is_error(channel.start(5s)));
    const auto result = channel.request("tools/call", call_params("anything"), 5s, nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "done");

    // The next call observes the exit instead of writing into a closed pipe.
    EXPECT_THROW(channel.request("tools/call", call_params("anything"), 5s, nullptr),
                 toolgate::resilience::ServiceExited);
}

TEST_F(SkillChannelTest, CancelledRequestReturnsPromptly) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));

    CancelToken token = std::make_shared<std::atomic_bool>(true);
    const auto result = channel->request("tools/call", call_params("slow"), 5s, token);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "skill_cancelled");
}

TEST_F(SkillChannelTest, ExitMidCallIsExitedThenNotAlive) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));
    std::weak_ptr<SkillChannel> weak = channel;

    auto crashed = safe_call<SkillChannel>(
        weak,
        [](SkillChannel& target, const CancelToken& token) {
            return target.request("tools/call", call_params("crash"), 5s, token);
        },
        5s);
    ASSERT_TRUE(std::holds_alternative<Exited>(crashed));
    EXPECT_EQ(std::get<Exited>(crashed).reason, "skill 'demo' exited with status 3");
    EXPECT_EQ(channel->readiness(), Readiness::Crashed);

    auto after = safe_call<SkillChannel>(
        weak,
        [](SkillChannel& target, const CancelToken& token) {
            return target.request("tools/call", call_params("anything"), 5s, token);
        },
        5s);
    EXPECT_TRUE(std::holds_alternative<NotAlive>(after));
}

TEST_F(SkillChannelTest, MissingCommandCrashesChannel) {
    SkillSpec missing = spec();
    missing.command = "toolgate-no-such-skill-binary";
    SkillChannel channel(missing);
    const auto status = channel.start(1s);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "skill_command_not_found");
    EXPECT_EQ(channel.readiness(), Readiness::Crashed);
}

TEST_F(SkillChannelTest, SkillThatNeverInitializesFailsToStart) {
    const auto mute = workspace_.root() / "mute.sh";
    write_script(mute, "#!/bin/sh\nexit 0\n");
    SkillSpec mute_spec = spec("mute");
    mute_spec.command = mute.string();

    SkillChannel channel(mute_spec);
    const auto status = channel.start(2s);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "skill_start_failed");
    EXPECT_EQ(channel.readiness(), Readiness::Crashed);
}

TEST_F(SkillChannelTest, CloseStopsTheProcess) {
    auto channel = std::make_shared<SkillChannel>(spec());
    ASSERT_FALSE(is_error(channel->start(5s)));
    const pid_t pid = channel->pid();

    channel->close();
    EXPECT_EQ(channel->readiness(), Readiness::Crashed);
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(SkillChannelTest, ClientStartsSkillLazilyAndForwardsToolName) {
    auto timeouts = std::make_shared<TimeoutHierarchy>(fake_env({}));
    SkillClient client(timeouts);
    auto channel = std::make_shared<SkillChannel>(spec());

    SkillRoute route{"demo", "env", channel};
    const auto result = client.call(route, json::object(), CallBudget{10000ms, "mcp_tool"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "hello from env");
    EXPECT_EQ(channel->readiness(), Readiness::Ready);
}

TEST_F(SkillChannelTest, ClientReportsPerCallTimeout) {
    auto timeouts =
        std::make_shared<TimeoutHierarchy>(fake_env({{"TOOLGATE_TIMEOUT_PER_CALL", "150"}}));
    SkillClient client(timeouts);
    auto channel = std::make_shared<SkillChannel>(spec());

    SkillRoute route{"demo", "slow", channel};
    const auto result = client.call(route, json::object(), CallBudget{10000ms, "mcp_tool"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "skill_timeout");
}

TEST_F(SkillChannelTest, ClientReportsRetiredChannel) {
    auto timeouts = std::make_shared<TimeoutHierarchy>(fake_env({}));
    SkillClient client(timeouts);
    SkillRoute route{"demo", "env", std::weak_ptr<SkillChannel>()};
    const auto result = client.call(route, json::object(), CallBudget{10000ms, "mcp_tool"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "skill_not_alive");
}

TEST_F(SkillChannelTest, SupervisorKeepsUnchangedChannelAcrossReplace) {
    SkillSupervisor supervisor;
    SkillCatalog catalog;
    catalog.skills = {spec("alpha"), spec("beta")};
    supervisor.replace(catalog);
    EXPECT_EQ(supervisor.skill_names(), (std::vector<std::string>{"alpha", "beta"}));

    const auto alpha = supervisor.find("alpha");
    const auto beta = supervisor.find("beta");
    ASSERT_NE(alpha, nullptr);
    ASSERT_NE(beta, nullptr);

    SkillCatalog next;
    next.skills = {spec("alpha"), spec("beta")};
    next.skills[1].args.push_back("--verbose");
    supervisor.replace(next);

    EXPECT_EQ(supervisor.find("alpha"), alpha);
    EXPECT_NE(supervisor.find("beta"), beta);
    EXPECT_EQ(supervisor.find("gamma"), nullptr);
}

TEST_F(SkillChannelTest, SupervisorReplacesCrashedChannel) {
    SkillSupervisor supervisor;
    SkillCatalog catalog;
    catalog.skills = {spec("alpha")};
    supervisor.replace(catalog);

    const auto first = supervisor.find("alpha");
    ASSERT_FALSE(is_error(first->start(5s)));
    first->close();
    ASSERT_EQ(first->readiness(), Readiness::Crashed);

    supervisor.replace(catalog);
    const auto second = supervisor.find("alpha");
    EXPECT_NE(second, first);
    EXPECT_EQ(second->readiness(), Readiness::NotStarted);
}

TEST_F(SkillChannelTest, SupervisorShutdownClosesRunningSkills) {
    SkillSupervisor supervisor;
    SkillCatalog catalog;
    catalog.skills = {spec("alpha")};
    supervisor.replace(catalog);

    const auto channel = supervisor.find("alpha");
    ASSERT_FALSE(is_error(channel->start(5s)));
    supervisor.shutdown_all();

    EXPECT_EQ(channel->readiness(), Readiness::Crashed);
    EXPECT_TRUE(supervisor.skill_names().empty());
}

TEST_F(SkillChannelTest, ConsultantStaysWithinItsBudget) {
    auto supervisor = std::make_shared<SkillSupervisor>();
    SkillCatalog catalog;
    catalog.skills = {spec("brain")};
    supervisor->replace(catalog);
    ASSERT_FALSE(is_error(supervisor->find("brain")->start(5s)));

    SkillConsultant consultant(supervisor, "brain",
                               std::make_shared<TimeoutHierarchy>(fake_env({})));
    const auto started = std::chrono::steady_clock::now();
    const auto slow = consultant.consult("wait for it", {}, CallBudget{300ms, "query"}, nullptr);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(is_error(slow));
    EXPECT_EQ(get_error(slow).code, "skill_timeout");
    EXPECT_LT(elapsed, 1500ms);

    // The channel is free again: the stale answer is skipped, the next one delivered.
    const auto next = consultant.consult("hello", {}, CallBudget{5000ms, "query"}, nullptr);
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(get_value(next), "echo");
}

TEST_F(SkillChannelTest, ConsultantHonorsCancelToken) {
    auto supervisor = std::make_shared<SkillSupervisor>();
    SkillCatalog catalog;
    catalog.skills = {spec("brain")};
    supervisor->replace(catalog);
    ASSERT_FALSE(is_error(supervisor->find("brain")->start(5s)));

    SkillConsultant consultant(supervisor, "brain",
                               std::make_shared<TimeoutHierarchy>(fake_env({})));
    CancelToken token = std::make_shared<std::atomic_bool>(true);
    const auto result = consultant.consult("wait for it", {}, CallBudget{5000ms, "query"}, token);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "skill_cancelled");
}

}  // namespace
