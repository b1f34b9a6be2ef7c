#include <gtest/gtest.h>
#include "protocols/tools/Router.hpp"
#include "runner/TestRunner.hpp"
#include "runner/errors.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>

using namespace tr::tools;
using namespace tr::runner;
using namespace tr::process;
using json = nlohmann::json;

namespace {

class EchoExecutor final : public Executor {
public:
    [[nodiscard]] ExecutionResult run(const Invocation& invocation) const override {
        ExecutionResult r;
        r.exit_code = 0;
        r.stdout_text = invocation.commandLine();
        return r;
    }
};

int errorCode(const json& reply) { return reply["error"]["code"].get<int>(); }

}

class RouterTest : public ::testing::Test {
protected:
    Router router;

    void SetUp() override {
        tr::config::RspecConfig rspec;
        rspec.command = {"rspec"};
        rspec.default_args = {};
        tr::config::CypressConfig cypress;
        cypress.command = {"cypress", "run", "--spec"};

        registerTestRunnerTools(router, std::make_shared<const TestRunner>(rspec, cypress, std::make_shared<EchoExecutor>()));
    }
};

TEST_F(RouterTest, ListsToolsInRegistrationOrder) {
    const auto tools = router.listTools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "run_rspec");
    EXPECT_EQ(tools[1]["name"], "run_rspec_args");
    EXPECT_EQ(tools[2]["name"], "run_cypress");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], json::array({"file"}));
}

TEST_F(RouterTest, ServerInfo) {
    const auto info = Router::serverInfo();
    EXPECT_EQ(info["name"], "testrunner");
    EXPECT_FALSE(info["version"].get<std::string>().empty());
}

TEST_F(RouterTest, RunRspecSucceeds) {
    const auto r = router.call("run_rspec", {{"file", "spec/a_spec.rb"}, {"line_numbers", {37, 87}}});
    ASSERT_TRUE(r.ok());
    EXPECT_NE(r.content.find("RSpec Test Results for: spec/a_spec.rb:37:87"), std::string::npos);
    EXPECT_NE(r.content.find("rspec spec/a_spec.rb:37:87"), std::string::npos);
}

TEST_F(RouterTest, NullLineNumbersMeansNone) {
    const auto r = router.call("run_rspec", {{"file", "spec/a_spec.rb"}, {"line_numbers", nullptr}});
    ASSERT_TRUE(r.ok());
    EXPECT_NE(r.content.find("for: spec/a_spec.rb\n"), std::string::npos);
}

TEST_F(RouterTest, ValidationFailureIsInvalidParams) {
    const auto r = router.call("run_rspec", {{"file", "../secrets_spec.rb"}});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->code, ErrorCode::InvalidParams);
    EXPECT_NE(r.error->message.find("traversal"), std::string::npos);
}

TEST_F(RouterTest, WrongArgumentShapesAreInvalidParams) {
    EXPECT_EQ(router.call("run_rspec", json::object()).error->code, ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("run_rspec", {{"file", 5}}).error->code, ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("run_rspec", {{"file", "spec/a_spec.rb"}, {"line_numbers", {1.5}}}).error->code,
              ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("run_rspec", {{"file", "spec/a_spec.rb"}, {"line_numbers", {UINT64_MAX}}}).error->code,
              ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("run_rspec_args", {{"args", "--dry-run"}}).error->code, ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("run_rspec_args", {{"args", {"--dry-run", 3}}}).error->code, ErrorCode::InvalidParams);
}

TEST_F(RouterTest, NegativeLineNumberReachesValidation) {
    const auto r = router.call("run_rspec", {{"file", "spec/a_spec.rb"}, {"line_numbers", {-3}}});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->code, ErrorCode::InvalidParams);
    EXPECT_NE(r.error->message.find("-3"), std::string::npos);
}

TEST_F(RouterTest, UnknownToolIsMethodNotFound) {
    const auto r = router.call("run_jest", json::object());
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->code, ErrorCode::MethodNotFound);
}

TEST_F(RouterTest, HandlerExceptionsMapToCodes) {
    router.registerTool({"broken", "", json::object(), [](const json&) -> std::string {
        throw InternalError("Test runner command failed: exec");
    }});
    router.registerTool({"bad_input", "", json::object(), [](const json&) -> std::string {
        throw std::invalid_argument("nope");
    }});
    router.registerTool({"other", "", json::object(), [](const json&) -> std::string {
        throw std::runtime_error("disk on fire");
    }});

    EXPECT_EQ(router.call("broken", {}).error->code, ErrorCode::InternalError);
    EXPECT_EQ(router.call("bad_input", {}).error->code, ErrorCode::InvalidParams);
    EXPECT_EQ(router.call("other", {}).error->code, ErrorCode::InternalError);
    EXPECT_EQ(router.listTools().size(), 6u);
}

TEST_F(RouterTest, HandleRequestDispatchesMethods) {
    const auto list = router.handleRequest({{"method", "tools/list"}});
    EXPECT_TRUE(list["ok"].get<bool>());
    EXPECT_EQ(list["tools"].size(), 3u);

    const auto info = router.handleRequest({{"method", "server/info"}});
    EXPECT_EQ(info["server"]["name"], "testrunner");

    const auto call = router.handleRequest(
        {{"method", "tools/call"}, {"tool", "run_rspec_args"}, {"arguments", {{"args", {"--dry-run"}}}}});
    EXPECT_TRUE(call["ok"].get<bool>());
    EXPECT_NE(call["content"].get<std::string>().find("Command: rspec --dry-run"), std::string::npos);
}

TEST_F(RouterTest, HandleRequestErrorReplies) {
    EXPECT_EQ(errorCode(router.handleRequest({{"method", "tools/delete"}})), static_cast<int>(ErrorCode::MethodNotFound));
    EXPECT_EQ(errorCode(router.handleRequest({{"method", 7}})), static_cast<int>(ErrorCode::InvalidParams));
    EXPECT_EQ(errorCode(router.handleRequest({{"method", "tools/call"}})), static_cast<int>(ErrorCode::InvalidParams));
    EXPECT_EQ(errorCode(router.handleRequest({{"tool", "run_cypress"}, {"arguments", "x"}})),
              static_cast<int>(ErrorCode::InvalidParams));
    EXPECT_EQ(errorCode(router.handleRequest(json::array())), static_cast<int>(ErrorCode::InvalidParams));

    const auto reply = router.handleRequest({{"tool", "run_cypress"}, {"arguments", {{"file", "spec/a_spec.rb"}}}});
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_FALSE(reply["error"]["message"].get<std::string>().empty());
}
