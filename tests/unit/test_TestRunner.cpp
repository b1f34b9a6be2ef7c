#include <gtest/gtest.h>
#include "runner/TestRunner.hpp"
#include "runner/errors.hpp"

#include <cerrno>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace tr::runner;
using namespace tr::process;
using namespace tr::config;
using Tokens = std::vector<std::string>;

namespace {

// Records every invocation and answers with a canned result instead of spawning
class RecordingExecutor final : public Executor {
public:
    ExecutionResult result;

    [[nodiscard]] ExecutionResult run(const Invocation& invocation) const override {
        std::lock_guard lock(mutex_);
        calls_.push_back(invocation);
        return result;
    }

    [[nodiscard]] std::vector<Invocation> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<Invocation> calls_;
};

class FailingExecutor final : public Executor {
public:
    [[nodiscard]] ExecutionResult run(const Invocation& invocation) const override {
        throw SpawnError(invocation.program, "exec", ENOENT);
    }
};

RspecConfig rspecConfig() {
    RspecConfig cfg;
    cfg.command = {"bundle", "exec", "rspec"};
    cfg.default_args = {"--format", "p"};
    return cfg;
}

CypressConfig cypressConfig(const std::string& workingDir = ".", const std::string& pipeline = "") {
    CypressConfig cfg;
    cfg.command = {"npx", "cypress", "run", "--spec"};
    cfg.working_dir = workingDir;
    cfg.shell_pipeline = pipeline;
    return cfg;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}

class TestRunnerTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingExecutor> executor = std::make_shared<RecordingExecutor>();

    void SetUp() override {
        executor->result.exit_code = 0;
        executor->result.stdout_text = "3 examples, 0 failures";
        executor->result.stderr_text = "";
    }

    [[nodiscard]] TestRunner runner(CypressConfig cypress = cypressConfig()) const {
        return TestRunner(rspecConfig(), std::move(cypress), executor);
    }
};

TEST_F(TestRunnerTest, RspecBuildsColonJoinedTarget) {
    const auto report = runner().runRspec("spec/a_spec.rb", {37, 87});

    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].program, "bundle");
    EXPECT_EQ(calls[0].args, (Tokens{"exec", "rspec", "--format", "p", "spec/a_spec.rb:37:87"}));

    EXPECT_EQ(report.rfind("RSpec Test Results for: spec/a_spec.rb:37:87\nExit Code: 0\n", 0), 0u);
    EXPECT_TRUE(contains(report, "Output:\n3 examples, 0 failures"));
}

TEST_F(TestRunnerTest, RspecRejectsBeforeSpawning) {
    const auto r = runner();
    EXPECT_THROW((void)r.runRspec("../etc/passwd_spec.rb"), InvalidParams);
    EXPECT_THROW((void)r.runRspec("spec/a.rb"), InvalidParams);
    EXPECT_THROW((void)r.runRspec("spec/a_spec.rb", {1, 0}), InvalidParams);
    EXPECT_TRUE(executor->calls().empty());
}

TEST_F(TestRunnerTest, OptionLikeTargetNeverReachesTheRunner) {
    const auto r = runner();
    EXPECT_THROW((void)r.runRspec("--require=/tmp/evil_spec.rb"), InvalidParams);
    EXPECT_THROW((void)r.runRspec("-rspec/a_spec.rb", {3}), InvalidParams);
    EXPECT_THROW((void)r.runCypress("--config-file=/tmp/x.cy.js"), InvalidParams);
    EXPECT_TRUE(executor->calls().empty());
}

TEST_F(TestRunnerTest, RejectionMessageNamesTheProblem) {
    try {
        (void)runner().runRspec("spec/a_spec.rb", {-7});
        FAIL() << "expected InvalidParams";
    } catch (const InvalidParams& e) {
        EXPECT_TRUE(contains(e.what(), "-7"));
    }
}

TEST_F(TestRunnerTest, NonUtf8OutputIsReportedVerbatim) {
    executor->result.exit_code = 1;
    executor->result.stdout_text = "caf\xe9 failed\n";
    const auto report = runner().runRspec("spec/a_spec.rb");
    EXPECT_TRUE(contains(report, "Output:\ncaf\xe9 failed\n"));
}

TEST_F(TestRunnerTest, NonZeroExitIsStillAReport) {
    executor->result.exit_code = 1;
    executor->result.stderr_text = "1 failure";
    const auto report = runner().runRspec("spec/a_spec.rb");
    EXPECT_TRUE(contains(report, "Exit Code: 1\n"));
    EXPECT_TRUE(contains(report, "Errors:\n1 failure"));
}

TEST_F(TestRunnerTest, SpawnFailureIsInternalError) {
    const TestRunner r(rspecConfig(), cypressConfig(), std::make_shared<FailingExecutor>());
    try {
        (void)r.runRspec("spec/a_spec.rb");
        FAIL() << "expected InternalError";
    } catch (const InternalError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Test runner command failed: ", 0), 0u);
    }
}

TEST_F(TestRunnerTest, ArgumentsPassVerbatimWithoutDefaults) {
    const Tokens tokens = {"--format", "documentation", "--tag", "focus", "spec/a_spec.rb"};
    const auto report = runner().runRspecArguments(tokens);

    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args, (Tokens{"exec", "rspec", "--format", "documentation", "--tag", "focus", "spec/a_spec.rb"}));
    EXPECT_TRUE(contains(report, "Command: bundle exec rspec --format documentation --tag focus spec/a_spec.rb\n"));
}

TEST_F(TestRunnerTest, EmptyArgumentListRunsBareCommand) {
    (void)runner().runRspecArguments({});
    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args, (Tokens{"exec", "rspec"}));
}

TEST_F(TestRunnerTest, ArgumentsAreAllOrNothing) {
    EXPECT_THROW((void)runner().runRspecArguments({"spec/x_spec.rb", "spec/y.rb"}), InvalidParams);
    EXPECT_THROW((void)runner().runRspecArguments({"--format", "json; rm -rf /"}), InvalidParams);
    EXPECT_TRUE(executor->calls().empty());
}

TEST_F(TestRunnerTest, CypressUsesArgvAndWorkingDirectory) {
    executor->result.stdout_text = "no report";
    const auto report = runner(cypressConfig("cypress")).runCypress("cypress/cypress/e2e/t.cy.js");

    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].program, "npx");
    EXPECT_EQ(calls[0].args.back(), "cypress/e2e/t.cy.js");
    ASSERT_TRUE(calls[0].working_dir.has_value());
    EXPECT_EQ(calls[0].working_dir->string(), "cypress");

    EXPECT_EQ(report.rfind("Cypress Test Results for: cypress/cypress/e2e/t.cy.js\n", 0), 0u);
}

TEST_F(TestRunnerTest, CypressCurrentDirectoryHasNoChdir) {
    executor->result.stdout_text = "no report";
    (void)runner().runCypress("./cypress/e2e/t.cy.ts");
    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].args.back(), "./cypress/e2e/t.cy.ts");
    EXPECT_FALSE(calls[0].working_dir.has_value());
}

TEST_F(TestRunnerTest, CypressShellPipelinePassesPathAsParameter) {
    executor->result.stdout_text = "no report";
    (void)runner(cypressConfig("frontend", "cd frontend && npx cypress run --spec")).runCypress("frontend/e2e/t.cy.js");

    const auto calls = executor->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].program, "/bin/sh");
    EXPECT_EQ(calls[0].args, (Tokens{"-c", "cd frontend && npx cypress run --spec \"$1\"", "testrunner", "e2e/t.cy.js"}));
}

TEST_F(TestRunnerTest, CypressRejectsRspecPath) {
    EXPECT_THROW((void)runner().runCypress("spec/a_spec.rb"), InvalidParams);
    EXPECT_TRUE(executor->calls().empty());
}

TEST_F(TestRunnerTest, CypressDegradedReportKeepsRawOutput) {
    executor->result.exit_code = 2;
    executor->result.stdout_text = "Electron crashed before printing anything";
    executor->result.stderr_text = "segfault";

    const auto report = runner().runCypress("cypress/e2e/t.cy.js");
    EXPECT_TRUE(contains(report, "Exit Code: 2\n"));
    EXPECT_TRUE(contains(report, "No JSON found in Cypress output"));
    EXPECT_TRUE(contains(report, "Raw Output:\nElectron crashed before printing anything"));
    EXPECT_TRUE(contains(report, "Errors:\nsegfault"));
}

TEST_F(TestRunnerTest, CypressParsedReportIsPrettyJson) {
    executor->result.stdout_text = R"(dbus noise
{"stats":{"suites":1,"tests":0,"passes":0,"pending":0,"failures":0,"start":"s","end":"e","duration":5},
 "tests":[],"pending":[],"failures":[],"passes":[]})";

    const auto report = runner().runCypress("cypress/e2e/t.cy.js");
    EXPECT_TRUE(contains(report, "Results:\n{\n  \"failures\": []"));
    EXPECT_FALSE(contains(report, "dbus noise"));
}

TEST_F(TestRunnerTest, RealExecutorRunsConfiguredCommand) {
    RspecConfig echo;
    echo.command = {"/bin/echo", "rspec"};
    echo.default_args = {};
    const TestRunner r(echo, cypressConfig());

    const auto report = r.runRspec("spec/a_spec.rb", {12});
    EXPECT_TRUE(contains(report, "Exit Code: 0\n"));
    EXPECT_TRUE(contains(report, "Output:\nrspec spec/a_spec.rb:12\n"));
}

TEST_F(TestRunnerTest, EmptyCommandTemplateThrowsOnConstruction) {
    RspecConfig empty;
    empty.command = {};
    EXPECT_THROW((void)TestRunner(empty, cypressConfig(), executor), std::invalid_argument);
}
