#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/sandbox/CommandSandbox.h"
#include "../src/sandbox/CommandPolicy.h"
#include "../src/core/Logging.h"
#include <cerrno>
#include <stdexcept>
#include <cstdlib>
#include <string>
#include <vector>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::DoAll;

namespace lan_probe {

class MockProcessRunner : public ProcessRunner {
public:
    MOCK_METHOD(ProcessResult, run, (const std::vector<std::string>& argv, const ProcessLimits& limits), (override));
};

static ProcessResult exited(int code, const std::string& out){
    ProcessResult r;
    r.spawned = true;
    r.exit_code = code;
    r.output = out;
    r.total_bytes = out.size();
    return r;
}

class CommandSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        opts.timeout = std::chrono::seconds(30);
        opts.max_output_bytes = 4096;
    }

    CommandOutcome run(const std::string& raw) {
        CommandSandbox sandbox(opts, runner);
        transitions.clear();
        return sandbox.run(CommandRequest{raw}, &transitions);
    }

    SandboxOptions opts;
    MockProcessRunner runner;
    std::vector<SandboxState> transitions;
};

TEST_F(CommandSandboxTest, DisallowedCommandNeverSpawns) {
    EXPECT_CALL(runner, run(_, _)).Times(0);
    CommandOutcome out = run("rm -rf /");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Rejected);
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_EQ(out.output, "Command 'rm' not allowed. Type 'help' for available commands.");
    EXPECT_THAT(transitions, ElementsAre(SandboxState::Received, SandboxState::Rejected));
}

TEST_F(CommandSandboxTest, ChainingNeverSpawns) {
    EXPECT_CALL(runner, run(_, _)).Times(0);
    CommandOutcome out = run("ping 127.0.0.1; cat /etc/shadow");
    EXPECT_FALSE(out.success);
    EXPECT_THAT(out.output, HasSubstr("metacharacter"));
}

TEST_F(CommandSandboxTest, HelpIsRejectedWithText) {
    EXPECT_CALL(runner, run(_, _)).Times(0);
    CommandOutcome out = run("help");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Rejected);
    EXPECT_EQ(out.output, CommandPolicy::help_text());
}

TEST_F(CommandSandboxTest, ValidatedCommandRunsOnceAsArgv) {
    std::vector<std::string> argv;
    ProcessLimits limits;
    EXPECT_CALL(runner, run(_, _)).WillOnce(DoAll(SaveArg<0>(&argv), SaveArg<1>(&limits), Return(exited(0, "64 bytes from 127.0.0.1\n"))));
    CommandOutcome out = run("ping -c 2 127.0.0.1");
    EXPECT_TRUE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Completed);
    ASSERT_TRUE(out.exit_code.has_value());
    EXPECT_EQ(*out.exit_code, 0);
    EXPECT_EQ(out.output, "64 bytes from 127.0.0.1\n");
    EXPECT_THAT(argv, ElementsAre("ping", "-c", "2", "-W", "2", "127.0.0.1"));
    EXPECT_EQ(limits.timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(limits.max_output_bytes, 4096u);
    EXPECT_THAT(transitions, ElementsAre(SandboxState::Received, SandboxState::Validated,
                                         SandboxState::Executing, SandboxState::Completed));
}

TEST_F(CommandSandboxTest, NonZeroExitIsNotSuccess) {
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(exited(1, "ping: unknown host\n")));
    CommandOutcome out = run("ping nowhere.invalid");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Completed);
    ASSERT_TRUE(out.exit_code.has_value());
    EXPECT_EQ(*out.exit_code, 1);
}

TEST_F(CommandSandboxTest, UnknownExitStatusIsNotSuccess) {
    ProcessResult r;
    r.spawned = true;
    r.wait_errno = ECHILD;
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(r));
    CommandOutcome out = run("ifconfig");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Completed);
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_THAT(out.output, HasSubstr("exit status of 'ifconfig' unavailable"));
}

TEST_F(CommandSandboxTest, EmptyOutputMessages) {
    EXPECT_CALL(runner, run(_, _))
        .WillOnce(Return(exited(0, "")))
        .WillOnce(Return(exited(2, "")));
    EXPECT_EQ(run("ifconfig").output, "Command completed successfully.");
    EXPECT_EQ(run("ifconfig").output, "Command exited with status 2");
}

TEST_F(CommandSandboxTest, TimeoutKillsAndReports) {
    opts.timeout = std::chrono::seconds(5);
    ProcessResult r;
    r.spawned = true;
    r.timed_out = true;
    r.output = "1  10.0.0.1";
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(r));
    CommandOutcome out = run("traceroute 10.9.9.9");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::TimedOut);
    EXPECT_FALSE(out.exit_code.has_value());
    EXPECT_EQ(out.output, "1  10.0.0.1\nError: Command timed out (5 seconds)");
}

TEST_F(CommandSandboxTest, MissingBinary) {
    ProcessResult r;
    r.spawn_errno = ENOENT;
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(r));
    CommandOutcome out = run("traceroute 10.0.0.1");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::SpawnFailed);
    EXPECT_EQ(out.output, "Error: Command 'traceroute' not found");
}

TEST_F(CommandSandboxTest, SandboxSetupFailure) {
    ProcessResult r;
    r.sandbox_failed = true;
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(r));
    CommandOutcome out = run("netstat");
    EXPECT_EQ(out.disposition, CommandDisposition::SpawnFailed);
    EXPECT_THAT(out.output, HasSubstr("sandbox setup failed"));
}

TEST_F(CommandSandboxTest, TruncationMarker) {
    ProcessResult r = exited(0, std::string(4096, 'x'));
    r.truncated = true;
    r.total_bytes = 100000;
    EXPECT_CALL(runner, run(_, _)).WillOnce(Return(r));
    CommandOutcome out = run("netstat -an");
    EXPECT_TRUE(out.success);
    EXPECT_EQ(out.output, std::string(4096, 'x') + "\n[output truncated: 100000 bytes total]");
}

TEST_F(CommandSandboxTest, ThrowingRunnerStillYieldsOutcome) {
    EXPECT_CALL(runner, run(_, _)).WillOnce(testing::Throw(std::runtime_error("fork bomb")));
    CommandOutcome out;
    EXPECT_NO_THROW(out = run("ifconfig"));
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::SpawnFailed);
}

TEST(CommandSandboxMessages, TimeoutFormatting) {
    EXPECT_EQ(CommandSandbox::timeout_message(std::chrono::seconds(30)), "Error: Command timed out (30 seconds)");
    EXPECT_EQ(CommandSandbox::timeout_message(std::chrono::milliseconds(1500)), "Error: Command timed out (1.5 seconds)");
}

static bool have_ping(){
    return std::system("command -v ping >/dev/null 2>&1") == 0;
}

TEST(CommandSandboxLive, PingLoopbackSucceeds) {
    if (!have_ping()) GTEST_SKIP() << "ping not installed";
    Logger::instance().set_level(LogLevel::Error);
    SandboxOptions opts;
    opts.timeout = std::chrono::seconds(15);
    ForkExecRunner runner;
    CommandSandbox sandbox(opts, runner);
    CommandOutcome out = sandbox.run(CommandRequest{"ping -c 1 127.0.0.1"});
    if (out.disposition == CommandDisposition::Completed && !out.success &&
        out.output.find("ermission") != std::string::npos) {
        GTEST_SKIP() << "ping not permitted here: " << out.output;
    }
    EXPECT_TRUE(out.success) << out.output;
    EXPECT_FALSE(out.output.empty());
}

TEST(CommandSandboxLive, DisallowedCommandWithRealRunner) {
    ForkExecRunner runner;
    CommandSandbox sandbox(SandboxOptions{}, runner);
    CommandOutcome out = sandbox.run(CommandRequest{"rm -rf /"});
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Rejected);
}

}
