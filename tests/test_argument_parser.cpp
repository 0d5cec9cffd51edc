#include "core/ArgumentParser.h"
#include "core/Config.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <vector>
#include <string>

namespace lan_probe {

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<const char*> args) {
        args.insert(args.begin(), "lan-probe");
        return parser.parse(static_cast<int>(args.size()), const_cast<char**>(args.data()), cfg);
    }

    ArgumentParser parser;
    Config cfg;
};

// Test discovery mode with a positional subnet
TEST_F(ArgumentParserTest, ParseDiscoverWithSubnet) {
    EXPECT_TRUE(parse({"discover", "10.0.0.0/24", "--limit", "5"}));
    EXPECT_EQ(cfg.mode, Mode::Discover);
    EXPECT_EQ(cfg.positional, "10.0.0.0/24");
    EXPECT_EQ(cfg.host_limit, 5);
}

TEST_F(ArgumentParserTest, ParsePortsWithRanges) {
    EXPECT_TRUE(parse({"--ports", "22,80-82,443", "ports", "127.0.0.1"}));
    EXPECT_EQ(cfg.mode, Mode::Ports);
    EXPECT_EQ(cfg.positional, "127.0.0.1");
    EXPECT_EQ(cfg.ports, (std::vector<uint16_t>{22, 80, 81, 82, 443}));
}

TEST_F(ArgumentParserTest, RunModeJoinsRemainingArguments) {
    EXPECT_TRUE(parse({"--command-timeout", "5", "run", "ping", "-c", "2", "127.0.0.1"}));
    EXPECT_EQ(cfg.mode, Mode::Run);
    EXPECT_EQ(cfg.positional, "ping -c 2 127.0.0.1");
    EXPECT_EQ(cfg.command_timeout_s, 5);
}

TEST_F(ArgumentParserTest, DoubleDashMakesFlagsPositional) {
    EXPECT_TRUE(parse({"run", "--", "netstat", "-an"}));
    EXPECT_EQ(cfg.positional, "netstat -an");
}

TEST_F(ArgumentParserTest, DefaultsMatchOriginalTool) {
    EXPECT_TRUE(parse({"status"}));
    EXPECT_EQ(cfg.probe_timeout_ms, 800);
    EXPECT_EQ(cfg.discovery_workers, 64);
    EXPECT_EQ(cfg.port_timeout_ms, 500);
    EXPECT_EQ(cfg.scan_workers, 50);
    EXPECT_EQ(cfg.command_timeout_s, 30);
    EXPECT_EQ(cfg.liveness_ports, (std::vector<uint16_t>{80, 443, 22, 445}));
    EXPECT_TRUE(cfg.pretty);
}

TEST_F(ArgumentParserTest, QuietAndVerboseSetLogLevel) {
    EXPECT_TRUE(parse({"--quiet", "status"}));
    EXPECT_EQ(cfg.log_level, "error");
    Config other;
    const char* argv[] = {"lan-probe", "--verbose", "status"};
    EXPECT_TRUE(parser.parse(3, const_cast<char**>(argv), other));
    EXPECT_EQ(other.log_level, "debug");
}

TEST_F(ArgumentParserTest, HardeningFlags) {
    EXPECT_TRUE(parse({"--drop-priv", "--keep-cap-net-raw", "--seccomp-strict", "--sandbox-seccomp", "status"}));
    EXPECT_TRUE(cfg.drop_priv);
    EXPECT_TRUE(cfg.keep_cap_net_raw);
    EXPECT_TRUE(cfg.seccomp_strict);
    EXPECT_TRUE(cfg.sandbox_seccomp);
}

TEST_F(ArgumentParserTest, ParseHelpFlag) {
    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"--help"}));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_THAT(out, testing::HasSubstr("discover"));
    EXPECT_THAT(out, testing::HasSubstr("--ports"));
}

TEST_F(ArgumentParserTest, ParseVersionFlag) {
    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"--version"}));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_THAT(out, testing::StartsWith("lan-probe "));
}

TEST_F(ArgumentParserTest, UnknownFlagIsUsageError) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--frobnicate", "status"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_EQ(parser.error(), "Unknown arg: --frobnicate");
}

TEST_F(ArgumentParserTest, UnknownModeIsUsageError) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"sweep"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
}

TEST_F(ArgumentParserTest, MissingValue) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"status", "--output"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.error(), "Missing value for --output");
}

TEST_F(ArgumentParserTest, NonNumericIntegerRejected) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--workers", "many", "discover"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
}

TEST_F(ArgumentParserTest, InvalidPortRejected) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--ports", "0,80", "ports", "127.0.0.1"}));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_THAT(err, testing::HasSubstr("Invalid value for --ports"));
    EXPECT_EQ(parser.exit_code(), 2);
}

TEST_F(ArgumentParserTest, SecondPositionalRejected) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"ports", "10.0.0.1", "10.0.0.2"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.error(), "Unexpected argument: 10.0.0.2");
}

TEST(SplitCsvTest, SkipsEmptyItems) {
    EXPECT_EQ(split_csv("a,,b,"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split_csv("").empty());
}

}
