#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Operations.h"
#include "../src/core/Errors.h"
#include "../src/core/Logging.h"
#include "../src/core/Privilege.h"
#include "../src/net/Socket.h"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using ::testing::Contains;

namespace lan_probe {

class OperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
};

TEST_F(OperationsTest, StatusReportsCapabilities) {
    Config cfg;
    StatusReport s;
    EXPECT_NO_THROW(s = status(cfg));
    EXPECT_FALSE(s.version.empty());
    EXPECT_FALSE(s.platform.empty());
    EXPECT_EQ(s.common_ports, common_ports());
    EXPECT_THAT(s.allowed_commands, Contains("ping"));
    EXPECT_THAT(s.allowed_commands, Contains("netstat"));
    EXPECT_EQ(s.privilege_available, is_privilege_available());
    EXPECT_EQ(s.seccomp_available, is_seccomp_available());
}

TEST_F(OperationsTest, StatusUsesConfiguredSubnet) {
    Config cfg;
    cfg.subnet = "10.20.30.0/24";
    EXPECT_EQ(status(cfg).default_subnet, "10.20.30.0/24");
}

TEST_F(OperationsTest, RunCommandRejectsDestructiveInput) {
    CommandOutcome out = run_command("rm -rf /", SandboxOptions{});
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.disposition, CommandDisposition::Rejected);
    EXPECT_FALSE(out.exit_code.has_value());
}

TEST_F(OperationsTest, DiscoverRejectsPointToPointPrefix) {
    DiscoveryOptions opts;
    EXPECT_THROW(discover(std::string("10.0.0.0/31"), opts), InvalidSubnet);
    EXPECT_THROW(discover(std::string("10.0.0/24"), opts), InvalidSubnet);
}

TEST_F(OperationsTest, ScanPortsFindsLoopbackListener) {
    FdGuard listener(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    ASSERT_TRUE(listener.valid());
    sockaddr_in sa = make_sockaddr(0x7F000001u, 0);
    ASSERT_EQ(::bind(listener.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)), 0);
    ASSERT_EQ(::listen(listener.get(), 8), 0);
    socklen_t len = sizeof(sa);
    ASSERT_EQ(::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&sa), &len), 0);
    uint16_t port = ntohs(sa.sin_port);

    PortScanOptions opts;
    opts.port_timeout_ms = 300;
    PortScanReport r = scan_ports("127.0.0.1", {port}, opts);
    EXPECT_EQ(r.address, "127.0.0.1");
    ASSERT_EQ(r.results.size(), 1u);
    EXPECT_EQ(r.results[0].port, port);
    EXPECT_EQ(r.results[0].state, PortState::Open);
    EXPECT_EQ(r.open_count, 1u);
}

TEST_F(OperationsTest, ScanPortsRejectsBadTarget) {
    EXPECT_THROW(scan_ports("", {80}, PortScanOptions{}), UnreachableTarget);
}

TEST_F(OperationsTest, OptionMapping) {
    Config cfg;
    cfg.probe_timeout_ms = 250;
    cfg.discovery_deadline_ms = 5000;
    cfg.discovery_workers = 8;
    cfg.host_limit = 10;
    cfg.escalate_on_silence = true;
    cfg.resolve_hostnames = false;
    cfg.liveness_ports = {8080};
    cfg.port_timeout_ms = 120;
    cfg.scan_workers = 4;
    cfg.command_timeout_s = 7;
    cfg.max_output_bytes = 1024;
    cfg.sandbox_seccomp = true;

    DiscoveryOptions d = discovery_options_from(cfg);
    EXPECT_EQ(d.probe_timeout_ms, 250);
    EXPECT_EQ(d.deadline_ms, 5000);
    EXPECT_EQ(d.workers, 8);
    EXPECT_EQ(d.host_limit, 10);
    EXPECT_TRUE(d.prober.escalate_on_silence);
    EXPECT_FALSE(d.prober.resolve_hostnames);
    EXPECT_EQ(d.liveness_ports, std::vector<uint16_t>{8080});

    PortScanOptions p = port_scan_options_from(cfg);
    EXPECT_EQ(p.port_timeout_ms, 120);
    EXPECT_EQ(p.workers, 4);

    SandboxOptions s = sandbox_options_from(cfg);
    EXPECT_EQ(s.timeout, std::chrono::milliseconds(7000));
    EXPECT_EQ(s.max_output_bytes, 1024u);
    EXPECT_TRUE(s.seccomp_child);
}

}
