#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace lan_probe {

enum class HostStatus { Online, Offline };

struct Device {
    std::string address;                       // dotted quad, unique within one run
    std::string hostname;                      // empty when reverse lookup failed
    HostStatus status = HostStatus::Offline;
    std::optional<std::string> hardware_address;
    std::string method = "none";               // icmp | tcp:<port> | none
    std::optional<double> latency_ms;
};

enum class PortState { Open, Closed, Filtered };

struct PortResult {
    uint16_t port = 0;
    PortState state = PortState::Filtered;
    std::string service; // well-known service name, may be empty
};

struct CommandRequest {
    std::string raw;
};

enum class CommandDisposition { Completed, Rejected, TimedOut, SpawnFailed };

struct CommandOutcome {
    bool success = false;
    std::string output;
    std::optional<int> exit_code;
    CommandDisposition disposition = CommandDisposition::Rejected;
};

struct DiscoveryReport {
    std::string cidr;
    std::vector<Device> devices; // ascending by address value
    size_t online_count = 0;
    size_t offline_count = 0;
    size_t probed_count = 0;     // probes actually launched before the run deadline
    bool deadline_exceeded = false;
    double elapsed_ms = 0;
};

struct PortScanReport {
    std::string target;          // as given by the caller
    std::string address;         // resolved dotted quad
    std::vector<PortResult> results; // ascending by port
    size_t open_count = 0;
    bool deadline_exceeded = false;
    double elapsed_ms = 0;
};

struct StatusReport {
    std::string version;
    std::string platform;
    std::string default_subnet;
    std::vector<uint16_t> common_ports;
    std::vector<std::string> allowed_commands;
    bool privilege_available = false;
    bool seccomp_available = false;
};

const char* to_string(HostStatus s);
const char* to_string(PortState s);
const char* to_string(CommandDisposition d);

}
