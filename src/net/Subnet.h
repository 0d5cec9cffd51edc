#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace lan_probe {

// IPv4 network in host byte order. prefix is always within [1,30] once parsed.
struct SubnetSpec {
    uint32_t network = 0;
    int prefix = 0;
};

constexpr int kMinPrefix = 1;
constexpr int kMaxPrefix = 30;

// Strict dotted-quad parse; no hostnames, no shorthand forms.
bool parse_ipv4(const std::string& text, uint32_t& out);
std::string format_ipv4(uint32_t addr);

// "a.b.c.d/p". Host bits of the base are masked off. Throws InvalidSubnet.
SubnetSpec parse_subnet(const std::string& cidr);
SubnetSpec make_subnet(uint32_t base, int prefix);
std::string to_cidr(const SubnetSpec& s);

uint64_t usable_host_count(int prefix);

// Usable hosts (network and broadcast excluded), ascending. Pure.
std::vector<uint32_t> enumerate_hosts(const SubnetSpec& s);
std::vector<std::string> enumerate_host_addresses(const std::string& cidr);

struct InterfaceAddress {
    std::string name;
    uint32_t address = 0;
    uint32_t netmask = 0;
};

// Up, non-loopback IPv4 interfaces in kernel order.
std::vector<InterfaceAddress> local_ipv4_interfaces();

// First interface with a prefix in [1,30]. std::nullopt for an empty list;
// throws InvalidSubnet when interfaces exist but none is usable (/31, /32 links).
std::optional<SubnetSpec> choose_local_subnet(const std::vector<InterfaceAddress>& interfaces);

std::optional<SubnetSpec> detect_local_subnet();

// SUBNET_CIDR environment variable, then the detected local subnet, then
// 192.168.1.0/24 when the host has no IPv4 interface at all. Throws InvalidSubnet.
std::string default_subnet();

}
