#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace lan_probe {

enum class Mode { None, Discover, Ports, Run, Status };

struct Config {
    Mode mode = Mode::None;
    std::string positional; // subnet (discover), target (ports) or command text (run)

    // Discovery
    std::string subnet; // explicit CIDR; empty = SUBNET_CIDR env, then autodetect, then fallback
    int host_limit = 0; // 0 = probe every usable address
    size_t max_hosts = 65536; // larger candidate sets are refused
    int probe_timeout_ms = 800;
    int discovery_deadline_ms = 60000;
    int discovery_workers = 64;
    std::vector<uint16_t> liveness_ports = {80, 443, 22, 445};
    bool resolve_hostnames = true;
    bool lookup_mac = true;
    bool escalate_on_silence = false; // also try tcp fallback when icmp works but stays silent

    // Port scan
    std::vector<uint16_t> ports; // empty = common ports
    std::string ports_file; // newline-delimited ports, '#' comments
    int port_timeout_ms = 500;
    int scan_deadline_ms = 30000;
    int scan_workers = 50;

    // Command sandbox
    int command_timeout_s = 30;
    size_t max_output_bytes = 64 * 1024;
    bool sandbox_seccomp = false;

    // Output
    std::string output_file;
    bool pretty = true;
    bool compact = false;
    std::string write_env_file;
    std::string log_level; // empty = info

    // Process hardening
    bool drop_priv = false;
    bool keep_cap_net_raw = false;
    bool seccomp = false;
    bool seccomp_strict = false;
};

Config& config();
void set_config(const Config& c);

extern const char* const kFallbackSubnet;
const std::vector<uint16_t>& common_ports();

}
