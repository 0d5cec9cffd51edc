#pragma once
#include "../core/Types.h"
#include "../net/HostProber.h"
#include "../net/Subnet.h"
#include <vector>
#include <string>

namespace lan_probe {

struct DiscoveryOptions {
    int probe_timeout_ms = 800;
    int deadline_ms = 60000;
    int workers = 64;
    int host_limit = 0;          // 0 = no limit
    size_t max_hosts = 65536;
    HostProberOptions prober;
    std::vector<uint16_t> liveness_ports = {80, 443, 22, 445};
};

class DiscoveryCoordinator {
public:
    DiscoveryCoordinator(DiscoveryOptions opts, HostProbe& prober) : opts_(std::move(opts)), prober_(prober) {}

    // Enumerates cidr and probes every usable address. Throws InvalidSubnet.
    DiscoveryReport discover(const std::string& cidr) const;

    // Probes the given addresses; duplicates collapse. One Device per distinct
    // address, ascending, whether or not its probe ran before the deadline.
    DiscoveryReport run(std::vector<uint32_t> candidates) const;

private:
    DiscoveryOptions opts_;
    HostProbe& prober_;
};

}
