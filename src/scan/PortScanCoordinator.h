#pragma once
#include "../core/Types.h"
#include "../net/PortProber.h"
#include <vector>
#include <string>

namespace lan_probe {

struct PortScanOptions {
    int port_timeout_ms = 500;
    int deadline_ms = 30000;
    int workers = 50;
    bool service_names = true;
};

// Dotted quad or IPv4 hostname. Throws UnreachableTarget.
uint32_t resolve_target(const std::string& target);

class PortScanCoordinator {
public:
    PortScanCoordinator(PortScanOptions opts, PortProbe& prober) : opts_(opts), prober_(prober) {}

    // Empty ports means the common-ports list. Port 0 throws std::invalid_argument.
    PortScanReport scan(const std::string& target, std::vector<uint16_t> ports) const;

    PortScanReport run(uint32_t addr, std::vector<uint16_t> ports) const;

private:
    PortScanOptions opts_;
    PortProbe& prober_;
};

}
