#pragma once
#include "Types.h"
#include "Config.h"
#include "../scan/DiscoveryCoordinator.h"
#include "../scan/PortScanCoordinator.h"
#include "../sandbox/CommandSandbox.h"
#include <optional>
#include <string>
#include <vector>

namespace lan_probe {

// Empty subnet uses default_subnet(). Throws InvalidSubnet.
DiscoveryReport discover(const std::optional<std::string>& subnet, const DiscoveryOptions& opts);

// Empty ports uses common_ports(). Throws UnreachableTarget.
PortScanReport scan_ports(const std::string& address, const std::vector<uint16_t>& ports, const PortScanOptions& opts);

CommandOutcome run_command(const std::string& raw, const SandboxOptions& opts);

StatusReport status(const Config& cfg);

DiscoveryOptions discovery_options_from(const Config& cfg);
PortScanOptions port_scan_options_from(const Config& cfg);
SandboxOptions sandbox_options_from(const Config& cfg);

}
