#pragma once
#include "Types.h"
#include "Config.h"
#include <string>

namespace lan_probe {

// Serializes operation results. Keys are emitted in sorted order; pretty
// output unless cfg.compact.
class JSONWriter {
public:
    std::string write(const DiscoveryReport& report, const Config& cfg) const;
    std::string write(const PortScanReport& report, const Config& cfg) const;
    std::string write(const CommandOutcome& outcome, const Config& cfg) const;
    std::string write(const StatusReport& status, const Config& cfg) const;
};

}
