#pragma once
#include "Socket.h"
#include "../core/Types.h"
#include <string>
#include <cstdint>

namespace lan_probe {

// One connection attempt per (host, port); never retries.
class PortProbe {
public:
    virtual ~PortProbe() = default;
    virtual PortState probe(uint32_t addr, uint16_t port, Deadline deadline) = 0;
};

class TcpPortProber : public PortProbe {
public:
    PortState probe(uint32_t addr, uint16_t port, Deadline deadline) override;
};

// Open on connect, Closed on refusal, Filtered on everything else.
PortState classify(ConnectStatus st);

// Service name from the system services table ("" when unknown).
std::string service_name(uint16_t port);

}
