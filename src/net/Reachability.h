#pragma once
#include "Socket.h"
#include <string>
#include <vector>
#include <cstdint>

namespace lan_probe {

enum class ProbeVerdict {
    Alive,       // the host answered
    Silent,      // strategy ran, nothing came back before the deadline
    Unsupported  // the environment does not allow this strategy at all
};

struct ProbeEvidence {
    ProbeVerdict verdict = ProbeVerdict::Silent;
    std::string method;   // "icmp", "tcp:443", ...
    double latency_ms = 0;
};

class ReachabilityStrategy {
public:
    virtual ~ReachabilityStrategy() = default;
    virtual std::string name() const = 0;
    virtual ProbeEvidence probe(uint32_t addr, Deadline deadline) = 0;
};

// ICMP echo through an unprivileged ping socket, else a raw socket.
class IcmpEchoStrategy : public ReachabilityStrategy {
public:
    std::string name() const override { return "icmp"; }
    ProbeEvidence probe(uint32_t addr, Deadline deadline) override;
};

// Connects to every port at once; a completed or refused handshake proves liveness.
class TcpConnectStrategy : public ReachabilityStrategy {
public:
    explicit TcpConnectStrategy(std::vector<uint16_t> ports) : ports_(std::move(ports)) {}
    std::string name() const override { return "tcp"; }
    ProbeEvidence probe(uint32_t addr, Deadline deadline) override;
    const std::vector<uint16_t>& ports() const { return ports_; }
private:
    std::vector<uint16_t> ports_;
};

uint16_t icmp_checksum(const void* data, size_t len);

}
