#pragma once
#include "Reachability.h"
#include "HostResolver.h"
#include "../core/Types.h"
#include <memory>
#include <vector>

namespace lan_probe {

class HostProbe {
public:
    virtual ~HostProbe() = default;
    virtual Device probe(uint32_t addr, Deadline deadline) = 0;
};

struct HostProberOptions {
    bool escalate_on_silence = false;
    bool resolve_hostnames = true;
    bool lookup_mac = true;
};

// Per-host liveness: ReachabilityAttempted -> (Escalated) -> Done.
enum class LivenessStage { ReachabilityAttempted, Escalated, Done };

class HostProber : public HostProbe {
public:
    HostProber(HostProberOptions opts,
               std::unique_ptr<ReachabilityStrategy> primary,
               std::unique_ptr<ReachabilityStrategy> fallback,
               std::unique_ptr<HostResolver> resolver);

    // ICMP echo, TCP connect on fallback_ports, system resolver.
    static std::unique_ptr<HostProber> create_default(HostProberOptions opts, std::vector<uint16_t> fallback_ports);

    // Naming is part of the probe budget: a reverse lookup still pending at
    // the deadline is abandoned and the hostname left empty.
    Device probe(uint32_t addr, Deadline deadline) override;

    static LivenessStage next_stage(LivenessStage current, ProbeVerdict verdict, bool escalate_on_silence);

private:
    HostProberOptions opts_;
    std::unique_ptr<ReachabilityStrategy> primary_;
    std::unique_ptr<ReachabilityStrategy> fallback_;
    std::shared_ptr<HostResolver> resolver_; // shared with an abandoned lookup thread
};

}
