#include "Operations.h"
#include "Privilege.h"
#include "BuildInfo.h"
#include "Errors.h"
#include "Logging.h"
#include "../net/Subnet.h"
#include "../sandbox/CommandPolicy.h"
#include <sys/utsname.h>

namespace lan_probe {

DiscoveryReport discover(const std::optional<std::string>& subnet, const DiscoveryOptions& opts){
    std::string cidr = (subnet && !subnet->empty()) ? *subnet : default_subnet();
    auto prober = HostProber::create_default(opts.prober, opts.liveness_ports);
    DiscoveryCoordinator coordinator(opts, *prober);
    return coordinator.discover(cidr);
}

PortScanReport scan_ports(const std::string& address, const std::vector<uint16_t>& ports, const PortScanOptions& opts){
    TcpPortProber prober;
    PortScanCoordinator coordinator(opts, prober);
    return coordinator.scan(address, ports);
}

CommandOutcome run_command(const std::string& raw, const SandboxOptions& opts){
    ForkExecRunner runner;
    CommandSandbox sandbox(opts, runner);
    return sandbox.run(CommandRequest{raw});
}

StatusReport status(const Config& cfg){
    StatusReport s;
    s.version = buildinfo::APP_VERSION;
    struct utsname u{};
    if(uname(&u) == 0) s.platform = std::string(u.sysname) + " " + u.machine;
    if(!cfg.subnet.empty()){
        s.default_subnet = cfg.subnet;
    } else {
        try {
            s.default_subnet = default_subnet();
        } catch(const InvalidSubnet& e) {
            Logger::instance().warn(std::string("status: ") + e.what());
        }
    }
    s.common_ports = common_ports();
    s.allowed_commands = CommandPolicy::allowed_names();
    s.privilege_available = is_privilege_available();
    s.seccomp_available = is_seccomp_available();
    return s;
}

DiscoveryOptions discovery_options_from(const Config& cfg){
    DiscoveryOptions o;
    o.probe_timeout_ms = cfg.probe_timeout_ms;
    o.deadline_ms = cfg.discovery_deadline_ms;
    o.workers = cfg.discovery_workers;
    o.host_limit = cfg.host_limit;
    o.max_hosts = cfg.max_hosts;
    o.prober.escalate_on_silence = cfg.escalate_on_silence;
    o.prober.resolve_hostnames = cfg.resolve_hostnames;
    o.prober.lookup_mac = cfg.lookup_mac;
    o.liveness_ports = cfg.liveness_ports;
    return o;
}

PortScanOptions port_scan_options_from(const Config& cfg){
    PortScanOptions o;
    o.port_timeout_ms = cfg.port_timeout_ms;
    o.deadline_ms = cfg.scan_deadline_ms;
    o.workers = cfg.scan_workers;
    return o;
}

SandboxOptions sandbox_options_from(const Config& cfg){
    SandboxOptions o;
    o.timeout = std::chrono::seconds(cfg.command_timeout_s);
    o.max_output_bytes = cfg.max_output_bytes;
    o.seccomp_child = cfg.sandbox_seccomp;
    return o;
}

}
