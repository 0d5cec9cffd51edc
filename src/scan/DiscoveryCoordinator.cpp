#include "DiscoveryCoordinator.h"
#include "WorkerPool.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <algorithm>

namespace lan_probe {

DiscoveryReport DiscoveryCoordinator::discover(const std::string& cidr) const {
    SubnetSpec spec = parse_subnet(cidr);
    uint64_t usable = usable_host_count(spec.prefix);
    uint64_t wanted = opts_.host_limit > 0 ? std::min<uint64_t>(usable, static_cast<uint64_t>(opts_.host_limit)) : usable;
    if(wanted > opts_.max_hosts){
        throw InvalidSubnet("subnet too large: " + to_cidr(spec) + " has " + std::to_string(usable) +
                            " hosts (max " + std::to_string(opts_.max_hosts) + ")");
    }
    std::vector<uint32_t> hosts = enumerate_hosts(spec);
    if(hosts.size() > wanted) hosts.resize(static_cast<size_t>(wanted));
    Logger::instance().info("Discovering " + std::to_string(hosts.size()) + " hosts in " + to_cidr(spec));
    DiscoveryReport report = run(std::move(hosts));
    report.cidr = to_cidr(spec);
    return report;
}

DiscoveryReport DiscoveryCoordinator::run(std::vector<uint32_t> candidates) const {
    auto start = Clock::now();
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    DiscoveryReport report;
    report.devices.resize(candidates.size());
    for(size_t i = 0; i < candidates.size(); ++i) report.devices[i].address = format_ipv4(candidates[i]);

    const Deadline run_deadline = start + std::chrono::milliseconds(opts_.deadline_ms);
    const auto per_probe = std::chrono::milliseconds(opts_.probe_timeout_ms);
    WorkerPool pool(static_cast<size_t>(opts_.workers));
    // every slot is written by exactly one worker; join() publishes the writes
    report.probed_count = pool.run(candidates.size(), run_deadline, [&](size_t i){
        Deadline probe_deadline = earliest(Clock::now() + per_probe, run_deadline);
        Device d = prober_.probe(candidates[i], probe_deadline);
        d.address = report.devices[i].address;
        report.devices[i] = std::move(d);
    });

    report.deadline_exceeded = report.probed_count < candidates.size();
    if(report.deadline_exceeded){
        Logger::instance().warn("Discovery deadline elapsed; " + std::to_string(candidates.size() - report.probed_count) +
                                " hosts not probed and reported Offline");
    }
    for(const auto& d : report.devices){
        if(d.status == HostStatus::Online) ++report.online_count; else ++report.offline_count;
    }
    report.elapsed_ms = elapsed_ms(start);
    Logger::instance().info("Discovery finished: " + std::to_string(report.online_count) + " online, " +
                            std::to_string(report.offline_count) + " offline");
    return report;
}

}
