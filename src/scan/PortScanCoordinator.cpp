#include "PortScanCoordinator.h"
#include "WorkerPool.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../net/Subnet.h"
#include <algorithm>
#include <stdexcept>
#include <netdb.h>
#include <sys/socket.h>

namespace lan_probe {

uint32_t resolve_target(const std::string& target){
    if(target.empty()) throw UnreachableTarget("empty target");
    uint32_t addr = 0;
    if(parse_ipv4(target, addr)) return addr;
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(target.c_str(), nullptr, &hints, &res);
    if(rc != 0 || !res){
        throw UnreachableTarget("'" + target + "': " + ::gai_strerror(rc));
    }
    addr = ntohl(reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr.s_addr);
    ::freeaddrinfo(res);
    return addr;
}

PortScanReport PortScanCoordinator::scan(const std::string& target, std::vector<uint16_t> ports) const {
    uint32_t addr = resolve_target(target);
    if(ports.empty()) ports = common_ports();
    Logger::instance().info("Scanning " + std::to_string(ports.size()) + " ports on " + target);
    PortScanReport report = run(addr, std::move(ports));
    report.target = target;
    return report;
}

PortScanReport PortScanCoordinator::run(uint32_t addr, std::vector<uint16_t> ports) const {
    if(std::find(ports.begin(), ports.end(), uint16_t{0}) != ports.end()){
        throw std::invalid_argument("port 0 cannot be scanned");
    }
    auto start = Clock::now();
    std::sort(ports.begin(), ports.end());
    ports.erase(std::unique(ports.begin(), ports.end()), ports.end());

    PortScanReport report;
    report.address = format_ipv4(addr);
    report.target = report.address;
    report.results.resize(ports.size());
    for(size_t i = 0; i < ports.size(); ++i){
        report.results[i].port = ports[i];
        report.results[i].state = PortState::Filtered;
    }

    const Deadline run_deadline = start + std::chrono::milliseconds(opts_.deadline_ms);
    const auto per_port = std::chrono::milliseconds(opts_.port_timeout_ms);
    WorkerPool pool(static_cast<size_t>(opts_.workers));
    size_t started = pool.run(ports.size(), run_deadline, [&](size_t i){
        report.results[i].state = prober_.probe(addr, ports[i], earliest(Clock::now() + per_port, run_deadline));
    });
    report.deadline_exceeded = started < ports.size();
    if(report.deadline_exceeded){
        Logger::instance().warn("Port scan deadline elapsed; " + std::to_string(ports.size() - started) +
                                " ports not probed and reported filtered");
    }

    for(auto& r : report.results){
        if(r.state == PortState::Open) ++report.open_count;
        if(opts_.service_names) r.service = service_name(r.port);
    }
    report.elapsed_ms = elapsed_ms(start);
    Logger::instance().info("Port scan of " + report.address + " finished: " + std::to_string(report.open_count) + " open");
    return report;
}

}
