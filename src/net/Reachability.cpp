#include "Reachability.h"
#include "Subnet.h"
#include "../core/Logging.h"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>

namespace lan_probe {

uint16_t icmp_checksum(const void* data, size_t len){
    const auto* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for(; len > 1; p += 2, len -= 2) sum += static_cast<uint32_t>(p[0] << 8 | p[1]);
    if(len) sum += static_cast<uint32_t>(p[0] << 8);
    while(sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

static bool unsupported_errno(int err){
    return err == EACCES || err == EPERM || err == EPROTONOSUPPORT || err == EAFNOSUPPORT || err == ESOCKTNOSUPPORT;
}

ProbeEvidence IcmpEchoStrategy::probe(uint32_t addr, Deadline deadline){
    ProbeEvidence ev; ev.method = "icmp";
    bool raw = false;
    FdGuard fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if(!fd.valid()){
        int err = errno;
        fd.reset(::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP));
        if(!fd.valid()){
            if(unsupported_errno(err) || unsupported_errno(errno)){
                ev.verdict = ProbeVerdict::Unsupported;
            } else {
                Logger::instance().debug(std::string("icmp socket failed: ") + std::strerror(errno));
            }
            return ev;
        }
        raw = true;
    }

    const uint16_t ident = static_cast<uint16_t>(::getpid() & 0xFFFF);
    const uint16_t seq = static_cast<uint16_t>(addr & 0xFFFF);
    unsigned char packet[sizeof(icmphdr) + 16]{};
    auto* hdr = reinterpret_cast<icmphdr*>(packet);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = htons(ident);
    hdr->un.echo.sequence = htons(seq);
    std::memcpy(packet + sizeof(icmphdr), "lan-probe-echo..", 16);
    hdr->checksum = icmp_checksum(packet, sizeof(packet));

    sockaddr_in to = make_sockaddr(addr, 0);
    auto start = Clock::now();
    if(::sendto(fd.get(), packet, sizeof(packet), 0, reinterpret_cast<sockaddr*>(&to), sizeof(to)) < 0){
        if(unsupported_errno(errno)) ev.verdict = ProbeVerdict::Unsupported;
        Logger::instance().trace("icmp sendto " + format_ipv4(addr) + ": " + std::strerror(errno));
        return ev;
    }

    unsigned char buf[1500];
    while(true){
        int wait = remaining_ms(deadline);
        if(wait == 0) return ev;
        pollfd p{fd.get(), POLLIN, 0};
        int r = ::poll(&p, 1, wait);
        if(r < 0){ if(errno == EINTR) continue; return ev; }
        if(r == 0) return ev;
        sockaddr_in from{}; socklen_t fromlen = sizeof(from);
        ssize_t n = ::recvfrom(fd.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromlen);
        if(n <= 0) continue;
        if(ntohl(from.sin_addr.s_addr) != addr) continue;
        size_t off = 0;
        if(raw){
            // raw sockets see the IP header and every ICMP packet on the host
            if(static_cast<size_t>(n) < sizeof(iphdr)) continue;
            off = static_cast<size_t>(reinterpret_cast<iphdr*>(buf)->ihl) * 4;
        }
        if(static_cast<size_t>(n) < off + sizeof(icmphdr)) continue;
        const auto* reply = reinterpret_cast<const icmphdr*>(buf + off);
        if(reply->type != ICMP_ECHOREPLY) continue;
        if(raw && ntohs(reply->un.echo.id) != ident) continue;
        if(ntohs(reply->un.echo.sequence) != seq) continue;
        ev.verdict = ProbeVerdict::Alive;
        ev.latency_ms = elapsed_ms(start);
        return ev;
    }
}

ProbeEvidence TcpConnectStrategy::probe(uint32_t addr, Deadline deadline){
    ProbeEvidence ev;
    auto start = Clock::now();
    std::vector<FdGuard> socks;
    std::vector<uint16_t> pending_ports;
    for(uint16_t port : ports_){
        FdGuard fd;
        ConnectStatus st = start_connect(addr, port, fd);
        if(st == ConnectStatus::Connected || st == ConnectStatus::Refused){
            ev.verdict = ProbeVerdict::Alive;
            ev.method = "tcp:" + std::to_string(port);
            ev.latency_ms = elapsed_ms(start);
            return ev;
        }
        if(st == ConnectStatus::Pending){
            socks.push_back(std::move(fd));
            pending_ports.push_back(port);
        }
    }
    while(!socks.empty()){
        int wait = remaining_ms(deadline);
        if(wait == 0) break;
        std::vector<pollfd> pfds;
        for(const auto& s : socks) pfds.push_back(pollfd{s.get(), POLLOUT, 0});
        int r = ::poll(pfds.data(), pfds.size(), wait);
        if(r < 0){ if(errno == EINTR) continue; break; }
        if(r == 0) break;
        for(size_t i = pfds.size(); i-- > 0;){
            if(!pfds[i].revents) continue;
            ConnectStatus st = finish_connect(pfds[i].fd);
            if(st == ConnectStatus::Connected || st == ConnectStatus::Refused){
                ev.verdict = ProbeVerdict::Alive;
                ev.method = "tcp:" + std::to_string(pending_ports[i]);
                ev.latency_ms = elapsed_ms(start);
                return ev;
            }
            socks.erase(socks.begin() + static_cast<long>(i));
            pending_ports.erase(pending_ports.begin() + static_cast<long>(i));
        }
    }
    return ev;
}

}
