#include "PortProber.h"
#include "Subnet.h"
#include "../core/Logging.h"
#include <poll.h>
#include <netdb.h>
#include <cerrno>

namespace lan_probe {

PortState classify(ConnectStatus st){
    switch(st){
        case ConnectStatus::Connected: return PortState::Open;
        case ConnectStatus::Refused: return PortState::Closed;
        case ConnectStatus::Pending:
        case ConnectStatus::Unreachable: return PortState::Filtered;
    }
    return PortState::Filtered;
}

PortState TcpPortProber::probe(uint32_t addr, uint16_t port, Deadline deadline){
    FdGuard fd;
    ConnectStatus st = start_connect(addr, port, fd);
    while(st == ConnectStatus::Pending){
        int wait = remaining_ms(deadline);
        if(wait == 0) break;
        pollfd p{fd.get(), POLLOUT, 0};
        int r = ::poll(&p, 1, wait);
        if(r < 0){
            if(errno == EINTR) continue;
            st = ConnectStatus::Unreachable;
            break;
        }
        if(r == 0) break; // timed out
        st = finish_connect(fd.get());
    }
    PortState state = classify(st);
    if(Logger::instance().enabled(LogLevel::Trace)){
        Logger::instance().trace(format_ipv4(addr) + ":" + std::to_string(port) + " " + to_string(state));
    }
    return state;
}

std::string service_name(uint16_t port){
    // getservbyport_r keeps this safe from the probe worker threads
    struct servent se{};
    struct servent* result = nullptr;
    char buf[1024];
    if(::getservbyport_r(htons(port), "tcp", &se, buf, sizeof(buf), &result) == 0 && result && result->s_name){
        return result->s_name;
    }
    return "";
}

}
