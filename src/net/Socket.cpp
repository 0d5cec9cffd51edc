#include "Socket.h"
#include "../core/Logging.h"
#include <cstring>
#include <string>
#include <climits>
#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>

namespace lan_probe {

int remaining_ms(Deadline d){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(d - Clock::now()).count();
    if(left <= 0) return 0;
    if(left > INT_MAX) return INT_MAX;
    return static_cast<int>(left);
}

double elapsed_ms(Clock::time_point since){
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

void FdGuard::reset(int fd){
    if(fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

sockaddr_in make_sockaddr(uint32_t addr, uint16_t port){
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(addr);
    return sa;
}

ConnectStatus classify_connect_errno(int err){
    switch(err){
        case 0: return ConnectStatus::Connected;
        case EINPROGRESS: return ConnectStatus::Pending;
        case ECONNREFUSED: return ConnectStatus::Refused;
        default: return ConnectStatus::Unreachable; // EHOSTUNREACH, ENETUNREACH, EHOSTDOWN, ETIMEDOUT, ...
    }
}

ConnectStatus start_connect(uint32_t addr, uint16_t port, FdGuard& fd){
    fd.reset(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if(!fd.valid()){
        Logger::instance().debug(std::string("socket() failed: ") + std::strerror(errno));
        return ConnectStatus::Unreachable;
    }
    sockaddr_in sa = make_sockaddr(addr, port);
    if(::connect(fd.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0) return ConnectStatus::Connected;
    return classify_connect_errno(errno);
}

ConnectStatus finish_connect(int fd){
    int err = 0;
    socklen_t len = sizeof(err);
    if(::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) return ConnectStatus::Unreachable;
    ConnectStatus st = classify_connect_errno(err);
    // writable with no pending error means the handshake completed
    return st == ConnectStatus::Pending ? ConnectStatus::Unreachable : st;
}

}
