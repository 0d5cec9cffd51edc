#pragma once
#include <chrono>
#include <cstdint>
#include <netinet/in.h>

namespace lan_probe {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

// Milliseconds left until d, clamped at 0 and at INT_MAX for poll().
int remaining_ms(Deadline d);
inline bool expired(Deadline d){ return Clock::now() >= d; }
inline Deadline deadline_in(std::chrono::milliseconds ms){ return Clock::now() + ms; }
inline Deadline earliest(Deadline a, Deadline b){ return a < b ? a : b; }
double elapsed_ms(Clock::time_point since);

// Owns one file descriptor.
class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard(){ reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FdGuard& operator=(FdGuard&& other) noexcept {
        if(this != &other){ reset(); fd_ = other.fd_; other.fd_ = -1; }
        return *this;
    }
    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release(){ int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);
private:
    int fd_ = -1;
};

sockaddr_in make_sockaddr(uint32_t addr, uint16_t port);

enum class ConnectStatus { Connected, Refused, Pending, Unreachable };

// Maps a connect()/SO_ERROR errno. 0 is Connected, EINPROGRESS is Pending.
ConnectStatus classify_connect_errno(int err);

// Starts a nonblocking TCP connect. On success fd holds the socket (also when Pending).
ConnectStatus start_connect(uint32_t addr, uint16_t port, FdGuard& fd);

// Reads SO_ERROR after poll() reported the socket writable.
ConnectStatus finish_connect(int fd);

}
