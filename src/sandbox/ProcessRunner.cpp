#include "ProcessRunner.h"
#include "../core/Logging.h"
#include "../core/Privilege.h"
#include "../net/Socket.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lan_probe {

namespace {

enum ChildStage : int { StageExec = 1, StageSeccomp = 2 };

struct ChildReport {
    int stage;
    int err;
};

void write_report(int fd, int stage, int err){
    ChildReport r{stage, err};
    ssize_t rc;
    do { rc = ::write(fd, &r, sizeof(r)); } while(rc < 0 && errno == EINTR);
}

// Marks every descriptor above stderr close-on-exec so the status pipe stays
// writable until execvp and nothing else leaks into the command.
void cloexec_above_stderr(){
#if defined(SYS_close_range) && defined(CLOSE_RANGE_CLOEXEC)
    if(::syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;
#endif
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if(max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for(int fd = 3; fd < max_fd; ++fd){
        int flags = ::fcntl(fd, F_GETFD);
        if(flags >= 0) ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

[[noreturn]] void exec_child(char* const* argv, int null_fd, int out_fd, int status_fd, const ChildSeccompFilter* filter){
    ::setpgid(0, 0);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGCHLD, SIG_DFL);
    if(::dup2(null_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(out_fd, STDERR_FILENO) < 0){
        write_report(status_fd, StageExec, errno);
        ::_exit(127);
    }
    cloexec_above_stderr();
    if(filter && !filter->load()){
        write_report(status_fd, StageSeccomp, errno);
        ::_exit(126);
    }
    ::execvp(argv[0], argv);
    write_report(status_fd, StageExec, errno);
    ::_exit(127);
}

// Returns the waitpid errno, 0 once status holds the child's exit status.
int reap(pid_t pid, int& status){
    while(::waitpid(pid, &status, 0) < 0){
        if(errno != EINTR) return errno;
    }
    return 0;
}

}

void trim_partial_utf8(std::string& text){
    size_t i = text.size();
    size_t continuation = 0;
    while(i > 0 && continuation < 3 && (static_cast<unsigned char>(text[i-1]) & 0xC0) == 0x80){
        --i;
        ++continuation;
    }
    if(i == 0) return;
    unsigned char lead = static_cast<unsigned char>(text[i-1]);
    size_t length = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    if(length > continuation + 1) text.resize(i - 1);
}

ProcessResult ForkExecRunner::run(const std::vector<std::string>& argv, const ProcessLimits& limits){
    ProcessResult result;
    if(argv.empty()){
        result.spawn_errno = EINVAL;
        return result;
    }
    const Deadline deadline = deadline_in(limits.timeout);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    std::unique_ptr<ChildSeccompFilter> filter;
    if(limits.seccomp_child){
        filter = std::make_unique<ChildSeccompFilter>();
        if(!filter->ready()){
            Logger::instance().error("child seccomp filter unavailable; refusing to run " + argv[0]);
            result.sandbox_failed = true;
            return result;
        }
    }

    FdGuard null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    int out_pipe[2], status_pipe[2];
    if(!null_fd.valid() || ::pipe2(out_pipe, O_CLOEXEC) != 0){
        result.spawn_errno = errno;
        Logger::instance().error(std::string("sandbox setup failed: ") + std::strerror(result.spawn_errno));
        return result;
    }
    FdGuard out_read(out_pipe[0]), out_write(out_pipe[1]);
    if(::pipe2(status_pipe, O_CLOEXEC) != 0){
        result.spawn_errno = errno;
        Logger::instance().error(std::string("sandbox setup failed: ") + std::strerror(result.spawn_errno));
        return result;
    }
    FdGuard status_read(status_pipe[0]), status_write(status_pipe[1]);

    pid_t pid = ::fork();
    if(pid < 0){
        result.spawn_errno = errno;
        Logger::instance().error(std::string("fork() failed: ") + std::strerror(result.spawn_errno));
        return result;
    }
    if(pid == 0) exec_child(cargv.data(), null_fd.get(), out_write.get(), status_write.get(), filter.get());

    // Both sides call setpgid so the group exists before any kill(-pid).
    ::setpgid(pid, pid);
    out_write.reset();
    status_write.reset();

    ChildReport report{0, 0};
    ssize_t got;
    do { got = ::read(status_read.get(), &report, sizeof(report)); } while(got < 0 && errno == EINTR);
    if(got == static_cast<ssize_t>(sizeof(report))){
        int status = 0;
        if(int err = reap(pid, status)) Logger::instance().debug(std::string("waitpid after failed exec: ") + std::strerror(err));
        if(report.stage == StageSeccomp) result.sandbox_failed = true;
        else result.spawn_errno = report.err;
        Logger::instance().debug("child for " + argv[0] + " failed before exec: " + std::strerror(report.err));
        return result;
    }
    result.spawned = true;
    Logger::instance().debug("spawned " + argv[0] + " pid=" + std::to_string(pid));

    char buf[4096];
    bool eof = false;
    while(!eof){
        int wait = remaining_ms(deadline);
        if(wait <= 0){ result.timed_out = true; break; }
        pollfd pfd{out_read.get(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait);
        if(rc < 0){
            if(errno == EINTR) continue;
            Logger::instance().warn(std::string("poll on child output failed: ") + std::strerror(errno));
            result.timed_out = true;
            break;
        }
        if(rc == 0){ result.timed_out = true; break; }
        ssize_t n = ::read(out_read.get(), buf, sizeof(buf));
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN) continue;
            eof = true;
        } else if(n == 0){
            eof = true;
        } else {
            result.total_bytes += static_cast<size_t>(n);
            if(result.truncated) continue;
            size_t room = limits.max_output_bytes > result.output.size() ? limits.max_output_bytes - result.output.size() : 0;
            size_t keep = std::min(room, static_cast<size_t>(n));
            result.output.append(buf, keep);
            if(keep < static_cast<size_t>(n)){
                result.truncated = true;
                trim_partial_utf8(result.output);
            }
        }
    }

    int status = 0;
    if(!result.timed_out){
        // Output closed; give the process the rest of its budget to exit.
        for(;;){
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if(w == pid) break;
            if(w < 0 && errno != EINTR){ result.wait_errno = errno; break; }
            if(expired(deadline)){ result.timed_out = true; break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    if(result.timed_out){
        Logger::instance().warn("killing process group " + std::to_string(pid) + " (" + argv[0] + ") after deadline");
        ::kill(-pid, SIGKILL);
        if(int err = reap(pid, status)) Logger::instance().debug(std::string("waitpid after kill: ") + std::strerror(err));
        return result;
    }
    if(result.wait_errno){
        // e.g. SIGCHLD ignored by the host process: the kernel reaped the child
        Logger::instance().warn("exit status of " + argv[0] + " unavailable: " + std::strerror(result.wait_errno));
        return result;
    }
    if(WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if(WIFSIGNALED(status)) result.term_signal = WTERMSIG(status);
    return result;
}

}
