#include "Privilege.h"
#include "Logging.h"
#include <cerrno>
#include <unistd.h>
#ifdef LAN_PROBE_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef LAN_PROBE_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace lan_probe {

namespace {
// Everything the probes, the worker threads and the command sandbox touch.
// Names that do not exist on the build architecture are skipped at apply time.
const char* const kAllowedSyscalls[] = {
    "read", "write", "readv", "writev", "pread64", "open", "openat", "close", "fstat", "newfstatat",
    "stat", "lstat", "statx", "lseek", "access", "faccessat", "faccessat2", "readlink", "readlinkat",
    "getdents64", "fcntl", "ioctl", "mmap", "mprotect", "munmap", "mremap", "madvise", "brk",
    "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "sigaltstack", "getpid", "getppid", "gettid",
    "getuid", "geteuid", "getgid", "getegid", "getpgid", "setpgid", "clock_gettime", "clock_nanosleep",
    "nanosleep", "gettimeofday", "getrandom", "prlimit64", "uname", "sysinfo", "futex", "set_robust_list",
    "set_tid_address", "rseq", "sched_yield", "sched_getaffinity", "clone", "clone3", "fork", "vfork",
    "execve", "wait4", "kill", "tgkill", "pipe2", "dup2", "dup3", "close_range", "prctl", "seccomp",
    "socket", "connect", "bind", "poll", "ppoll", "select", "pselect6", "sendto", "recvfrom", "sendmsg",
    "recvmsg", "getsockopt", "setsockopt", "getsockname", "getpeername", "exit", "exit_group"
};

// Things a ping or netstat never needs.
const char* const kChildDeniedSyscalls[] = {
    "ptrace", "mount", "umount2", "reboot", "kexec_load", "init_module", "finit_module",
    "delete_module", "swapon", "swapoff", "pivot_root", "chroot", "setns", "unshare"
};
}

void log_capabilities(const std::string& context) {
#ifdef LAN_PROBE_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    } else {
        Logger::instance().warn("Failed to convert capabilities to text for " + context);
    }
    cap_free(caps);
#else
    Logger::instance().debug("Capabilities logging not available (libcap not compiled in) for " + context);
#endif
}

bool drop_capabilities(bool keep_net_raw){
#ifdef LAN_PROBE_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_cap_net_raw=" + std::string(keep_net_raw ? "true" : "false") + ")");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    if(keep_net_raw){
        cap_value_t v = CAP_NET_RAW;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
    }
    bool ok = cap_set_proc(caps) == 0;
    if(!ok) Logger::instance().error("cap_set_proc failed");
    else log_capabilities("after drop");
    cap_free(caps);
    return ok;
#else
    (void)keep_net_raw;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return true;
#endif
}

bool apply_seccomp_profile(){
#ifdef LAN_PROBE_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if (seccomp_applied) return true;

    Logger::instance().info("Applying seccomp profile");
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    for(const char* name : kAllowedSyscalls){
        int nr = seccomp_syscall_resolve_name(name);
        if(nr == __NR_SCMP_ERROR){
            Logger::instance().trace(std::string("seccomp: syscall not on this arch: ") + name);
            continue;
        }
        if(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 0) != 0){
            Logger::instance().error(std::string("Failed to allow syscall ") + name + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx) != 0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    Logger::instance().debug("Seccomp profile active (" + std::to_string(get_seccomp_allowed_syscalls_count()) + " syscalls allowed)");
    return true;
#else
    Logger::instance().warn("Seccomp not available (not compiled in)");
    return false;
#endif
}

bool is_privilege_available(){
#ifdef LAN_PROBE_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef LAN_PROBE_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

int get_seccomp_allowed_syscalls_count(){
#ifdef LAN_PROBE_HAVE_SECCOMP
    return static_cast<int>(sizeof(kAllowedSyscalls) / sizeof(kAllowedSyscalls[0]));
#else
    return 0;
#endif
}

ChildSeccompFilter::ChildSeccompFilter(){
#ifdef LAN_PROBE_HAVE_SECCOMP
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if(!ctx){
        Logger::instance().error("Failed to initialize child seccomp context");
        return;
    }
    for(const char* name : kChildDeniedSyscalls){
        int nr = seccomp_syscall_resolve_name(name);
        if(nr == __NR_SCMP_ERROR) continue;
        if(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0) != 0){
            Logger::instance().error(std::string("Failed to deny syscall ") + name + " in child seccomp");
            seccomp_release(ctx);
            return;
        }
    }
    ctx_ = ctx;
#else
    Logger::instance().warn("Child seccomp filter requested but seccomp is not compiled in");
#endif
}

ChildSeccompFilter::~ChildSeccompFilter(){
#ifdef LAN_PROBE_HAVE_SECCOMP
    if(ctx_) seccomp_release(static_cast<scmp_filter_ctx>(ctx_));
#endif
}

bool ChildSeccompFilter::load() const {
#ifdef LAN_PROBE_HAVE_SECCOMP
    return ctx_ && seccomp_load(static_cast<scmp_filter_ctx>(ctx_)) == 0;
#else
    return false;
#endif
}

int ChildSeccompFilter::denied_syscalls_count(){
    return static_cast<int>(sizeof(kChildDeniedSyscalls) / sizeof(kChildDeniedSyscalls[0]));
}

}
