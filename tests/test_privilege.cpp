#include <gtest/gtest.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <cerrno>
#include <sched.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lan_probe {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }

    // Runs fn in a forked child so process-wide changes stay out of the test binary.
    static int in_child(bool (*fn)()) {
        pid_t pid = fork();
        if (pid == 0) _exit(fn() ? 0 : 1);
        int status = 0;
        if (pid < 0 || waitpid(pid, &status, 0) != pid) return -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
};

TEST_F(PrivilegeTest, LogCapabilitiesDoesNotThrow) {
    EXPECT_NO_THROW(log_capabilities("test"));
}

TEST_F(PrivilegeTest, AllowedSyscallCountMatchesAvailability) {
    if (is_seccomp_available()) {
        EXPECT_GT(get_seccomp_allowed_syscalls_count(), 50);
    } else {
        EXPECT_EQ(get_seccomp_allowed_syscalls_count(), 0);
    }
}

TEST_F(PrivilegeTest, DropCapabilitiesSucceedsInChild) {
    EXPECT_EQ(in_child([]{ return drop_capabilities(false); }), 0);
}

TEST_F(PrivilegeTest, DropCapabilitiesKeepingNetRawSucceedsInChild) {
    // Retaining a capability the process never had is refused by the kernel.
    if (geteuid() != 0) GTEST_SKIP() << "needs root to hold CAP_NET_RAW";
    EXPECT_EQ(in_child([]{ return drop_capabilities(true); }), 0);
}

TEST_F(PrivilegeTest, SeccompProfileInChild) {
    int rc = in_child([]{ return apply_seccomp_profile(); });
    EXPECT_EQ(rc, is_seccomp_available() ? 0 : 1);
}

TEST_F(PrivilegeTest, ChildFilterDenyList) {
    EXPECT_EQ(ChildSeccompFilter::denied_syscalls_count(), 14);
    ChildSeccompFilter filter;
    EXPECT_EQ(filter.ready(), is_seccomp_available());
}

TEST_F(PrivilegeTest, ChildFilterLoadsInChild) {
    if (!is_seccomp_available()) GTEST_SKIP() << "seccomp not compiled in";
    EXPECT_EQ(in_child([]{
        ChildSeccompFilter filter;
        if (!filter.load()) return false;
        return ::unshare(0) == -1 && errno == EPERM;
    }), 0);
}

}
