// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
#include <string>

namespace lan_probe {
void log_capabilities(const std::string& context);
// Clears every capability set; keep_net_raw retains CAP_NET_RAW for raw ICMP probes.
bool drop_capabilities(bool keep_net_raw);
bool apply_seccomp_profile();
bool is_privilege_available();
bool is_seccomp_available();
int get_seccomp_allowed_syscalls_count();

// Deny-list filter for diagnostic child processes. Built in the parent,
// loaded in the forked child right before exec.
class ChildSeccompFilter {
public:
    ChildSeccompFilter();
    ~ChildSeccompFilter();
    ChildSeccompFilter(const ChildSeccompFilter&) = delete;
    ChildSeccompFilter& operator=(const ChildSeccompFilter&) = delete;

    bool ready() const { return ctx_ != nullptr; }
    // Called after fork(); must not log or allocate beyond what libseccomp does.
    bool load() const;
    static int denied_syscalls_count();
private:
    void* ctx_ = nullptr;
};
}
