#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lan_probe {

struct ProcessLimits {
    std::chrono::milliseconds timeout{30000};
    size_t max_output_bytes = 64 * 1024;
    bool seccomp_child = false;
};

struct ProcessResult {
    bool spawned = false;        // exec succeeded
    bool sandbox_failed = false; // child could not install its seccomp filter
    bool timed_out = false;
    std::optional<int> exit_code;
    int term_signal = 0;
    std::string output;          // stdout and stderr, in arrival order
    size_t total_bytes = 0;
    bool truncated = false;
    int spawn_errno = 0;
    int wait_errno = 0;          // waitpid failed; exit_code stays empty
};

// Drops a UTF-8 sequence left incomplete at the end of text.
void trim_partial_utf8(std::string& text);

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    // argv[0] is looked up on PATH. Never goes through a shell.
    virtual ProcessResult run(const std::vector<std::string>& argv, const ProcessLimits& limits) = 0;
};

// fork + execvp in a fresh process group; the whole group is SIGKILLed on deadline.
class ForkExecRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv, const ProcessLimits& limits) override;
};

}
