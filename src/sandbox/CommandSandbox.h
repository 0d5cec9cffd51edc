#pragma once
#include "../core/Types.h"
#include "ProcessRunner.h"
#include <chrono>
#include <vector>

namespace lan_probe {

struct SandboxOptions {
    std::chrono::milliseconds timeout{30000};
    size_t max_output_bytes = 64 * 1024;
    bool seccomp_child = false;
};

enum class SandboxState { Received, Validated, Rejected, Executing, Completed };
const char* to_string(SandboxState s);

// Validates one request against CommandPolicy and runs it with at most one child process.
class CommandSandbox {
public:
    CommandSandbox(SandboxOptions opts, ProcessRunner& runner) : opts_(opts), runner_(runner) {}

    // Never throws. transitions, when given, receives every state the request passed through.
    CommandOutcome run(const CommandRequest& req, std::vector<SandboxState>* transitions = nullptr);

    static std::string timeout_message(std::chrono::milliseconds timeout);
    static std::string truncation_marker(size_t total_bytes);
private:
    SandboxOptions opts_;
    ProcessRunner& runner_;
};

}
