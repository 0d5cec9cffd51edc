#include "CommandSandbox.h"
#include "CommandPolicy.h"
#include "../core/Logging.h"
#include <cerrno>
#include <cstring>
#include <sstream>

namespace lan_probe {

const char* to_string(SandboxState s){
    switch(s){
        case SandboxState::Received: return "received";
        case SandboxState::Validated: return "validated";
        case SandboxState::Rejected: return "rejected";
        case SandboxState::Executing: return "executing";
        case SandboxState::Completed: return "completed";
    }
    return "received";
}

std::string CommandSandbox::timeout_message(std::chrono::milliseconds timeout){
    std::ostringstream os;
    os << "Error: Command timed out (";
    if(timeout.count() % 1000 == 0) os << timeout.count() / 1000;
    else os << static_cast<double>(timeout.count()) / 1000.0;
    os << " seconds)";
    return os.str();
}

std::string CommandSandbox::truncation_marker(size_t total_bytes){
    return "\n[output truncated: " + std::to_string(total_bytes) + " bytes total]";
}

CommandOutcome CommandSandbox::run(const CommandRequest& req, std::vector<SandboxState>* transitions){
    auto enter = [&](SandboxState s){
        if(transitions) transitions->push_back(s);
        Logger::instance().trace(std::string("sandbox: ") + to_string(s));
    };
    CommandOutcome out;
    enter(SandboxState::Received);

    Validation v;
    try {
        v = CommandPolicy::validate(req.raw);
    } catch(const std::exception& e) {
        v.command.reset();
        v.rejection = Rejection{RejectReason::Syntax, std::string("Invalid command syntax: ") + e.what()};
    }
    if(!v.ok()){
        enter(SandboxState::Rejected);
        Logger::instance().info(std::string("command rejected (") + to_string(v.rejection.reason) + ")");
        out.output = v.rejection.message;
        out.disposition = CommandDisposition::Rejected;
        return out;
    }
    enter(SandboxState::Validated);

    std::vector<std::string> argv = CommandPolicy::to_argv(*v.command);
    ProcessLimits limits{opts_.timeout, opts_.max_output_bytes, opts_.seccomp_child};
    enter(SandboxState::Executing);
    ProcessResult pr;
    try {
        pr = runner_.run(argv, limits);
    } catch(const std::exception& e) {
        Logger::instance().error(std::string("process runner failed: ") + e.what());
        pr = ProcessResult{};
        pr.spawn_errno = EIO;
    }
    enter(SandboxState::Completed);

    const std::string& name = argv.front();
    if(pr.sandbox_failed){
        out.output = "Error: sandbox setup failed for '" + name + "'";
        out.disposition = CommandDisposition::SpawnFailed;
        return out;
    }
    if(!pr.spawned){
        if(pr.spawn_errno == ENOENT) out.output = "Error: Command '" + name + "' not found";
        else out.output = "Error: failed to start '" + name + "': " + std::strerror(pr.spawn_errno);
        out.disposition = CommandDisposition::SpawnFailed;
        return out;
    }

    out.output = pr.output;
    if(pr.truncated) out.output += truncation_marker(pr.total_bytes);
    if(pr.timed_out){
        if(!out.output.empty() && out.output.back() != '\n') out.output += '\n';
        out.output += timeout_message(opts_.timeout);
        out.disposition = CommandDisposition::TimedOut;
        return out;
    }
    out.exit_code = pr.exit_code;
    out.disposition = CommandDisposition::Completed;
    if(pr.wait_errno){
        if(!out.output.empty() && out.output.back() != '\n') out.output += '\n';
        out.output += "Error: exit status of '" + name + "' unavailable: " + std::strerror(pr.wait_errno);
        return out;
    }
    out.success = pr.exit_code && *pr.exit_code == 0;
    if(out.output.empty()){
        if(out.success) out.output = "Command completed successfully.";
        else if(pr.exit_code) out.output = "Command exited with status " + std::to_string(*pr.exit_code);
        else out.output = "Command terminated by signal " + std::to_string(pr.term_signal);
    }
    Logger::instance().debug(name + " finished, success=" + (out.success ? "true" : "false"));
    return out;
}

}
