#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>

namespace lan_probe {

struct PingCommand { std::string host; int count = 4; };
struct TracerouteCommand { std::string host; };
struct NslookupCommand { std::string host; std::string server; };
struct NetstatCommand { std::vector<std::string> flags; };
struct IfconfigCommand {};

// The closed set of commands that may ever reach a process launcher.
using DiagnosticCommand = std::variant<PingCommand, TracerouteCommand, NslookupCommand, NetstatCommand, IfconfigCommand>;

enum class RejectReason { Empty, Syntax, Metacharacter, NotAllowed, BadArgument, Help };

struct Rejection {
    RejectReason reason = RejectReason::Empty;
    std::string message;
};

struct Validation {
    std::optional<DiagnosticCommand> command;
    Rejection rejection; // meaningful only when command is empty
    bool ok() const { return command.has_value(); }
};

class CommandPolicy {
public:
    static Validation validate(const std::string& raw);

    // POSIX-shell word splitting (quotes, backslash). False with a message on bad syntax.
    static bool tokenize(const std::string& raw, std::vector<std::string>& tokens, std::string& error);

    // First character that could chain, redirect or substitute in a shell.
    static std::optional<char> find_metacharacter(const std::string& raw);

    // Host or address argument: name/IP-literal characters only, no leading '-'.
    static bool is_safe_host(const std::string& host);

    static std::vector<std::string> to_argv(const DiagnosticCommand& cmd);
    static std::string help_text();
    static const std::vector<std::string>& allowed_names();

    static constexpr int kMinPingCount = 1;
    static constexpr int kMaxPingCount = 10;
    static constexpr int kDefaultPingCount = 4;
};

const char* to_string(RejectReason r);

}
