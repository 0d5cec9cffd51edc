#include "CommandPolicy.h"
#include <algorithm>
#include <cctype>

namespace lan_probe {

namespace {

Validation reject(RejectReason reason, std::string message){
    Validation v;
    v.rejection = Rejection{reason, std::move(message)};
    return v;
}

Validation accept(DiagnosticCommand cmd){
    Validation v;
    v.command = std::move(cmd);
    return v;
}

std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

Validation build_ping(const std::vector<std::string>& tokens){
    PingCommand cmd;
    bool have_host = false;
    size_t i = 1;
    while(i < tokens.size()){
        const std::string& t = tokens[i];
        if((t == "-c" || t == "-n") && i + 1 < tokens.size()){
            try {
                cmd.count = std::clamp(std::stoi(tokens[i+1]), CommandPolicy::kMinPingCount, CommandPolicy::kMaxPingCount);
            } catch(const std::exception&) {
                cmd.count = CommandPolicy::kDefaultPingCount;
            }
            i += 2;
        } else if(!t.empty() && t[0] != '-' && !have_host){
            cmd.host = t;
            have_host = true;
            ++i;
        } else {
            ++i;
        }
    }
    if(!have_host) return reject(RejectReason::BadArgument, "Usage: ping <host> [-c count]");
    if(!CommandPolicy::is_safe_host(cmd.host)) return reject(RejectReason::BadArgument, "Invalid host '" + cmd.host + "'");
    return accept(cmd);
}

Validation build_traceroute(const std::vector<std::string>& tokens){
    if(tokens.size() < 2) return reject(RejectReason::BadArgument, "Usage: traceroute <host>");
    if(!CommandPolicy::is_safe_host(tokens[1])) return reject(RejectReason::BadArgument, "Invalid host '" + tokens[1] + "'");
    return accept(TracerouteCommand{tokens[1]});
}

Validation build_nslookup(const std::vector<std::string>& tokens){
    if(tokens.size() < 2) return reject(RejectReason::BadArgument, "Usage: nslookup <host> [server]");
    NslookupCommand cmd{tokens[1], tokens.size() > 2 ? tokens[2] : std::string()};
    if(!CommandPolicy::is_safe_host(cmd.host)) return reject(RejectReason::BadArgument, "Invalid host '" + cmd.host + "'");
    if(!cmd.server.empty() && !CommandPolicy::is_safe_host(cmd.server)) return reject(RejectReason::BadArgument, "Invalid server '" + cmd.server + "'");
    return accept(cmd);
}

Validation build_netstat(const std::vector<std::string>& tokens){
    static const std::vector<std::string> allowed_flags = {"-a", "-n", "-an", "-r", "-s"};
    NetstatCommand cmd;
    for(size_t i = 1; i < tokens.size(); ++i){
        if(std::find(allowed_flags.begin(), allowed_flags.end(), tokens[i]) != allowed_flags.end()) cmd.flags.push_back(tokens[i]);
    }
    if(cmd.flags.empty()) cmd.flags.push_back("-an");
    return accept(cmd);
}

}

const char* to_string(RejectReason r){
    switch(r){
        case RejectReason::Empty: return "empty";
        case RejectReason::Syntax: return "syntax";
        case RejectReason::Metacharacter: return "metacharacter";
        case RejectReason::NotAllowed: return "not_allowed";
        case RejectReason::BadArgument: return "bad_argument";
        case RejectReason::Help: return "help";
    }
    return "not_allowed";
}

const std::vector<std::string>& CommandPolicy::allowed_names(){
    static const std::vector<std::string> names = {"ping", "traceroute", "tracert", "nslookup", "netstat", "ifconfig", "ipconfig"};
    return names;
}

std::optional<char> CommandPolicy::find_metacharacter(const std::string& raw){
    static const std::string meta = ";&|`$<>()";
    for(char c : raw){
        if(meta.find(c) != std::string::npos) return c;
        if(c != ' ' && c != '\t' && std::iscntrl(static_cast<unsigned char>(c))) return c; // \n, \r and friends
    }
    return std::nullopt;
}

bool CommandPolicy::tokenize(const std::string& raw, std::vector<std::string>& tokens, std::string& error){
    tokens.clear();
    std::string cur;
    bool in_word = false;
    enum class Quote { None, Single, Double } quote = Quote::None;
    for(size_t i = 0; i < raw.size(); ++i){
        char c = raw[i];
        if(quote == Quote::Single){
            if(c == '\'') quote = Quote::None; else cur.push_back(c);
            continue;
        }
        if(quote == Quote::Double){
            if(c == '"'){ quote = Quote::None; continue; }
            if(c == '\\' && i + 1 < raw.size() && (raw[i+1] == '"' || raw[i+1] == '\\')){ cur.push_back(raw[++i]); continue; }
            cur.push_back(c);
            continue;
        }
        if(c == ' ' || c == '\t'){
            if(in_word){ tokens.push_back(cur); cur.clear(); in_word = false; }
            continue;
        }
        in_word = true;
        if(c == '\''){ quote = Quote::Single; continue; }
        if(c == '"'){ quote = Quote::Double; continue; }
        if(c == '\\'){
            if(i + 1 >= raw.size()){ error = "No escaped character"; return false; }
            cur.push_back(raw[++i]);
            continue;
        }
        cur.push_back(c);
    }
    if(quote != Quote::None){ error = "No closing quotation"; return false; }
    if(in_word) tokens.push_back(cur);
    return true;
}

bool CommandPolicy::is_safe_host(const std::string& host){
    if(host.empty() || host.size() > 253 || host[0] == '-') return false;
    return std::all_of(host.begin(), host.end(), [](unsigned char c){
        return std::isalnum(c) || c == '.' || c == '-' || c == ':' || c == '_';
    });
}

Validation CommandPolicy::validate(const std::string& raw){
    auto first = raw.find_first_not_of(" \t");
    if(first == std::string::npos) return reject(RejectReason::Empty, "Empty command");
    if(auto meta = find_metacharacter(raw)){
        std::string shown = std::iscntrl(static_cast<unsigned char>(*meta)) ? "control character" : std::string("'") + *meta + "'";
        return reject(RejectReason::Metacharacter, "Rejected: shell metacharacter " + shown + " is not permitted");
    }
    std::vector<std::string> tokens; std::string err;
    if(!tokenize(raw, tokens, err)) return reject(RejectReason::Syntax, "Invalid command syntax: " + err);
    if(tokens.empty()) return reject(RejectReason::Empty, "Empty command");

    std::string name = lower(tokens[0]);
    if(name == "ping") return build_ping(tokens);
    if(name == "traceroute" || name == "tracert") return build_traceroute(tokens);
    if(name == "nslookup") return build_nslookup(tokens);
    if(name == "netstat") return build_netstat(tokens);
    if(name == "ifconfig" || name == "ipconfig") return accept(IfconfigCommand{});
    if(name == "help") return reject(RejectReason::Help, help_text());
    return reject(RejectReason::NotAllowed, "Command '" + name + "' not allowed. Type 'help' for available commands.");
}

namespace {
struct ArgvBuilder {
    std::vector<std::string> operator()(const PingCommand& c) const { return {"ping", "-c", std::to_string(c.count), "-W", "2", c.host}; }
    std::vector<std::string> operator()(const TracerouteCommand& c) const { return {"traceroute", "-n", c.host}; }
    std::vector<std::string> operator()(const NslookupCommand& c) const {
        std::vector<std::string> argv = {"nslookup", c.host};
        if(!c.server.empty()) argv.push_back(c.server);
        return argv;
    }
    std::vector<std::string> operator()(const NetstatCommand& c) const {
        std::vector<std::string> argv = {"netstat"};
        argv.insert(argv.end(), c.flags.begin(), c.flags.end());
        return argv;
    }
    std::vector<std::string> operator()(const IfconfigCommand&) const { return {"ifconfig"}; }
};
}

std::vector<std::string> CommandPolicy::to_argv(const DiagnosticCommand& cmd){
    return std::visit(ArgvBuilder{}, cmd);
}

std::string CommandPolicy::help_text(){
    return "Available commands:\n"
           "  ping <host> [-c count]  - Ping a host\n"
           "  traceroute <host>       - Trace route to host\n"
           "  nslookup <host> [server] - Query DNS for a host\n"
           "  netstat [-a|-n|-r|-s]  - Show network connections\n"
           "  ifconfig                - Show network interfaces\n"
           "  help                    - Show this help message";
}

}
