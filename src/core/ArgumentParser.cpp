#include "ArgumentParser.h"
#include "ConfigValidator.h"
#include "BuildInfo.h"
#include <iostream>

namespace lan_probe {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

static bool to_int(const std::string& v, int& out){
    try {
        size_t idx = 0;
        out = std::stoi(v, &idx);
        return idx == v.size();
    } catch(const std::exception&) {
        return false;
    }
}

static bool parse_ports_csv(const std::string& v, std::vector<uint16_t>& out){
    for(const auto& tok : split_csv(v)){
        if(!ConfigValidator::parse_port_spec(tok, out)) return false;
    }
    return true;
}

ArgumentParser::ArgumentParser(){
    auto int_flag = [](int Config::*field){
        return [field](const std::string& v, Config& c){ return to_int(v, c.*field); };
    };
    specs_ = {
        {"--subnet", ArgKind::String, "Subnet to discover (a.b.c.d/p)", [](const std::string& v, Config& c){ c.subnet = v; return true; }},
        {"--limit", ArgKind::Int, "Probe only the first N addresses", int_flag(&Config::host_limit)},
        {"--max-hosts", ArgKind::Int, "Refuse subnets with more candidates", [](const std::string& v, Config& c){ int n=0; if(!to_int(v,n) || n<=0) return false; c.max_hosts = static_cast<size_t>(n); return true; }},
        {"--timeout-ms", ArgKind::Int, "Per-host liveness timeout", int_flag(&Config::probe_timeout_ms)},
        {"--discovery-deadline-ms", ArgKind::Int, "Global discovery deadline", int_flag(&Config::discovery_deadline_ms)},
        {"--workers", ArgKind::Int, "Concurrent host probes", int_flag(&Config::discovery_workers)},
        {"--liveness-ports", ArgKind::CSV, "TCP fallback ports for liveness", [](const std::string& v, Config& c){ c.liveness_ports.clear(); return parse_ports_csv(v, c.liveness_ports); }},
        {"--no-resolve", ArgKind::None, "Skip reverse hostname lookup", [](const std::string&, Config& c){ c.resolve_hostnames = false; return true; }},
        {"--no-mac", ArgKind::None, "Skip neighbour table lookup", [](const std::string&, Config& c){ c.lookup_mac = false; return true; }},
        {"--escalate-on-silence", ArgKind::None, "TCP fallback also when ICMP gets no reply", [](const std::string&, Config& c){ c.escalate_on_silence = true; return true; }},
        {"--ports", ArgKind::CSV, "Ports to scan (list or ranges)", [](const std::string& v, Config& c){ return parse_ports_csv(v, c.ports); }},
        {"--ports-file", ArgKind::String, "File with ports to scan", [](const std::string& v, Config& c){ c.ports_file = v; return true; }},
        {"--port-timeout-ms", ArgKind::Int, "Per-port connect timeout", int_flag(&Config::port_timeout_ms)},
        {"--scan-deadline-ms", ArgKind::Int, "Global port scan deadline", int_flag(&Config::scan_deadline_ms)},
        {"--scan-workers", ArgKind::Int, "Concurrent port probes", int_flag(&Config::scan_workers)},
        {"--command-timeout", ArgKind::Int, "Command deadline in seconds", int_flag(&Config::command_timeout_s)},
        {"--max-output", ArgKind::Int, "Captured output cap in bytes", [](const std::string& v, Config& c){ int n=0; if(!to_int(v,n) || n<=0) return false; c.max_output_bytes = static_cast<size_t>(n); return true; }},
        {"--sandbox-seccomp", ArgKind::None, "Seccomp deny-list in command children", [](const std::string&, Config& c){ c.sandbox_seccomp = true; return true; }},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)", [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON (default)", [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--compact", ArgKind::None, "Single-line JSON", [](const std::string&, Config& c){ c.compact = true; return true; }},
        {"--write-env", ArgKind::String, ".env provenance output", [](const std::string& v, Config& c){ c.write_env_file = v; return true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](const std::string& v, Config& c){ c.log_level = v; return true; }},
        {"--quiet", ArgKind::None, "Only log errors", [](const std::string&, Config& c){ c.log_level = "error"; return true; }},
        {"--verbose", ArgKind::None, "Debug logging", [](const std::string&, Config& c){ c.log_level = "debug"; return true; }},
        {"--drop-priv", ArgKind::None, "Drop Linux capabilities early", [](const std::string&, Config& c){ c.drop_priv = true; return true; }},
        {"--keep-cap-net-raw", ArgKind::None, "Retain CAP_NET_RAW when dropping", [](const std::string&, Config& c){ c.keep_cap_net_raw = true; return true; }},
        {"--seccomp", ArgKind::None, "Apply seccomp profile", [](const std::string&, Config& c){ c.seccomp = true; return true; }},
        {"--seccomp-strict", ArgKind::None, "Fail if seccomp apply fails", [](const std::string&, Config& c){ c.seccomp_strict = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& msg){
    error_ = msg;
    exit_code_ = 2;
    std::cerr << msg << "\n";
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0; error_.clear();
    bool positional_only = false;
    for(int i=1; i<argc; ++i){
        if(!argv[i]) continue;
        std::string a = argv[i];
        if(positional_only || a.empty() || a[0] != '-'){
            if(cfg.mode == Mode::None){
                if(a=="discover") cfg.mode = Mode::Discover;
                else if(a=="ports") cfg.mode = Mode::Ports;
                else if(a=="run") cfg.mode = Mode::Run;
                else if(a=="status") cfg.mode = Mode::Status;
                else return fail("Unknown mode: " + a);
                continue;
            }
            if(cfg.mode == Mode::Run){
                // the sandbox re-tokenizes, so the rest of argv is the command line
                for(int j=i; j<argc; ++j){ if(!cfg.positional.empty()) cfg.positional += ' '; cfg.positional += argv[j]; }
                break;
            }
            if(!cfg.positional.empty()) return fail("Unexpected argument: " + a);
            cfg.positional = a;
            continue;
        }
        if(a=="--"){ positional_only = true; continue; }
        if(a=="--help" || a=="-h"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = find_spec(a);
        if(!spec) return fail("Unknown arg: " + a);
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc || !argv[i+1]) return fail("Missing value for " + a);
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){
            return fail(std::string("Invalid value for ") + spec->name + ": " + val);
        }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "usage: lan-probe [options] <mode> [argument]\n\n"
              << "modes:\n"
              << "  discover [CIDR]               Find live hosts on the local subnet\n"
              << "  ports <host>                  Probe ports on one host\n"
              << "  run <command...>              Run an allowlisted diagnostic command\n"
              << "  status                        Show defaults and sandbox capabilities\n\n"
              << "options (before the mode):\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::CSV) name += " LIST";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n"
              << "  --help                        Show this help\n";
}

void ArgumentParser::print_version() const {
    std::cout << "lan-probe " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
