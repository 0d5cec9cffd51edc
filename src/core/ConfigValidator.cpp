#include "ConfigValidator.h"
#include "Logging.h"
#include "../scan/WorkerPool.h"
#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>

namespace lan_probe {

bool ConfigValidator::parse_port_spec(const std::string& spec, std::vector<uint16_t>& out){
    auto parse_one = [](const std::string& s, long& v){
        if(s.empty() || s.size() > 5) return false;
        for(char c : s) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = std::stol(s);
        return v >= 1 && v <= 65535;
    };
    auto dash = spec.find('-');
    long lo = 0, hi = 0;
    if(dash == std::string::npos){
        if(!parse_one(spec, lo)) return false;
        out.push_back(static_cast<uint16_t>(lo));
        return true;
    }
    if(!parse_one(spec.substr(0, dash), lo) || !parse_one(spec.substr(dash+1), hi) || lo > hi) return false;
    for(long p = lo; p <= hi; ++p) out.push_back(static_cast<uint16_t>(p));
    return true;
}

bool ConfigValidator::validate_worker_count(int value, const char* flag){
    if(static_cast<size_t>(value) > WorkerPool::kMaxWorkers){
        std::cerr << flag << " must be at most " << WorkerPool::kMaxWorkers << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_positive(int value, const char* flag){
    if(value <= 0){
        std::cerr << flag << " must be positive\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_ports(const std::vector<uint16_t>& ports, const char* what){
    for(auto p : ports){
        if(p == 0){ std::cerr << "Invalid port 0 in " << what << "\n"; return false; }
    }
    return true;
}

bool ConfigValidator::validate(Config& cfg){
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) cfg.pretty = false;

    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(!parse_log_level(cfg.log_level, lvl)){
            std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
            return false;
        }
    }

    if(!validate_positive(cfg.probe_timeout_ms, "--timeout-ms")) return false;
    if(!validate_positive(cfg.discovery_deadline_ms, "--discovery-deadline-ms")) return false;
    if(!validate_positive(cfg.discovery_workers, "--workers")) return false;
    if(!validate_positive(cfg.port_timeout_ms, "--port-timeout-ms")) return false;
    if(!validate_positive(cfg.scan_deadline_ms, "--scan-deadline-ms")) return false;
    if(!validate_positive(cfg.scan_workers, "--scan-workers")) return false;
    if(!validate_positive(cfg.command_timeout_s, "--command-timeout")) return false;
    if(!validate_worker_count(cfg.discovery_workers, "--workers")) return false;
    if(!validate_worker_count(cfg.scan_workers, "--scan-workers")) return false;
    if(cfg.host_limit < 0){ std::cerr << "--limit cannot be negative\n"; return false; }
    if(cfg.max_output_bytes == 0){ std::cerr << "--max-output must be positive\n"; return false; }

    if(!validate_ports(cfg.ports, "--ports")) return false;
    if(!validate_ports(cfg.liveness_ports, "--liveness-ports")) return false;
    if(cfg.liveness_ports.empty()){ std::cerr << "--liveness-ports cannot be empty\n"; return false; }

    if(cfg.keep_cap_net_raw && !cfg.drop_priv){
        std::cerr << "--keep-cap-net-raw requires --drop-priv\n";
        return false;
    }
    if(cfg.seccomp_strict) cfg.seccomp = true;

    switch(cfg.mode){
        case Mode::None:
            std::cerr << "Missing mode (discover, ports, run, status)\n";
            return false;
        case Mode::Ports:
            if(cfg.positional.empty()){ std::cerr << "ports requires a target host\n"; return false; }
            break;
        case Mode::Run:
            if(cfg.positional.empty()){ std::cerr << "run requires a command\n"; return false; }
            break;
        case Mode::Discover:
            if(!cfg.positional.empty() && !cfg.subnet.empty() && cfg.positional != cfg.subnet){
                std::cerr << "Conflicting subnets: " << cfg.positional << " and --subnet " << cfg.subnet << "\n";
                return false;
            }
            if(cfg.subnet.empty()) cfg.subnet = cfg.positional;
            break;
        case Mode::Status:
            break;
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg){
    if(cfg.ports_file.empty()) return true;
    return load_ports_file(cfg);
}

bool ConfigValidator::load_ports_file(Config& cfg){
    std::ifstream f(cfg.ports_file);
    if(!f){
        std::cerr << "Cannot read ports file: " << cfg.ports_file << "\n";
        return false;
    }
    std::string line; size_t lineno = 0;
    while(std::getline(f, line)){
        ++lineno;
        auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        line.erase(std::remove_if(line.begin(), line.end(), [](unsigned char c){ return std::isspace(c); }), line.end());
        if(line.empty()) continue;
        if(!parse_port_spec(line, cfg.ports)){
            std::cerr << "Invalid port in " << cfg.ports_file << ":" << lineno << ": " << line << "\n";
            return false;
        }
    }
    return true;
}

}
