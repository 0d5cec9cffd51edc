#pragma once
#include "Config.h"
#include <string>
#include <vector>
#include <cstdint>

namespace lan_probe {

class ConfigValidator {
public:
    // Normalises cfg in place and reports the first problem on stderr.
    static bool validate(Config& cfg);
    static bool load_external_files(Config& cfg);

    // Accepts "N" or "A-B" (inclusive), each within 1..65535; appends to out.
    static bool parse_port_spec(const std::string& spec, std::vector<uint16_t>& out);

private:
    static bool load_ports_file(Config& cfg);
    static bool validate_positive(int value, const char* flag);
    static bool validate_worker_count(int value, const char* flag);
    static bool validate_ports(const std::vector<uint16_t>& ports, const char* what);
};

}
