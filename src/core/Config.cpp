#include "Config.h"

namespace lan_probe {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

const char* const kFallbackSubnet = "192.168.1.0/24";

const std::vector<uint16_t>& common_ports(){
    static const std::vector<uint16_t> ports = {21, 22, 23, 25, 53, 80, 110, 139, 443, 993, 995, 3389};
    return ports;
}
}
