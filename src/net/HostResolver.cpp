#include "HostResolver.h"
#include "Socket.h"
#include "Subnet.h"
#include <fstream>
#include <sstream>
#include <netdb.h>
#include <sys/socket.h>

namespace lan_probe {

std::string SystemResolver::reverse_lookup(uint32_t addr){
    sockaddr_in sa = make_sockaddr(addr, 0);
    char host[NI_MAXHOST];
    if(::getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD) != 0){
        return "";
    }
    return host;
}

std::optional<std::string> SystemResolver::hardware_address(uint32_t addr){
    std::ifstream f(arp_path_);
    if(!f.is_open()) return std::nullopt;
    auto table = parse_arp_table(f);
    auto it = table.find(format_ipv4(addr));
    if(it == table.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> parse_arp_table(std::istream& in){
    std::map<std::string, std::string> out;
    std::string line;
    std::getline(in, line); // header
    while(std::getline(in, line)){
        std::stringstream ss(line);
        std::string ip, hw_type, flags, mac, mask, dev;
        if(!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev)) continue;
        if(mac == "00:00:00:00:00:00" || flags == "0x0") continue;
        out[ip] = mac;
    }
    return out;
}

}
