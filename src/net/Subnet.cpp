#include "Subnet.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace lan_probe {

bool parse_ipv4(const std::string& text, uint32_t& out){
    uint32_t addr = 0;
    int parts = 0;
    size_t i = 0;
    while(parts < 4){
        size_t start = i;
        unsigned value = 0;
        while(i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))){
            value = value * 10 + static_cast<unsigned>(text[i] - '0');
            if(i - start >= 3 || value > 255) return false;
            ++i;
        }
        if(i == start) return false;
        addr = (addr << 8) | value;
        ++parts;
        if(parts < 4){
            if(i >= text.size() || text[i] != '.') return false;
            ++i;
        }
    }
    if(i != text.size()) return false;
    out = addr;
    return true;
}

std::string format_ipv4(uint32_t addr){
    return std::to_string((addr >> 24) & 0xFF) + "." + std::to_string((addr >> 16) & 0xFF) + "." +
           std::to_string((addr >> 8) & 0xFF) + "." + std::to_string(addr & 0xFF);
}

static uint32_t prefix_mask(int prefix){
    return prefix <= 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
}

SubnetSpec make_subnet(uint32_t base, int prefix){
    if(prefix < kMinPrefix || prefix > kMaxPrefix){
        throw InvalidSubnet("prefix /" + std::to_string(prefix) + " outside [" + std::to_string(kMinPrefix) + "," + std::to_string(kMaxPrefix) + "]");
    }
    return SubnetSpec{ base & prefix_mask(prefix), prefix };
}

SubnetSpec parse_subnet(const std::string& cidr){
    auto slash = cidr.find('/');
    if(slash == std::string::npos) throw InvalidSubnet("missing prefix length in '" + cidr + "'");
    std::string base = cidr.substr(0, slash);
    std::string plen = cidr.substr(slash + 1);
    uint32_t addr = 0;
    if(!parse_ipv4(base, addr)) throw InvalidSubnet("malformed base address '" + base + "'");
    if(plen.empty() || plen.size() > 2) throw InvalidSubnet("malformed prefix length '" + plen + "'");
    for(char c : plen) if(!std::isdigit(static_cast<unsigned char>(c))) throw InvalidSubnet("malformed prefix length '" + plen + "'");
    return make_subnet(addr, std::atoi(plen.c_str()));
}

std::string to_cidr(const SubnetSpec& s){
    return format_ipv4(s.network) + "/" + std::to_string(s.prefix);
}

uint64_t usable_host_count(int prefix){
    if(prefix < kMinPrefix || prefix > kMaxPrefix) return 0;
    return (uint64_t{1} << (32 - prefix)) - 2;
}

std::vector<uint32_t> enumerate_hosts(const SubnetSpec& s){
    std::vector<uint32_t> hosts;
    uint64_t count = usable_host_count(s.prefix);
    hosts.reserve(static_cast<size_t>(count));
    for(uint64_t i = 1; i <= count; ++i) hosts.push_back(s.network + static_cast<uint32_t>(i));
    return hosts;
}

std::vector<std::string> enumerate_host_addresses(const std::string& cidr){
    std::vector<std::string> out;
    for(uint32_t a : enumerate_hosts(parse_subnet(cidr))) out.push_back(format_ipv4(a));
    return out;
}

static int mask_to_prefix(uint32_t mask){
    int prefix = 0;
    while(prefix < 32 && (mask & (0x80000000u >> prefix))) ++prefix;
    return prefix;
}

std::vector<InterfaceAddress> local_ipv4_interfaces(){
    std::vector<InterfaceAddress> out;
    struct ifaddrs* ifaddr = nullptr;
    if(getifaddrs(&ifaddr) == -1){
        Logger::instance().warn(std::string("getifaddrs failed: ") + std::strerror(errno));
        return out;
    }
    for(auto* ifa = ifaddr; ifa; ifa = ifa->ifa_next){
        if(!ifa->ifa_addr || !ifa->ifa_netmask || ifa->ifa_addr->sa_family != AF_INET) continue;
        if(!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
        InterfaceAddress ia;
        ia.name = ifa->ifa_name;
        ia.address = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
        ia.netmask = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
        out.push_back(std::move(ia));
    }
    freeifaddrs(ifaddr);
    return out;
}

std::optional<SubnetSpec> choose_local_subnet(const std::vector<InterfaceAddress>& interfaces){
    if(interfaces.empty()) return std::nullopt;
    for(const auto& ia : interfaces){
        int prefix = mask_to_prefix(ia.netmask);
        if(prefix < kMinPrefix || prefix > kMaxPrefix){
            Logger::instance().debug("skipping interface " + ia.name + " with prefix /" + std::to_string(prefix));
            continue;
        }
        SubnetSpec found = make_subnet(ia.address, prefix);
        Logger::instance().debug("local subnet " + to_cidr(found) + " on " + ia.name);
        return found;
    }
    throw InvalidSubnet("no usable local subnet (" + interfaces.front().name + " is /" +
                        std::to_string(mask_to_prefix(interfaces.front().netmask)) + ")");
}

std::optional<SubnetSpec> detect_local_subnet(){
    return choose_local_subnet(local_ipv4_interfaces());
}

std::string default_subnet(){
    if(const char* env = std::getenv("SUBNET_CIDR"); env && *env) return env;
    if(auto local = detect_local_subnet()) return to_cidr(*local);
    return kFallbackSubnet;
}

}
