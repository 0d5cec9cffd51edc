#pragma once
#include <string>
#include <optional>
#include <istream>
#include <map>
#include <cstdint>

namespace lan_probe {

// Best-effort naming for a live host. Failures produce empty values, never exceptions.
class HostResolver {
public:
    virtual ~HostResolver() = default;
    virtual std::string reverse_lookup(uint32_t addr) = 0;
    virtual std::optional<std::string> hardware_address(uint32_t addr) = 0;
};

class SystemResolver : public HostResolver {
public:
    explicit SystemResolver(std::string arp_path = "/proc/net/arp") : arp_path_(std::move(arp_path)) {}
    std::string reverse_lookup(uint32_t addr) override;
    std::optional<std::string> hardware_address(uint32_t addr) override;
private:
    std::string arp_path_;
};

// ip -> mac from the kernel neighbour table text; incomplete entries are skipped.
std::map<std::string, std::string> parse_arp_table(std::istream& in);

}
