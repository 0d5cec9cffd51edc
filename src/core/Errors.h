#pragma once
#include <stdexcept>
#include <string>

namespace lan_probe {

// Malformed discovery input: bad base address, prefix outside [1,30], or a subnet above max_hosts.
class InvalidSubnet : public std::runtime_error {
public:
    explicit InvalidSubnet(const std::string& what) : std::runtime_error("invalid subnet: " + what) {}
};

// Port-scan target that is malformed or cannot be resolved to an IPv4 address.
class UnreachableTarget : public std::runtime_error {
public:
    explicit UnreachableTarget(const std::string& what) : std::runtime_error("unreachable target: " + what) {}
};

}
