#pragma once

#include <optional>
#include <string>
#include <vector>

namespace c4::sddp::network {

struct LocalAddress {
    std::string address;    // dotted IPv4
    std::string interface;  // e.g. "eth0"
    bool loopback = false;
};

/// Name of the interface carrying the IPv4 default route, if any.
std::optional<std::string> defaultGatewayInterface();

/// IPv4 addresses of this host, preferred address first:
///   1. addresses on the default-gateway interface
///   2. other addresses
///   3. 172.x.x.x addresses (usually container bridges)
///   4. loopback, only when include_loopback is set
/// Ties are broken by address text.
std::vector<LocalAddress> enumerateLocalAddresses(bool include_loopback);

/// Addresses only, same ordering.
std::vector<std::string> localUnicastAddresses(bool include_loopback = false);

} // namespace c4::sddp::network
