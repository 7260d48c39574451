#include "network/local_interfaces.h"

#include "common/logger.h"

#include <algorithm>
#include <arpa/inet.h>
#include <fstream>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>
#include <tuple>

namespace c4::sddp::network {

std::optional<std::string> defaultGatewayInterface() {
    // Linux routing table: Iface Destination Gateway Flags ... with
    // hex-encoded addresses. The default route has destination 00000000.
    std::ifstream route("/proc/net/route");
    if (!route) {
        return std::nullopt;
    }

    std::string line;
    std::getline(route, line);  // header
    while (std::getline(route, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway;
        unsigned flags = 0;
        if (!(fields >> iface >> destination >> gateway >> std::hex >> flags)) {
            continue;
        }
        if (destination == "00000000" && (flags & 0x1) != 0) {  // RTF_UP
            return iface;
        }
    }
    return std::nullopt;
}

std::vector<LocalAddress> enumerateLocalAddresses(bool include_loopback) {
    auto logger = getLogger(LogCategory::ENDPOINT);
    auto gateway_iface = defaultGatewayInterface();

    std::vector<std::tuple<int, std::string, LocalAddress>> ranked;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || !ifaddr) {
        logger->warn("getifaddrs failed; no local addresses available");
        return {};
    }

    for (auto ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        auto* sa = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {};
        if (!inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf))) continue;

        LocalAddress entry;
        entry.address = buf;
        entry.interface = ifa->ifa_name;
        entry.loopback = (ntohl(sa->sin_addr.s_addr) >> 24) == 127 ||
                         (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        int priority;
        if (gateway_iface && entry.interface == *gateway_iface) {
            priority = 0;
        } else if (entry.loopback) {
            if (!include_loopback) continue;
            priority = 3;
        } else if (entry.address.rfind("172.", 0) == 0) {
            priority = 2;
        } else {
            priority = 1;
        }
        ranked.emplace_back(priority, entry.address, std::move(entry));
    }
    freeifaddrs(ifaddr);

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return std::tie(std::get<0>(a), std::get<1>(a)) < std::tie(std::get<0>(b), std::get<1>(b));
    });

    std::vector<LocalAddress> result;
    result.reserve(ranked.size());
    for (auto& r : ranked) {
        result.push_back(std::move(std::get<2>(r)));
    }
    return result;
}

std::vector<std::string> localUnicastAddresses(bool include_loopback) {
    std::vector<std::string> result;
    for (auto& entry : enumerateLocalAddresses(include_loopback)) {
        result.push_back(std::move(entry.address));
    }
    return result;
}

} // namespace c4::sddp::network
