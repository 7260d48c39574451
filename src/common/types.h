#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace c4::sddp {

// ---------------------------------------------------------------------------
// Protocol constants
// ---------------------------------------------------------------------------
inline constexpr const char* kSddpMulticastAddress = "239.255.255.250";
inline constexpr std::uint16_t kSddpPort = 1902;

// Max-Age advertised when the device template does not carry one (seconds)
inline constexpr std::int64_t kDefaultMaxAge = 1800;

inline constexpr std::chrono::milliseconds kDefaultResponseWaitTime{3000};

// Largest UDP payload over IPv4
inline constexpr std::size_t kMaxDatagramSize = 65507;

// ---------------------------------------------------------------------------
// IPv4 host and UDP port, rendered as "host:port" on the wire
// ---------------------------------------------------------------------------
struct HostAndPort {
    std::string host;
    std::uint16_t port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }

    // Parse "host[:port]". A missing port yields default_port; a malformed
    // port yields std::nullopt.
    static std::optional<HostAndPort> parse(std::string_view text,
                                            std::uint16_t default_port = kSddpPort) {
        if (text.empty()) return std::nullopt;
        auto colon = text.find(':');
        HostAndPort result;
        result.host = std::string(text.substr(0, colon));
        if (result.host.empty()) return std::nullopt;
        if (colon == std::string_view::npos) {
            result.port = default_port;
            return result;
        }
        auto port_str = text.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5) return std::nullopt;
        unsigned long port = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') return std::nullopt;
            port = port * 10 + static_cast<unsigned long>(c - '0');
        }
        if (port > 65535) return std::nullopt;
        result.port = static_cast<std::uint16_t>(port);
        return result;
    }

    bool operator==(const HostAndPort& o) const { return host == o.host && port == o.port; }
    bool operator!=(const HostAndPort& o) const { return !(*this == o); }
    bool operator< (const HostAndPort& o) const {
        return std::tie(host, port) < std::tie(o.host, o.port);
    }
};

} // namespace c4::sddp
