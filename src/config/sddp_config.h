#pragma once
#include "../common/types.h"
#include "../protocol/header_map.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace c4::sddp::config {

struct NetworkConfig {
    std::string multicast_address = kSddpMulticastAddress;
    uint16_t multicast_port = kSddpPort;
    int multicast_ttl = 1;
    bool multicast_loopback = true;
    bool include_loopback = false;            // when bind_addresses is empty
    std::vector<std::string> bind_addresses;  // empty = all local addresses
};

struct ServerConfig {
    std::optional<double> advertise_interval_s; // unset = 2/3 Max-Age, 0 = off
    bool respond_to_queries = true;
    bool track_peers = true;
    protocol::HeaderMap device_headers;
};

struct SearchConfig {
    std::string pattern = "*";
    double wait_time_s = 3.0;
    std::size_t max_responses = 0;
    bool include_error_responses = false;
    protocol::HeaderMap filter_headers;
};

struct SddpConfig {
    NetworkConfig network;
    ServerConfig server;
    SearchConfig search;
    std::string log_level = "warn";
    std::string log_file;
};

} // namespace c4::sddp::config
