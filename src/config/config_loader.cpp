#include "config_loader.h"
#include "../common/logger.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <chrono>
#include <cmath>
#include <set>

namespace c4::sddp::config {

namespace {

// Upper bound for configured durations (one year).
constexpr double kMaxDurationSeconds = 365.0 * 24 * 3600;

// Header maps: plain scalars follow the JSON literal rules (Max-Age: 1800 is
// an integer), quoted scalars stay strings, sequences become comma lists.
protocol::HeaderMap parseHeaderMap(const YAML::Node& node, const std::string& where) {
    protocol::HeaderMap headers;
    if (!node || node.IsNull()) return headers;
    if (!node.IsMap()) {
        throw ConfigValidationError(where + " must be a mapping of header name to value");
    }
    for (const auto& entry : node) {
        auto name = entry.first.as<std::string>();
        const auto& value = entry.second;
        if (value.IsNull()) {
            headers.set(name, nullptr);
        } else if (value.IsScalar()) {
            if (value.Tag() == "!") {
                headers.set(name, value.Scalar());
            } else {
                headers.setRaw(name, value.Scalar());
            }
        } else if (value.IsSequence()) {
            std::string joined;
            for (const auto& item : value) {
                if (!joined.empty()) joined += ",";
                joined += item.as<std::string>();
            }
            headers.set(name, joined);
        } else {
            throw ConfigValidationError(where + "." + name + " must be a scalar or a list");
        }
    }
    return headers;
}

NetworkConfig parseNetwork(const YAML::Node& node) {
    NetworkConfig net;
    if (!node || !node.IsMap()) return net;
    if (node["multicast_address"])  net.multicast_address = node["multicast_address"].as<std::string>();
    if (node["multicast_port"])     net.multicast_port = node["multicast_port"].as<uint16_t>();
    if (node["multicast_ttl"])      net.multicast_ttl = node["multicast_ttl"].as<int>();
    if (node["multicast_loopback"]) net.multicast_loopback = node["multicast_loopback"].as<bool>();
    if (node["include_loopback"])   net.include_loopback = node["include_loopback"].as<bool>();
    if (node["bind_addresses"] && node["bind_addresses"].IsSequence()) {
        for (const auto& a : node["bind_addresses"]) {
            net.bind_addresses.push_back(a.as<std::string>());
        }
    }
    return net;
}

ServerConfig parseServer(const YAML::Node& node) {
    ServerConfig srv;
    if (!node || !node.IsMap()) return srv;
    if (node["advertise_interval_s"] && !node["advertise_interval_s"].IsNull()) {
        srv.advertise_interval_s = node["advertise_interval_s"].as<double>();
    }
    if (node["respond_to_queries"]) srv.respond_to_queries = node["respond_to_queries"].as<bool>();
    if (node["track_peers"])        srv.track_peers = node["track_peers"].as<bool>();
    srv.device_headers = parseHeaderMap(node["device_headers"], "server.device_headers");
    return srv;
}

SearchConfig parseSearch(const YAML::Node& node) {
    SearchConfig search;
    if (!node || !node.IsMap()) return search;
    if (node["pattern"])                 search.pattern = node["pattern"].as<std::string>();
    if (node["wait_time_s"])             search.wait_time_s = node["wait_time_s"].as<double>();
    if (node["max_responses"])           search.max_responses = node["max_responses"].as<std::size_t>();
    if (node["include_error_responses"]) search.include_error_responses = node["include_error_responses"].as<bool>();
    search.filter_headers = parseHeaderMap(node["filter_headers"], "search.filter_headers");
    return search;
}

SddpConfig parseRoot(const YAML::Node& root) {
    SddpConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) {
        throw ConfigValidationError("Configuration root must be a mapping");
    }

    if (root["network"]) {
        config.network = parseNetwork(root["network"]);
    }

    if (root["server"]) {
        config.server = parseServer(root["server"]);
    }

    if (root["search"]) {
        config.search = parseSearch(root["search"]);
    }

    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }

    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }

    return config;
}

std::chrono::milliseconds secondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

} // anonymous namespace

void validateConfig(const SddpConfig& config) {
    // Validate network
    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address_v4(config.network.multicast_address, ec);
    if (ec) {
        throw ConfigValidationError("network.multicast_address is not an IPv4 address: " +
                                    config.network.multicast_address);
    }
    if (!group.is_multicast()) {
        getLogger(LogCategory::CONFIG)->warn(
            "network.multicast_address {} is not a multicast address; sending unicast",
            config.network.multicast_address);
    }
    if (config.network.multicast_ttl < 0 || config.network.multicast_ttl > 255) {
        throw ConfigValidationError("multicast_ttl must be between 0 and 255");
    }
    std::set<std::string> addresses;
    for (const auto& address : config.network.bind_addresses) {
        boost::asio::ip::make_address_v4(address, ec);
        if (ec) {
            throw ConfigValidationError("bind address is not an IPv4 address: " + address);
        }
        if (!addresses.insert(address).second) {
            throw ConfigValidationError("Duplicate bind address: " + address);
        }
    }

    // Validate server
    if (config.server.advertise_interval_s &&
        !(*config.server.advertise_interval_s >= 0.0 &&
          *config.server.advertise_interval_s <= kMaxDurationSeconds)) {
        throw ConfigValidationError("advertise_interval_s must be between 0 and " +
                                    std::to_string(static_cast<long>(kMaxDurationSeconds)));
    }
    if (const auto* max_age = config.server.device_headers.get("Max-Age")) {
        auto value = protocol::headerValueAsInteger(*max_age);
        if (!value || *value < 0) {
            throw ConfigValidationError("device_headers.Max-Age must be a non-negative integer");
        }
    }

    // Validate search
    if (config.search.pattern.empty() ||
        config.search.pattern.find_first_of(" \t\r\n") != std::string::npos) {
        throw ConfigValidationError("search.pattern must be a single non-empty token");
    }
    if (!(config.search.wait_time_s >= 0.0 && config.search.wait_time_s <= kMaxDurationSeconds)) {
        throw ConfigValidationError("search.wait_time_s must be between 0 and " +
                                    std::to_string(static_cast<long>(kMaxDurationSeconds)));
    }

    // Validate log level
    static const std::set<std::string> valid_levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (valid_levels.find(config.log_level) == valid_levels.end()) {
        throw ConfigValidationError("Invalid log_level: " + config.log_level +
                                    ". Must be one of: trace, debug, info, warn, error, critical, off");
    }
}

SddpConfig loadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return SddpConfig{};
    }

    SddpConfig config;
    try {
        config = parseRoot(YAML::LoadFile(path));
    } catch (const YAML::Exception& ex) {
        throw ConfigValidationError("Failed to parse " + path + ": " + ex.what());
    }

    validateConfig(config);
    return config;
}

SddpConfig parseConfig(const std::string& yaml) {
    SddpConfig config;
    try {
        config = parseRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& ex) {
        throw ConfigValidationError(std::string("Failed to parse configuration: ") + ex.what());
    }

    validateConfig(config);
    return config;
}

std::pair<std::string, protocol::HeaderValue> parseHeaderAssignment(std::string_view assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        throw ConfigValidationError("Header must be given as name=value: " + std::string(assignment));
    }
    std::string name(assignment.substr(0, eq));
    std::string value(assignment.substr(eq + 1));

    if (protocol::iequals(name, "Max-Age")) {
        auto number = protocol::headerValueAsInteger(protocol::parseHeaderValue(value));
        if (!number) {
            throw ConfigValidationError("Max-Age must be an integer: " + value);
        }
        return {std::move(name), *number};
    }
    return {std::move(name), std::move(value)};
}

network::EndpointOptions toEndpointOptions(const NetworkConfig& network) {
    network::EndpointOptions options;
    options.multicast_address = network.multicast_address;
    options.multicast_port = network.multicast_port;
    options.multicast_ttl = network.multicast_ttl;
    options.multicast_loopback = network.multicast_loopback;
    return options;
}

discovery::ServerOptions toServerOptions(const ServerConfig& server) {
    discovery::ServerOptions options;
    options.device_headers = server.device_headers;
    if (server.advertise_interval_s) {
        options.advertise_interval = secondsToMillis(*server.advertise_interval_s);
    }
    options.respond_to_queries = server.respond_to_queries;
    options.track_peers = server.track_peers;
    return options;
}

discovery::SearchOptions toSearchOptions(const SearchConfig& search) {
    discovery::SearchOptions options;
    options.search_target = search.pattern;
    options.wait_time = secondsToMillis(search.wait_time_s);
    options.max_responses = search.max_responses;
    options.include_error_responses = search.include_error_responses;
    if (!search.filter_headers.empty()) {
        options.filter = discovery::matchHeaders(search.filter_headers);
    }
    return options;
}

} // namespace c4::sddp::config
