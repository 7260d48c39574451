#pragma once
#include "sddp_config.h"
#include "../discovery/advertising_server.h"
#include "../discovery/search_session.h"
#include "../network/multicast_endpoint.h"
#include <string>
#include <string_view>
#include <stdexcept>
#include <utility>

namespace c4::sddp::config {

class ConfigValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Load configuration from a YAML file.
// If the file does not exist, returns the default configuration.
SddpConfig loadConfig(const std::string& path);

// Parse configuration from YAML text.
SddpConfig parseConfig(const std::string& yaml);

// Validate an SddpConfig, throwing ConfigValidationError on problems.
void validateConfig(const SddpConfig& config);

// Parse a command-line header assignment "Name=value". Max-Age is parsed as
// an integer; every other value is kept as a string.
std::pair<std::string, protocol::HeaderValue> parseHeaderAssignment(std::string_view assignment);

// Runtime options derived from the configuration.
network::EndpointOptions toEndpointOptions(const NetworkConfig& network);
discovery::ServerOptions toServerOptions(const ServerConfig& server);
discovery::SearchOptions toSearchOptions(const SearchConfig& search);

} // namespace c4::sddp::config
