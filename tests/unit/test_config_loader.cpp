#include <gtest/gtest.h>
#include "config/config_loader.h"
#include <filesystem>
#include <fstream>
#include <string>

using namespace c4::sddp;
using namespace c4::sddp::config;
using namespace c4::sddp::protocol;

TEST(ConfigLoader, MissingFileYieldsDefaults) {
    auto cfg = loadConfig("/nonexistent/path/sddp.yaml");
    EXPECT_EQ(cfg.network.multicast_address, "239.255.255.250");
    EXPECT_EQ(cfg.network.multicast_port, 1902);
    EXPECT_EQ(cfg.network.multicast_ttl, 1);
    EXPECT_TRUE(cfg.network.bind_addresses.empty());
    EXPECT_FALSE(cfg.server.advertise_interval_s.has_value());
    EXPECT_TRUE(cfg.server.respond_to_queries);
    EXPECT_EQ(cfg.search.pattern, "*");
    EXPECT_DOUBLE_EQ(cfg.search.wait_time_s, 3.0);
    EXPECT_EQ(cfg.log_level, "warn");
}

TEST(ConfigLoader, ParsesAllSections) {
    auto cfg = parseConfig(R"(
log_level: debug
log_file: /tmp/sddp.log
network:
  multicast_address: 239.255.255.250
  multicast_port: 1902
  multicast_ttl: 4
  multicast_loopback: false
  include_loopback: true
  bind_addresses: [192.168.1.10, 10.0.0.2]
server:
  advertise_interval_s: 30
  respond_to_queries: false
  track_peers: false
  device_headers:
    Type: acme:thermostat
    Max-Age: 90
search:
  pattern: sddp:all
  wait_time_s: 1.5
  max_responses: 4
  include_error_responses: true
  filter_headers:
    Manufacturer: Acme
)");

    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.log_file, "/tmp/sddp.log");
    EXPECT_EQ(cfg.network.multicast_ttl, 4);
    EXPECT_FALSE(cfg.network.multicast_loopback);
    EXPECT_TRUE(cfg.network.include_loopback);
    ASSERT_EQ(cfg.network.bind_addresses.size(), 2u);
    EXPECT_EQ(cfg.network.bind_addresses[1], "10.0.0.2");

    ASSERT_TRUE(cfg.server.advertise_interval_s.has_value());
    EXPECT_DOUBLE_EQ(*cfg.server.advertise_interval_s, 30.0);
    EXPECT_FALSE(cfg.server.respond_to_queries);
    EXPECT_FALSE(cfg.server.track_peers);
    EXPECT_EQ(cfg.server.device_headers.getString("Type"), "acme:thermostat");
    EXPECT_EQ(cfg.server.device_headers.getInteger("Max-Age"), 90);

    EXPECT_EQ(cfg.search.pattern, "sddp:all");
    EXPECT_DOUBLE_EQ(cfg.search.wait_time_s, 1.5);
    EXPECT_EQ(cfg.search.max_responses, 4u);
    EXPECT_TRUE(cfg.search.include_error_responses);
    EXPECT_EQ(cfg.search.filter_headers.getString("Manufacturer"), "Acme");
}

TEST(ConfigLoader, HeaderValueTyping) {
    auto cfg = parseConfig(R"(
server:
  device_headers:
    Plain-Number: 1800
    Quoted-Number: "1800"
    Flag: true
    Proxies: [thermostat, sensor]
)");
    const auto& h = cfg.server.device_headers;
    EXPECT_EQ(kindOf(*h.get("Plain-Number")), HeaderValueKind::Integer);
    EXPECT_EQ(kindOf(*h.get("Quoted-Number")), HeaderValueKind::String);
    EXPECT_EQ(*h.get("Flag"), HeaderValue(true));
    EXPECT_EQ(h.getString("Proxies"), "thermostat,sensor");
}

TEST(ConfigLoader, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "sddp_config_loader_test.yaml";
    {
        std::ofstream out(path);
        out << "log_level: info\nsearch:\n  wait_time_s: 0.25\n";
    }
    auto cfg = loadConfig(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_DOUBLE_EQ(cfg.search.wait_time_s, 0.25);
}

TEST(ConfigLoader, RejectsInvalidValues) {
    EXPECT_THROW(parseConfig("log_level: loud\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("network:\n  multicast_address: not-an-ip\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("network:\n  multicast_ttl: 300\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("network:\n  bind_addresses: [10.0.0.1, 10.0.0.1]\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("network:\n  bind_addresses: [eth0]\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("server:\n  advertise_interval_s: -1\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("server:\n  device_headers:\n    Max-Age: soon\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("search:\n  wait_time_s: -2\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("search:\n  wait_time_s: 1e12\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("server:\n  advertise_interval_s: 1e12\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("search:\n  pattern: \"a b\"\n"), ConfigValidationError);
}

TEST(ConfigLoader, RejectsMalformedYaml) {
    EXPECT_THROW(parseConfig("network: [unclosed\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("- just\n- a list\n"), ConfigValidationError);
    EXPECT_THROW(parseConfig("server:\n  device_headers: [a, b]\n"), ConfigValidationError);
}

// ===========================================================================
// Command-line header assignments
// ===========================================================================

TEST(HeaderAssignment, MaxAgeIsInteger) {
    auto [name, value] = parseHeaderAssignment("Max-Age=60");
    EXPECT_EQ(name, "Max-Age");
    EXPECT_EQ(value, HeaderValue(std::int64_t{60}));
}

TEST(HeaderAssignment, OtherHeadersAreStrings) {
    auto [name, value] = parseHeaderAssignment("Model=1800");
    EXPECT_EQ(name, "Model");
    EXPECT_EQ(value, HeaderValue(std::string("1800")));

    auto type = parseHeaderAssignment("Type=acme:light=v2");
    EXPECT_EQ(type.second, HeaderValue(std::string("acme:light=v2")));
}

TEST(HeaderAssignment, Malformed) {
    EXPECT_THROW(parseHeaderAssignment("NoEquals"), ConfigValidationError);
    EXPECT_THROW(parseHeaderAssignment("=value"), ConfigValidationError);
    EXPECT_THROW(parseHeaderAssignment("Max-Age=soon"), ConfigValidationError);
}

// ===========================================================================
// Runtime options
// ===========================================================================

TEST(ConfigOptions, SearchOptions) {
    SearchConfig search;
    search.pattern = "sddp:all";
    search.wait_time_s = 2.5;
    search.max_responses = 3;
    search.filter_headers.set("Type", std::string("acme:light"));

    auto options = toSearchOptions(search);
    EXPECT_EQ(options.search_target, "sddp:all");
    EXPECT_EQ(options.wait_time, std::chrono::milliseconds(2500));
    EXPECT_EQ(options.max_responses, 3u);
    EXPECT_TRUE(static_cast<bool>(options.filter));

    EXPECT_FALSE(static_cast<bool>(toSearchOptions(SearchConfig{}).filter));
}

TEST(ConfigOptions, ServerOptions) {
    ServerConfig server;
    EXPECT_FALSE(toServerOptions(server).advertise_interval.has_value());

    server.advertise_interval_s = 0.0;
    auto options = toServerOptions(server);
    ASSERT_TRUE(options.advertise_interval.has_value());
    EXPECT_EQ(options.advertise_interval->count(), 0);
}

TEST(ConfigOptions, EndpointOptions) {
    NetworkConfig network;
    network.multicast_port = 5000;
    network.multicast_ttl = 3;
    auto options = toEndpointOptions(network);
    EXPECT_EQ(options.multicast_address, "239.255.255.250");
    EXPECT_EQ(options.multicast_port, 5000);
    EXPECT_EQ(options.multicast_ttl, 3);
    EXPECT_TRUE(options.multicast_loopback);
}
