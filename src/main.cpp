// SDDP discovery tool
// Wires together: Config -> EndpointSet -> AdvertisingServer | SearchSession -> JSON on stdout

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/config_loader.h"
#include "config/sddp_config.h"
#include "common/asio_compat.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/types.h"
#include "common/version.h"
#include "discovery/advertising_server.h"
#include "discovery/sddp_client.h"
#include "network/endpoint_set.h"
#include "protocol/json_records.h"

using namespace c4::sddp;
using namespace c4::sddp::config;
using namespace c4::sddp::discovery;
using namespace c4::sddp::network;

// ---------------------------------------------------------------------------
// Command-line argument parsing
// ---------------------------------------------------------------------------
struct AppArgs {
    std::string config_path = "config/sddp.yaml";
    std::string log_level;   // empty => use config value
    std::string command;     // server | search | version

    // shared
    std::vector<std::string> bind_addresses;

    // server
    std::vector<std::string> headers;
    std::optional<double> advertise_interval;
    bool no_respond = false;
    bool no_peers = false;

    // search
    std::optional<std::string> pattern;
    std::optional<double> wait_time;
    std::optional<std::size_t> max_responses;
    bool include_error_responses = false;
    std::vector<std::string> filters;
};

static void printUsage() {
    std::cout << "Usage: sddp [OPTIONS] COMMAND [COMMAND OPTIONS]\n"
              << "  --config PATH       Config file (default: config/sddp.yaml)\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error|critical|off (overrides config)\n"
              << "  --help              Show this message\n"
              << "\n"
              << "Commands:\n"
              << "  server              Advertise this device and answer searches until interrupted\n"
              << "    -H, --header NAME=VALUE    Device header (repeatable)\n"
              << "    -b, --bind ADDR            Local address to serve on (repeatable)\n"
              << "    --advertise-interval S     Seconds between NOTIFYs, 0 disables\n"
              << "    --no-respond               Do not answer SEARCH requests\n"
              << "    --no-peers                 Do not track other devices\n"
              << "  search              Search for devices and print each response as JSON\n"
              << "    --pattern P                Search target (default: *)\n"
              << "    --wait-time S              Seconds to wait for responses (default: 3)\n"
              << "    -b, --bind ADDR            Local address to search from (repeatable)\n"
              << "    --include-error-responses  Report non-200 responses\n"
              << "    --max-responses N          Stop after N responses (0 = no limit)\n"
              << "    -F, --filter NAME=VALUE    Only report responses with this header (repeatable)\n"
              << "  version             Print the version\n";
}

static AppArgs parseArgs(int argc, char* argv[]) {
    AppArgs args;
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            args.config_path = value(i, a);
        } else if (a == "--log-level") {
            args.log_level = value(i, a);
        } else if (a == "--help" || a == "-h") {
            printUsage();
            std::exit(EXIT_SUCCESS);
        } else if (args.command.empty() && (a == "server" || a == "search" || a == "version")) {
            args.command = a;
        } else if (a == "-b" || a == "--bind") {
            args.bind_addresses.push_back(value(i, a));
        } else if (args.command == "server" && (a == "-H" || a == "--header")) {
            args.headers.push_back(value(i, a));
        } else if (args.command == "server" && a == "--advertise-interval") {
            args.advertise_interval = std::stod(value(i, a));
        } else if (args.command == "server" && a == "--no-respond") {
            args.no_respond = true;
        } else if (args.command == "server" && a == "--no-peers") {
            args.no_peers = true;
        } else if (args.command == "search" && a == "--pattern") {
            args.pattern = value(i, a);
        } else if (args.command == "search" && a == "--wait-time") {
            args.wait_time = std::stod(value(i, a));
        } else if (args.command == "search" && a == "--max-responses") {
            args.max_responses = static_cast<std::size_t>(std::stoul(value(i, a)));
        } else if (args.command == "search" && a == "--include-error-responses") {
            args.include_error_responses = true;
        } else if (args.command == "search" && (a == "-F" || a == "--filter")) {
            args.filters.push_back(value(i, a));
        } else {
            throw std::invalid_argument("Unexpected argument: " + a);
        }
    }
    return args;
}

// Command-line values take precedence over the configuration file.
static void applyOverrides(SddpConfig& cfg, const AppArgs& args) {
    if (!args.log_level.empty()) {
        cfg.log_level = args.log_level;
    }
    if (!args.bind_addresses.empty()) {
        cfg.network.bind_addresses = args.bind_addresses;
    }
    for (const auto& h : args.headers) {
        auto [name, v] = parseHeaderAssignment(h);
        cfg.server.device_headers.set(std::move(name), std::move(v));
    }
    if (args.advertise_interval) {
        cfg.server.advertise_interval_s = args.advertise_interval;
    }
    if (args.no_respond) cfg.server.respond_to_queries = false;
    if (args.no_peers)   cfg.server.track_peers = false;

    if (args.pattern)       cfg.search.pattern = *args.pattern;
    if (args.wait_time)     cfg.search.wait_time_s = *args.wait_time;
    if (args.max_responses) cfg.search.max_responses = *args.max_responses;
    if (args.include_error_responses) cfg.search.include_error_responses = true;
    for (const auto& f : args.filters) {
        auto [name, v] = parseHeaderAssignment(f);
        cfg.search.filter_headers.set(std::move(name), std::move(v));
    }
}

static void printJson(const nlohmann::json& record) {
    std::cout << record.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

// ---------------------------------------------------------------------------
// Startup banner (stderr; stdout carries JSON records)
// ---------------------------------------------------------------------------
static void printBanner(const SddpConfig& cfg, const AdvertisingServer& server) {
    std::cerr << "\n";
    std::cerr << "======================================================\n";
    std::cerr << "       SDDP Server v" << kVersion << "\n";
    std::cerr << "  Group: " << cfg.network.multicast_address
              << ":" << cfg.network.multicast_port << "\n";

    std::cerr << "  Endpoints:";
    const auto& eps = server.endpoints().endpoints();
    for (size_t i = 0; i < eps.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << eps[i]->unicast_address().toString();
    }
    std::cerr << "\n";

    if (server.advertiseInterval().count() > 0) {
        std::cerr << "  Advertise Interval: " << server.advertiseInterval().count() << " ms\n";
    } else {
        std::cerr << "  Advertise Interval: disabled\n";
    }
    std::cerr << "  Type: "
              << server.advertisement().type().value_or("(none)") << "\n";
    std::cerr << "  Log Level: " << cfg.log_level << "\n";
    std::cerr << "======================================================\n";
    std::cerr << std::endl;
}

static int runServer(const SddpConfig& cfg) {
    auto logger = getLogger(LogCategory::MAIN);
    boost::asio::io_context io_ctx;

    auto endpoints = std::make_unique<EndpointSet>(
        io_ctx, cfg.network.bind_addresses, EndpointRole::Server,
        toEndpointOptions(cfg.network), cfg.network.include_loopback);
    auto server = AdvertisingServer::create(io_ctx, std::move(endpoints),
                                            toServerOptions(cfg.server));

    server->addNotifyHandler([](const protocol::SddpMessage& message, const HostAndPort& local) {
        auto record = protocol::toJson(message);
        record["local_addr"] = local.toString();
        printJson(record);
    });

    boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        logger->info("Signal {} received, stopping server", sig);
        server->stop();
    });

    printBanner(cfg, *server);
    server->start();
    logger->info("SDDP server running. Press Ctrl+C to stop.");

    io_ctx.run();

    const auto& stats = server->stats();
    logger->info("Shutdown complete: {} NOTIFY sent, {} SEARCH received, {} responses sent",
                 stats.notifies_sent, stats.searches_received, stats.responses_sent);
    return EXIT_SUCCESS;
}

static int runSearch(const SddpConfig& cfg) {
    auto logger = getLogger(LogCategory::MAIN);
    boost::asio::io_context io_ctx;

    SddpClient client(io_ctx, cfg.network.bind_addresses,
                      toEndpointOptions(cfg.network), cfg.network.include_loopback);
    auto session = client.search(toSearchOptions(cfg.search));

    std::weak_ptr<SearchSession> weak = session;
    boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
    signals.async_wait([weak, logger](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        logger->info("Signal {} received, cancelling search", sig);
        if (auto s = weak.lock()) s->cancel();
    });

    while (auto response = session->next()) {
        auto record = protocol::toJson(response->message);
        record["local_addr"] = response->local_address.toString();
        printJson(record);
    }
    signals.cancel();

    logger->info("Search complete: {} response(s)", session->yielded());
    return EXIT_SUCCESS;
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // 1. Parse command-line arguments
    AppArgs args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << "\n\n";
        printUsage();
        return EXIT_FAILURE;
    }

    if (args.command.empty()) {
        std::cerr << "A command is required\n\n";
        printUsage();
        return EXIT_FAILURE;
    }
    if (args.command == "version") {
        std::cout << kVersion << std::endl;
        return EXIT_SUCCESS;
    }

    // 2. Load configuration and apply CLI overrides
    SddpConfig cfg;
    try {
        cfg = loadConfig(args.config_path);
        applyOverrides(cfg, args);
        validateConfig(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }

    // 3. Initialize logging
    initLogging(cfg.log_level, cfg.log_file);
    auto logger = getLogger(LogCategory::MAIN);
    logger->info("Loaded configuration from {}", args.config_path);

    // 4. Run the command
    int rc = EXIT_FAILURE;
    try {
        rc = (args.command == "server") ? runServer(cfg) : runSearch(cfg);
    } catch (const SddpError& ex) {
        logger->error("{}", ex.what());
    } catch (const boost::system::system_error& ex) {
        logger->error("Network error: {}", ex.what());
    }

    spdlog::shutdown();
    return rc;
}
