// sddp_listener - passive SDDP multicast listener and decoder
// Usage: sddp_listener [--group MULTICAST_ADDR] [--port PORT] [--iface INTERFACE]
//                      [--stats N] [--json]

#include <iostream>
#include <string>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

#include "common/asio_compat.h"
#include "common/clock.h"
#include "common/types.h"
#include "protocol/codec.h"
#include "protocol/json_records.h"

using boost::asio::ip::udp;
using namespace c4::sddp;
using namespace c4::sddp::protocol;

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------
static std::atomic<bool> g_running{true};

static void signalHandler(int) { g_running = false; }

// ---------------------------------------------------------------------------
// Statistics
// ---------------------------------------------------------------------------
struct Stats {
    uint64_t datagramsReceived = 0;
    uint64_t notifies = 0;
    uint64_t searches = 0;
    uint64_t responses = 0;
    uint64_t decodeFailures = 0;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point lastPrintTime;
};

static void printStats(Stats& stats) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - stats.startTime).count();
    std::cerr << "\n--- Statistics (after " << elapsed << "s) ---\n"
              << "  Datagrams received: " << stats.datagramsReceived << "\n"
              << "  NOTIFY:             " << stats.notifies << "\n"
              << "  SEARCH:             " << stats.searches << "\n"
              << "  RESPONSE:           " << stats.responses << "\n"
              << "  Decode failures:    " << stats.decodeFailures << "\n"
              << std::endl;
    stats.lastPrintTime = now;
}

// ---------------------------------------------------------------------------
// Process a complete UDP datagram
// ---------------------------------------------------------------------------
static void processDatagram(const char* data, size_t len, const udp::endpoint& sender,
                            bool asJson, Stats& stats) {
    stats.datagramsReceived++;

    HostAndPort source{sender.address().to_string(), sender.port()};
    auto result = decode(std::string_view(data, len), source,
                         Clock::steadyNow(), Clock::wallNow());
    if (!result) {
        stats.decodeFailures++;
        std::cout << "[" << Clock::toIso8601(Clock::wallNow()) << "] "
                  << source.toString() << " undecodable (" << len << " bytes): "
                  << result.error << "\n";
        return;
    }

    const SddpMessage& msg = *result.message;
    switch (msg.kind()) {
        case MessageKind::Notify:   stats.notifies++; break;
        case MessageKind::Search:   stats.searches++; break;
        case MessageKind::Response: stats.responses++; break;
    }

    if (asJson) {
        std::cout << toJson(msg).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return;
    }

    std::cout << "[" << Clock::toIso8601(*msg.receivedWallTime()) << "] "
              << source.toString() << " " << msg.statement() << "\n";
    for (const auto& h : msg.headers()) {
        std::cout << "    " << h.name << ": " << h.raw << "\n";
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    std::string multicastGroup = kSddpMulticastAddress;
    uint16_t port = kSddpPort;
    std::string listenIface = "0.0.0.0";
    int statsInterval = 0;  // seconds, 0 = final summary only
    bool asJson = false;

    // Parse args
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--group" && i + 1 < argc) {
            multicastGroup = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--iface" && i + 1 < argc) {
            listenIface = argv[++i];
        } else if (arg == "--stats" && i + 1 < argc) {
            statsInterval = std::stoi(argv[++i]);
        } else if (arg == "--json") {
            asJson = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sddp_listener [OPTIONS]\n"
                      << "  --group ADDR      Multicast group (default: " << kSddpMulticastAddress << ")\n"
                      << "  --port PORT       Port (default: " << kSddpPort << ")\n"
                      << "  --iface ADDR      Interface to join on (default: 0.0.0.0)\n"
                      << "  --stats N         Print stats every N seconds (default: off)\n"
                      << "  --json            Print each message as a JSON record\n"
                      << "  --help            Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cerr << "SDDP Listener\n"
              << "  Group:    " << multicastGroup << "\n"
              << "  Port:     " << port << "\n"
              << "  Interface:" << listenIface << "\n"
              << std::endl;

    try {
        boost::asio::io_context ioc;

        // SDDP servers on this host hold the same port
        udp::endpoint listenEndpoint(boost::asio::ip::address_v4::any(), port);
        udp::socket sock(ioc, listenEndpoint.protocol());
        sock.set_option(udp::socket::reuse_address(true));
        sock.bind(listenEndpoint);

        sock.set_option(boost::asio::ip::multicast::join_group(
            boost::asio::ip::make_address_v4(multicastGroup),
            boost::asio::ip::make_address_v4(listenIface)));

        std::cerr << "Joined multicast group " << multicastGroup
                  << ":" << port << "\n"
                  << "Listening for datagrams... (Ctrl+C to stop)\n\n";

        Stats stats;
        stats.startTime = std::chrono::steady_clock::now();
        stats.lastPrintTime = stats.startTime;

        std::vector<char> recvBuf(kMaxDatagramSize);
        udp::endpoint senderEndpoint;
        sock.non_blocking(true);

        while (g_running) {
            boost::system::error_code ec;
            size_t bytesRead = sock.receive_from(
                boost::asio::buffer(recvBuf), senderEndpoint, 0, ec);

            if (ec == boost::asio::error::would_block) {
                // No data available, sleep briefly
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            } else if (ec) {
                if (g_running) {
                    std::cerr << "Receive error: " << ec.message() << "\n";
                }
                break;
            } else {
                processDatagram(recvBuf.data(), bytesRead, senderEndpoint, asJson, stats);
                std::cout.flush();
            }

            // Periodic stats
            if (statsInterval > 0) {
                auto now = std::chrono::steady_clock::now();
                auto sinceLastPrint =
                    std::chrono::duration_cast<std::chrono::seconds>(
                        now - stats.lastPrintTime)
                        .count();
                if (sinceLastPrint >= statsInterval) {
                    printStats(stats);
                }
            }
        }

        // Final stats
        std::cerr << "\n--- Final Statistics ---\n";
        printStats(stats);

        boost::system::error_code ec;
        sock.set_option(boost::asio::ip::multicast::leave_group(
            boost::asio::ip::make_address_v4(multicastGroup),
            boost::asio::ip::make_address_v4(listenIface)), ec);
        sock.close(ec);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
