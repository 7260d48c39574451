#pragma once

#include "../common/asio_compat.h"
#include "../common/logger.h"
#include "../common/types.h"
#include "../protocol/sddp_message.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace c4::sddp::network {

/// Server endpoints listen on the SDDP port and join the group; client
/// endpoints use an ephemeral port and only receive unicast replies.
enum class EndpointRole : std::uint8_t {
    Client,
    Server
};

const char* toString(EndpointRole role);

struct EndpointOptions {
    std::string multicast_address = kSddpMulticastAddress;
    std::uint16_t multicast_port = kSddpPort;
    int multicast_ttl = 1;           // local subnet only
    bool multicast_loopback = true;  // lets a client and server on one host see each other
};

struct EndpointStats {
    std::uint64_t datagrams_received = 0;
    std::uint64_t decode_failures = 0;
    std::uint64_t datagrams_sent = 0;
    std::uint64_t send_errors = 0;
};

/// One UDP socket bound to a single local IPv4 address. Outbound messages
/// are encoded and inbound datagrams decoded at this boundary.
class MulticastEndpoint : public std::enable_shared_from_this<MulticastEndpoint> {
public:
    using Ptr = std::shared_ptr<MulticastEndpoint>;
    using MessageHandler = std::function<void(MulticastEndpoint&, const protocol::SddpMessage&)>;

    /// Bind (and for servers join the group) on local_address.
    /// Throws EndpointSetupError on any failure; nothing is retried.
    static Ptr create(boost::asio::io_context& io_ctx,
                      const std::string& local_address,
                      EndpointRole role,
                      const EndpointOptions& options = {});

    ~MulticastEndpoint();

    MulticastEndpoint(const MulticastEndpoint&) = delete;
    MulticastEndpoint& operator=(const MulticastEndpoint&) = delete;

    /// Send to the configured group:port. Returns false (and logs) on a send
    /// error; the endpoint stays usable.
    bool send_multicast(const protocol::SddpMessage& message);

    /// Send directly to a peer.
    bool send_unicast(const protocol::SddpMessage& message, const HostAndPort& peer);

    /// Begin the asynchronous receive loop. Every datagram that decodes is
    /// handed to on_message; undecodable ones are dropped.
    void start_receive(MessageHandler on_message);

    /// Cancel the receive loop. Completions already queued are discarded.
    void stop_receive();

    /// Leave the group and close the socket. Idempotent.
    void close();

    /// Local address and bound port, as advertised in From/Host headers.
    const HostAndPort& unicast_address() const { return unicast_address_; }
    const std::string& local_address() const { return unicast_address_.host; }

    EndpointRole role() const { return role_; }
    bool is_open() const { return !closed_; }
    bool joined() const { return joined_; }
    bool receiving() const { return on_message_ != nullptr; }
    bool non_blocking() const { return socket_.non_blocking(); }
    const EndpointStats& stats() const { return stats_; }

    /// Identifier for logging, e.g. "server@192.168.1.10:1902".
    std::string name() const;

private:
    MulticastEndpoint(boost::asio::io_context& io_ctx,
                      const std::string& local_address,
                      EndpointRole role,
                      const EndpointOptions& options);

    void open_and_bind();
    void set_native_option(int level, int option, int value, const char* what);
    void do_receive(std::uint64_t generation);
    bool send_datagram(const protocol::SddpMessage& message,
                       const boost::asio::ip::udp::endpoint& destination);

    EndpointRole role_;
    EndpointOptions options_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::address_v4 local_ip_;
    boost::asio::ip::udp::endpoint multicast_endpoint_;
    HostAndPort unicast_address_;

    std::vector<char> recv_buf_;
    boost::asio::ip::udp::endpoint sender_;
    MessageHandler on_message_;
    std::uint64_t receive_generation_{0};

    bool joined_{false};
    bool closed_{false};
    EndpointStats stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace c4::sddp::network
