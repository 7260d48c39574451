#include "network/multicast_endpoint.h"

#include "common/clock.h"
#include "common/errors.h"
#include "protocol/codec.h"

#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>

namespace c4::sddp::network {

namespace ip = boost::asio::ip;

const char* toString(EndpointRole role) {
    switch (role) {
        case EndpointRole::Client: return "client";
        case EndpointRole::Server: return "server";
    }
    return "unknown";
}

MulticastEndpoint::Ptr MulticastEndpoint::create(boost::asio::io_context& io_ctx,
                                                 const std::string& local_address,
                                                 EndpointRole role,
                                                 const EndpointOptions& options) {
    return Ptr(new MulticastEndpoint(io_ctx, local_address, role, options));
}

MulticastEndpoint::MulticastEndpoint(boost::asio::io_context& io_ctx,
                                     const std::string& local_address,
                                     EndpointRole role,
                                     const EndpointOptions& options)
    : role_(role)
    , options_(options)
    , socket_(io_ctx)
    , recv_buf_(kMaxDatagramSize)
    , logger_(getLogger(LogCategory::ENDPOINT)) {
    boost::system::error_code ec;
    local_ip_ = ip::make_address_v4(local_address, ec);
    if (ec) {
        throw EndpointSetupError(local_address, "not an IPv4 address");
    }
    auto group = ip::make_address_v4(options_.multicast_address, ec);
    if (ec) {
        throw EndpointSetupError(local_address,
                                 "invalid multicast address '" + options_.multicast_address + "'");
    }
    multicast_endpoint_ = ip::udp::endpoint(group, options_.multicast_port);
    unicast_address_.host = local_ip_.to_string();

    try {
        open_and_bind();
    } catch (const boost::system::system_error& ex) {
        socket_.close(ec);
        closed_ = true;
        throw EndpointSetupError(local_address, ex.what());
    }

    logger_->info("Endpoint ready: {} (group={}, ttl={}, loopback={})",
                  name(), multicast_endpoint_.address().to_string() + ":" +
                              std::to_string(multicast_endpoint_.port()),
                  options_.multicast_ttl, options_.multicast_loopback);
}

MulticastEndpoint::~MulticastEndpoint() {
    close();
}

void MulticastEndpoint::open_and_bind() {
    socket_.open(ip::udp::v4());
    socket_.set_option(ip::udp::socket::reuse_address(true));
    // A full send buffer fails the send with would_block instead of stalling
    // the reactor.
    socket_.non_blocking(true);

    const bool group_is_multicast = multicast_endpoint_.address().is_multicast();

    if (role_ == EndpointRole::Server) {
        // Several servers (or a listener tool) on one host share the port.
#ifdef SO_REUSEPORT
        set_native_option(SOL_SOCKET, SO_REUSEPORT, 1, "SO_REUSEPORT");
#endif
        // Without this Linux delivers every group joined by any socket on
        // the host to each wildcard-bound socket.
#ifdef IP_MULTICAST_ALL
        set_native_option(IPPROTO_IP, IP_MULTICAST_ALL, 0, "IP_MULTICAST_ALL");
#endif
        socket_.bind(ip::udp::endpoint(ip::address_v4::any(), options_.multicast_port));
        if (group_is_multicast) {
            socket_.set_option(ip::multicast::join_group(
                multicast_endpoint_.address().to_v4(), local_ip_));
            joined_ = true;
        }
    } else {
        socket_.bind(ip::udp::endpoint(local_ip_, 0));
    }

    if (group_is_multicast) {
        socket_.set_option(ip::multicast::outbound_interface(local_ip_));
        socket_.set_option(ip::multicast::hops(options_.multicast_ttl));
        socket_.set_option(ip::multicast::enable_loopback(options_.multicast_loopback));
    }

    unicast_address_.port = socket_.local_endpoint().port();
}

void MulticastEndpoint::set_native_option(int level, int option, int value, const char* what) {
    if (::setsockopt(socket_.native_handle(), level, option, &value, sizeof(value)) != 0) {
        throw boost::system::system_error(
            boost::system::error_code(errno, boost::system::system_category()), what);
    }
}

std::string MulticastEndpoint::name() const {
    return std::string(toString(role_)) + "@" + unicast_address_.toString();
}

bool MulticastEndpoint::send_multicast(const protocol::SddpMessage& message) {
    return send_datagram(message, multicast_endpoint_);
}

bool MulticastEndpoint::send_unicast(const protocol::SddpMessage& message, const HostAndPort& peer) {
    boost::system::error_code ec;
    auto peer_ip = ip::make_address_v4(peer.host, ec);
    if (ec) {
        logger_->warn("{}: cannot send to '{}': not an IPv4 address", name(), peer.host);
        ++stats_.send_errors;
        return false;
    }
    return send_datagram(message, ip::udp::endpoint(peer_ip, peer.port));
}

bool MulticastEndpoint::send_datagram(const protocol::SddpMessage& message,
                                      const ip::udp::endpoint& destination) {
    if (closed_) {
        ++stats_.send_errors;
        return false;
    }

    std::string bytes = protocol::encode(message);
    if (bytes.size() > kMaxDatagramSize) {
        logger_->warn("{}: {} message of {} bytes exceeds datagram limit",
                      name(), protocol::toString(message.kind()), bytes.size());
        ++stats_.send_errors;
        return false;
    }

    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(bytes), destination, 0, ec);
    if (ec) {
        logger_->warn("{}: send to {}:{} failed: {}", name(),
                      destination.address().to_string(), destination.port(), ec.message());
        ++stats_.send_errors;
        return false;
    }

    ++stats_.datagrams_sent;
    logger_->trace("{}: sent {} ({} bytes) to {}:{}", name(), message.statement(), bytes.size(),
                   destination.address().to_string(), destination.port());
    return true;
}

void MulticastEndpoint::start_receive(MessageHandler on_message) {
    if (closed_) return;
    if (on_message_) {
        boost::system::error_code ec;
        socket_.cancel(ec);
    }
    on_message_ = std::move(on_message);
    do_receive(++receive_generation_);
}

void MulticastEndpoint::stop_receive() {
    ++receive_generation_;
    on_message_ = nullptr;
    if (!closed_) {
        boost::system::error_code ec;
        socket_.cancel(ec);
    }
}

void MulticastEndpoint::do_receive(std::uint64_t generation) {
    auto self = shared_from_this();
    socket_.async_receive_from(
        boost::asio::buffer(recv_buf_), sender_,
        [this, self, generation](boost::system::error_code ec, std::size_t bytes) {
            if (generation != receive_generation_ || closed_) {
                return;
            }
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                // ICMP errors from earlier sends surface here; keep listening.
                logger_->debug("{}: receive error: {}", name(), ec.message());
                do_receive(generation);
                return;
            }

            ++stats_.datagrams_received;
            HostAndPort source{sender_.address().to_string(), sender_.port()};
            auto result = protocol::decode(std::string_view(recv_buf_.data(), bytes), source,
                                           Clock::steadyNow(), Clock::wallNow());
            if (!result) {
                ++stats_.decode_failures;
                logger_->debug("{}: dropped {} byte datagram from {}: {}",
                               name(), bytes, source.toString(), result.error);
            } else {
                // The handler may stop or close this endpoint.
                auto handler = on_message_;
                if (handler) {
                    try {
                        handler(*this, *result.message);
                    } catch (const std::exception& ex) {
                        logger_->error("{}: message handler failed: {}", name(), ex.what());
                    }
                }
            }

            if (generation == receive_generation_ && !closed_) {
                do_receive(generation);
            }
        });
}

void MulticastEndpoint::close() {
    if (closed_) return;
    closed_ = true;
    ++receive_generation_;
    on_message_ = nullptr;

    boost::system::error_code ec;
    if (joined_) {
        socket_.set_option(ip::multicast::leave_group(
                               multicast_endpoint_.address().to_v4(), local_ip_), ec);
        if (ec) {
            logger_->debug("{}: leave_group failed: {}", name(), ec.message());
        }
        joined_ = false;
    }
    socket_.close(ec);
    logger_->debug("{}: closed", name());
}

} // namespace c4::sddp::network
