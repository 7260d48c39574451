#pragma once

#include "multicast_endpoint.h"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace c4::sddp::network {

/// One MulticastEndpoint per local address. Addresses that fail to set up are
/// skipped; the set is usable as long as at least one endpoint came up.
class EndpointSet {
public:
    using MessageBuilder = std::function<protocol::SddpMessage(const MulticastEndpoint&)>;

    /// @param io_ctx     reactor shared by every endpoint
    /// @param addresses  local IPv4 addresses; empty means every non-loopback
    ///                   local address (or every address incl. loopback when
    ///                   include_loopback is set)
    /// @param role       client (ephemeral port) or server (SDDP port + join)
    /// @param options    group, port, TTL and loopback settings
    /// Throws NoEndpointsError when no endpoint could be created.
    EndpointSet(boost::asio::io_context& io_ctx,
                std::vector<std::string> addresses,
                EndpointRole role,
                const EndpointOptions& options = {},
                bool include_loopback = false);

    ~EndpointSet();

    EndpointSet(const EndpointSet&) = delete;
    EndpointSet& operator=(const EndpointSet&) = delete;

    const std::vector<MulticastEndpoint::Ptr>& endpoints() const { return endpoints_; }
    const std::vector<std::string>& failedAddresses() const { return failed_; }
    std::size_t size() const { return endpoints_.size(); }
    EndpointRole role() const { return role_; }

    /// Build one message per endpoint and multicast it from that endpoint.
    /// Returns the number of successful sends.
    std::size_t sendMulticast(const MessageBuilder& build);

    /// Route every endpoint's inbound messages to on_message.
    void startReceive(const MulticastEndpoint::MessageHandler& on_message);
    void stopReceive();

    /// Close every endpoint. Idempotent.
    void close();

private:
    EndpointRole role_;
    std::vector<MulticastEndpoint::Ptr> endpoints_;
    std::vector<std::string> failed_;
};

} // namespace c4::sddp::network
