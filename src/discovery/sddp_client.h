#pragma once

#include "search_session.h"
#include "../common/asio_compat.h"
#include "../network/multicast_endpoint.h"
#include <string>
#include <vector>

namespace c4::sddp::discovery {

/// Issues searches. Every search gets its own client endpoints (and so its
/// own ephemeral ports), so concurrent searches never see each other's replies.
class SddpClient {
public:
    /// @param io_ctx            reactor the sessions run on
    /// @param bind_addresses    local addresses to search from; empty = all
    ///                          non-loopback local addresses
    /// @param options           group, port, TTL, loopback
    /// @param include_loopback  include 127.x when bind_addresses is empty
    explicit SddpClient(boost::asio::io_context& io_ctx,
                        std::vector<std::string> bind_addresses = {},
                        network::EndpointOptions options = {},
                        bool include_loopback = false);

    /// Start a search. Throws NoEndpointsError if no endpoint could be bound.
    SearchSession::Ptr search(SearchOptions options = {});

    /// Run a search to completion.
    std::vector<SearchResponse> searchAll(SearchOptions options = {});

    const std::vector<std::string>& bindAddresses() const { return bind_addresses_; }
    const network::EndpointOptions& endpointOptions() const { return options_; }

private:
    boost::asio::io_context& io_ctx_;
    std::vector<std::string> bind_addresses_;
    network::EndpointOptions options_;
    bool include_loopback_;
};

} // namespace c4::sddp::discovery
