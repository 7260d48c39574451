#include "discovery/sddp_client.h"

namespace c4::sddp::discovery {

SddpClient::SddpClient(boost::asio::io_context& io_ctx,
                       std::vector<std::string> bind_addresses,
                       network::EndpointOptions options,
                       bool include_loopback)
    : io_ctx_(io_ctx)
    , bind_addresses_(std::move(bind_addresses))
    , options_(std::move(options))
    , include_loopback_(include_loopback) {}

SearchSession::Ptr SddpClient::search(SearchOptions options) {
    auto endpoints = std::make_unique<network::EndpointSet>(
        io_ctx_, bind_addresses_, network::EndpointRole::Client, options_, include_loopback_);
    auto session = SearchSession::create(io_ctx_, std::move(endpoints), std::move(options));
    session->begin();
    return session;
}

std::vector<SearchResponse> SddpClient::searchAll(SearchOptions options) {
    return search(std::move(options))->collect();
}

} // namespace c4::sddp::discovery
