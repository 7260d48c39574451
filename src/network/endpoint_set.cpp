#include "network/endpoint_set.h"

#include "common/errors.h"
#include "network/local_interfaces.h"

namespace c4::sddp::network {

EndpointSet::EndpointSet(boost::asio::io_context& io_ctx,
                         std::vector<std::string> addresses,
                         EndpointRole role,
                         const EndpointOptions& options,
                         bool include_loopback)
    : role_(role) {
    auto logger = getLogger(LogCategory::ENDPOINT);

    if (addresses.empty()) {
        addresses = localUnicastAddresses(include_loopback);
        logger->debug("Using {} local address(es) for {} endpoints",
                      addresses.size(), toString(role));
    }

    for (const auto& address : addresses) {
        try {
            endpoints_.push_back(MulticastEndpoint::create(io_ctx, address, role, options));
        } catch (const EndpointSetupError& ex) {
            logger->warn("Skipping {}: {}", address, ex.what());
            failed_.push_back(address);
        }
    }

    if (endpoints_.empty()) {
        throw NoEndpointsError("No usable " + std::string(toString(role)) +
                               " endpoint (" + std::to_string(addresses.size()) +
                               " address(es) tried)");
    }
}

EndpointSet::~EndpointSet() {
    close();
}

std::size_t EndpointSet::sendMulticast(const MessageBuilder& build) {
    std::size_t sent = 0;
    for (auto& ep : endpoints_) {
        if (!ep->is_open()) continue;
        if (ep->send_multicast(build(*ep))) {
            ++sent;
        }
    }
    return sent;
}

void EndpointSet::startReceive(const MulticastEndpoint::MessageHandler& on_message) {
    for (auto& ep : endpoints_) {
        ep->start_receive(on_message);
    }
}

void EndpointSet::stopReceive() {
    for (auto& ep : endpoints_) {
        ep->stop_receive();
    }
}

void EndpointSet::close() {
    for (auto& ep : endpoints_) {
        ep->close();
    }
}

} // namespace c4::sddp::network
