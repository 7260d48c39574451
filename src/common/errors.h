#pragma once

#include <stdexcept>
#include <string>

namespace c4::sddp {

// Base class for all errors raised by the discovery engine.
class SddpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single local address could not be bound or joined to the multicast group.
class EndpointSetupError : public SddpError {
public:
    EndpointSetupError(const std::string& address, const std::string& reason)
        : SddpError("Endpoint setup failed for " + address + ": " + reason)
        , address_(address) {}

    const std::string& address() const { return address_; }

private:
    std::string address_;
};

// None of the requested local addresses produced a usable endpoint.
class NoEndpointsError : public SddpError {
public:
    using SddpError::SddpError;
};

} // namespace c4::sddp
