#pragma once

#include "sddp_message.h"
#include "../common/clock.h"
#include "../common/types.h"
#include <optional>
#include <string>
#include <string_view>

namespace c4::sddp::protocol {

// ---------------------------------------------------------------------------
// SDDP datagram layout (HTTP-header style, text):
//
//   <statement line>\r\n
//   <Name>: <JSON literal>\r\n      (zero or more)
//   \r\n
//   [body]
//
// Decoding also accepts bare "\n" line endings and folded continuation lines.
// ---------------------------------------------------------------------------

struct DecodeResult {
    std::optional<SddpMessage> message;
    std::string error;

    bool ok() const { return message.has_value(); }
    explicit operator bool() const { return ok(); }
};

/// Serialize a message into datagram bytes. Headers are written in order
/// using their raw text.
std::string encode(const SddpMessage& message);

/// Parse datagram bytes. Never throws on malformed input.
DecodeResult decode(std::string_view datagram);

/// Parse datagram bytes and attach the receive metadata.
DecodeResult decode(std::string_view datagram,
                    const HostAndPort& source,
                    Clock::SteadyTime steady_time,
                    Clock::WallTime wall_time);

} // namespace c4::sddp::protocol
