#pragma once

#include "header_map.h"
#include "../common/clock.h"
#include "../common/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace c4::sddp::protocol {

enum class MessageKind : std::uint8_t {
    Notify,
    Search,
    Response
};

const char* toString(MessageKind kind);

// ---------------------------------------------------------------------------
// Parsed form of the first line of a datagram:
//   NOTIFY ALIVE SDDP/1.0
//   SEARCH * SDDP/1.0          (HTTP/x.y is tolerated)
//   SDDP/1.0 200 OK
// ---------------------------------------------------------------------------
struct StatementLine {
    MessageKind kind = MessageKind::Notify;
    std::string protocol;      // "SDDP" (or "HTTP" on a SEARCH)
    int version_major = 0;
    int version_minor = 0;
    std::string search_target; // SEARCH only
    int status_code = 0;       // Response only
    std::string status_text;   // Response only

    std::string version() const {
        return std::to_string(version_major) + "." + std::to_string(version_minor);
    }
};

/// Parse a statement line. Returns std::nullopt for anything that is not one
/// of the three SDDP statement forms with a major version >= 1.
std::optional<StatementLine> parseStatementLine(std::string_view line);

// ---------------------------------------------------------------------------
// Immutable SDDP message: statement line, ordered headers, optional body, and
// receive metadata (source address, timestamps) when it came off a socket.
// ---------------------------------------------------------------------------
class SddpMessage {
public:
    /// Throws std::invalid_argument if statement is not a valid SDDP statement.
    explicit SddpMessage(std::string statement,
                         HeaderMap headers = {},
                         std::string body = {});

    static SddpMessage makeNotify(HeaderMap headers);
    static SddpMessage makeSearch(std::string_view search_target, const HostAndPort& host);
    static SddpMessage makeResponse(HeaderMap headers,
                                    int status_code = 200,
                                    std::string_view status_text = "OK",
                                    std::string_view protocol_version = "SDDP/1.0");

    MessageKind kind() const { return statement_info_.kind; }
    const std::string& statement() const { return statement_; }
    const StatementLine& statementInfo() const { return statement_info_; }
    std::string version() const { return statement_info_.version(); }
    int statusCode() const { return statement_info_.status_code; }
    const std::string& statusText() const { return statement_info_.status_text; }
    const std::string& searchTarget() const { return statement_info_.search_target; }
    bool isSuccessResponse() const {
        return kind() == MessageKind::Response && statusCode() == 200;
    }

    const HeaderMap& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    // Receive metadata; empty for locally built messages.
    const std::optional<HostAndPort>& sourceAddress() const { return source_address_; }
    const std::optional<Clock::SteadyTime>& receivedMonotonicTime() const { return received_steady_; }
    const std::optional<Clock::WallTime>& receivedWallTime() const { return received_wall_; }

    // Well-known headers
    std::optional<std::string> host() const { return headers_.getString("Host"); }
    std::optional<HostAndPort> from() const;
    std::optional<std::int64_t> maxAge() const { return headers_.getInteger("Max-Age"); }
    std::optional<std::string> type() const { return headers_.getString("Type"); }
    std::optional<std::string> primaryProxy() const { return headers_.getString("Primary-Proxy"); }
    std::optional<std::vector<std::string>> proxies() const;
    std::optional<std::string> manufacturer() const { return headers_.getString("Manufacturer"); }
    std::optional<std::string> model() const { return headers_.getString("Model"); }
    std::optional<std::string> driver() const { return headers_.getString("Driver"); }

    // Copies with one aspect changed
    SddpMessage withHeader(std::string name, HeaderValue value) const;
    SddpMessage withoutHeader(std::string_view name) const;
    SddpMessage withStatement(std::string statement) const;
    SddpMessage withReceiveInfo(HostAndPort source,
                                Clock::SteadyTime steady_time,
                                Clock::WallTime wall_time) const;

    /// Semantic equality: statement, headers (order-insensitive) and body.
    /// Receive metadata is not compared.
    bool operator==(const SddpMessage& other) const;
    bool operator!=(const SddpMessage& other) const { return !(*this == other); }

private:
    std::string statement_;
    StatementLine statement_info_;
    HeaderMap headers_;
    std::string body_;

    std::optional<HostAndPort> source_address_;
    std::optional<Clock::SteadyTime> received_steady_;
    std::optional<Clock::WallTime> received_wall_;
};

} // namespace c4::sddp::protocol
