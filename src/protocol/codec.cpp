#include "protocol/codec.h"

#include <stdexcept>

namespace c4::sddp::protocol {

namespace {

// Next line of data starting at pos. Returns false if no '\n' remains.
// The returned line excludes the terminator and a preceding '\r'.
bool nextLine(std::string_view data, std::size_t& pos, std::string_view& line) {
    auto nl = data.find('\n', pos);
    if (nl == std::string_view::npos) return false;
    line = data.substr(pos, nl - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    pos = nl + 1;
    return true;
}

bool isTokenChar(char c) {
    // RFC 7230 tchar, which is what every SDDP firmware uses in practice
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

std::string_view trimSpaces(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

DecodeResult failure(std::string reason) {
    DecodeResult r;
    r.error = std::move(reason);
    return r;
}

} // anonymous namespace

std::string encode(const SddpMessage& message) {
    std::string out;
    out.reserve(64 + message.headers().size() * 48 + message.body().size());
    out += message.statement();
    out += "\r\n";
    for (const auto& h : message.headers()) {
        out += h.name;
        out += ": ";
        out += h.raw;
        out += "\r\n";
    }
    out += "\r\n";
    out += message.body();
    return out;
}

DecodeResult decode(std::string_view datagram) {
    if (datagram.empty()) {
        return failure("empty datagram");
    }

    std::size_t pos = 0;
    std::string_view statement;
    if (!nextLine(datagram, pos, statement)) {
        return failure("statement line has no line terminator");
    }
    if (!parseStatementLine(statement)) {
        return failure("malformed statement line '" + std::string(statement) + "'");
    }

    HeaderMap headers;
    std::string pending_name;
    std::string pending_raw;
    bool have_pending = false;
    bool terminated = false;

    std::string_view line;
    while (nextLine(datagram, pos, line)) {
        if (line.empty()) {
            terminated = true;
            break;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            // Folded continuation of the previous header value
            if (!have_pending) {
                return failure("continuation line before any header");
            }
            pending_raw += ' ';
            pending_raw += std::string(trimSpaces(line));
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return failure("header line without ':' ('" + std::string(line) + "')");
        }
        std::string_view name = line.substr(0, colon);
        if (name.empty()) {
            return failure("header line with empty name");
        }
        for (char c : name) {
            if (!isTokenChar(c)) {
                return failure("invalid header name '" + std::string(name) + "'");
            }
        }

        if (have_pending) {
            headers.setRaw(std::move(pending_name), std::move(pending_raw));
        }
        pending_name = std::string(name);
        pending_raw = std::string(trimSpaces(line.substr(colon + 1)));
        have_pending = true;
    }

    if (!terminated) {
        return failure("missing terminating blank line");
    }
    if (have_pending) {
        headers.setRaw(std::move(pending_name), std::move(pending_raw));
    }

    std::string body(datagram.substr(pos));

    DecodeResult result;
    try {
        result.message.emplace(std::string(statement), std::move(headers), std::move(body));
    } catch (const std::invalid_argument& ex) {
        return failure(ex.what());
    }
    return result;
}

DecodeResult decode(std::string_view datagram,
                    const HostAndPort& source,
                    Clock::SteadyTime steady_time,
                    Clock::WallTime wall_time) {
    DecodeResult result = decode(datagram);
    if (result.message) {
        result.message = result.message->withReceiveInfo(source, steady_time, wall_time);
    }
    return result;
}

} // namespace c4::sddp::protocol
