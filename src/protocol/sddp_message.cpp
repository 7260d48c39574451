#include "protocol/sddp_message.h"

#include <stdexcept>

namespace c4::sddp::protocol {

namespace {

// Split on runs of spaces.
std::vector<std::string_view> splitWords(std::string_view line) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && line[i] == ' ') ++i;
        if (i >= line.size()) break;
        std::size_t start = i;
        while (i < line.size() && line[i] != ' ') ++i;
        words.push_back(line.substr(start, i - start));
    }
    return words;
}

bool parseDecimal(std::string_view s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

// "SDDP/1.0" -> protocol "SDDP", 1, 0
bool parseProtocolVersion(std::string_view word, StatementLine& st) {
    auto slash = word.find('/');
    if (slash == std::string_view::npos) return false;
    auto proto = word.substr(0, slash);
    auto ver = word.substr(slash + 1);
    auto dot = ver.find('.');
    if (dot == std::string_view::npos) return false;
    // An empty major ("SDDP/.1") is not a usable version.
    if (!parseDecimal(ver.substr(0, dot), st.version_major)) return false;
    if (!parseDecimal(ver.substr(dot + 1), st.version_minor)) return false;
    if (st.version_major < 1) return false;
    st.protocol = std::string(proto);
    return true;
}

} // anonymous namespace

const char* toString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Notify:   return "NOTIFY";
        case MessageKind::Search:   return "SEARCH";
        case MessageKind::Response: return "RESPONSE";
    }
    return "UNKNOWN";
}

std::optional<StatementLine> parseStatementLine(std::string_view line) {
    auto words = splitWords(line);
    if (words.empty()) return std::nullopt;

    StatementLine st;
    if (words[0] == "NOTIFY") {
        if (words.size() != 3 || words[1] != "ALIVE") return std::nullopt;
        if (!parseProtocolVersion(words[2], st) || st.protocol != "SDDP") return std::nullopt;
        st.kind = MessageKind::Notify;
        return st;
    }

    if (words[0] == "SEARCH") {
        if (words.size() != 3) return std::nullopt;
        if (!parseProtocolVersion(words[2], st)) return std::nullopt;
        if (st.protocol != "SDDP" && st.protocol != "HTTP") return std::nullopt;
        st.kind = MessageKind::Search;
        st.search_target = std::string(words[1]);
        return st;
    }

    // Responses echo the protocol of the SEARCH they answer.
    if (words[0].substr(0, 5) == "SDDP/" || words[0].substr(0, 5) == "HTTP/") {
        if (words.size() < 3) return std::nullopt;
        if (!parseProtocolVersion(words[0], st)) return std::nullopt;
        if (!parseDecimal(words[1], st.status_code)) return std::nullopt;
        // Reason phrase is the remainder of the line, internal spacing preserved.
        std::size_t offset = static_cast<std::size_t>(words[2].data() - line.data());
        std::string_view reason = line.substr(offset);
        while (!reason.empty() && reason.back() == ' ') reason.remove_suffix(1);
        st.status_text = std::string(reason);
        st.kind = MessageKind::Response;
        return st;
    }

    return std::nullopt;
}

SddpMessage::SddpMessage(std::string statement, HeaderMap headers, std::string body)
    : statement_(std::move(statement))
    , headers_(std::move(headers))
    , body_(std::move(body)) {
    auto info = parseStatementLine(statement_);
    if (!info) {
        throw std::invalid_argument("Not an SDDP statement line: '" + statement_ + "'");
    }
    statement_info_ = std::move(*info);
}

SddpMessage SddpMessage::makeNotify(HeaderMap headers) {
    return SddpMessage("NOTIFY ALIVE SDDP/1.0", std::move(headers));
}

SddpMessage SddpMessage::makeSearch(std::string_view search_target, const HostAndPort& host) {
    HeaderMap headers;
    headers.set("Host", host.toString());
    return SddpMessage("SEARCH " + std::string(search_target) + " SDDP/1.0", std::move(headers));
}

SddpMessage SddpMessage::makeResponse(HeaderMap headers,
                                      int status_code,
                                      std::string_view status_text,
                                      std::string_view protocol_version) {
    std::string statement = std::string(protocol_version) + " " +
                            std::to_string(status_code) + " " +
                            std::string(status_text);
    return SddpMessage(std::move(statement), std::move(headers));
}

std::optional<HostAndPort> SddpMessage::from() const {
    auto value = headers_.getString("From");
    if (!value) return std::nullopt;
    return HostAndPort::parse(*value, kSddpPort);
}

std::optional<std::vector<std::string>> SddpMessage::proxies() const {
    auto value = headers_.getString("Proxies");
    if (!value) return std::nullopt;
    std::vector<std::string> result;
    if (value->empty()) return result;
    std::size_t start = 0;
    while (true) {
        auto comma = value->find(',', start);
        result.push_back(value->substr(start, comma - start));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return result;
}

SddpMessage SddpMessage::withHeader(std::string name, HeaderValue value) const {
    SddpMessage copy(*this);
    copy.headers_.set(std::move(name), std::move(value));
    return copy;
}

SddpMessage SddpMessage::withoutHeader(std::string_view name) const {
    SddpMessage copy(*this);
    copy.headers_.erase(name);
    return copy;
}

SddpMessage SddpMessage::withStatement(std::string statement) const {
    SddpMessage copy(std::move(statement), headers_, body_);
    copy.source_address_ = source_address_;
    copy.received_steady_ = received_steady_;
    copy.received_wall_ = received_wall_;
    return copy;
}

SddpMessage SddpMessage::withReceiveInfo(HostAndPort source,
                                         Clock::SteadyTime steady_time,
                                         Clock::WallTime wall_time) const {
    SddpMessage copy(*this);
    copy.source_address_ = std::move(source);
    copy.received_steady_ = steady_time;
    copy.received_wall_ = wall_time;
    return copy;
}

bool SddpMessage::operator==(const SddpMessage& other) const {
    return statement_ == other.statement_ &&
           headers_ == other.headers_ &&
           body_ == other.body_;
}

} // namespace c4::sddp::protocol
