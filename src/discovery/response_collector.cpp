#include "discovery/response_collector.h"

namespace c4::sddp::discovery {

ResponseFilter matchHeaders(protocol::HeaderMap expected) {
    return [expected = std::move(expected)](const protocol::SddpMessage& message) {
        for (const auto& header : expected) {
            const auto* actual = message.headers().get(header.name);
            if (!actual) return false;
            if (protocol::headerValueToString(*actual) !=
                protocol::headerValueToString(header.value)) {
                return false;
            }
        }
        return true;
    };
}

ResponseCollector::ResponseCollector(Options options)
    : options_(std::move(options)) {}

ResponseCollector::Verdict ResponseCollector::offer(const protocol::SddpMessage& message) {
    if (limitReached()) {
        return Verdict::LimitReached;
    }
    if (message.kind() != protocol::MessageKind::Response) {
        return Verdict::NotResponse;
    }
    if (message.statusCode() != 200 && !options_.include_error_responses) {
        return Verdict::ErrorStatus;
    }
    if (options_.filter && !options_.filter(message)) {
        return Verdict::Filtered;
    }

    std::string source = message.sourceAddress() ? message.sourceAddress()->toString() : "";
    std::string host;
    if (const auto* value = message.headers().get("Host")) {
        host = protocol::headerValueToString(*value);
    }
    if (!seen_.emplace(std::move(source), std::move(host)).second) {
        return Verdict::Duplicate;
    }

    ++accepted_;
    return Verdict::Accepted;
}

const char* toString(ResponseCollector::Verdict verdict) {
    switch (verdict) {
        case ResponseCollector::Verdict::Accepted:     return "accepted";
        case ResponseCollector::Verdict::NotResponse:  return "not a response";
        case ResponseCollector::Verdict::ErrorStatus:  return "error status";
        case ResponseCollector::Verdict::Filtered:     return "filtered";
        case ResponseCollector::Verdict::Duplicate:    return "duplicate";
        case ResponseCollector::Verdict::LimitReached: return "limit reached";
    }
    return "unknown";
}

} // namespace c4::sddp::discovery
