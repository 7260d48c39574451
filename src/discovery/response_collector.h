#pragma once

#include "../protocol/header_map.h"
#include "../protocol/sddp_message.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <utility>

namespace c4::sddp::discovery {

/// Caller-supplied predicate over a candidate response.
using ResponseFilter = std::function<bool(const protocol::SddpMessage&)>;

/// Filter that accepts a response only if every expected header is present
/// with an equal value. Names compare case-insensitively, values by their
/// text form, so Max-Age 1800 matches "1800".
ResponseFilter matchHeaders(protocol::HeaderMap expected);

// ---------------------------------------------------------------------------
// Acceptance rules for one search: response kind, status, caller filter and
// de-duplication on (source address, Host header), in that order.
// ---------------------------------------------------------------------------
class ResponseCollector {
public:
    struct Options {
        ResponseFilter filter;
        bool include_error_responses = false;
        std::size_t max_responses = 0;  // 0 = unlimited
    };

    enum class Verdict : std::uint8_t {
        Accepted,
        NotResponse,
        ErrorStatus,
        Filtered,
        Duplicate,
        LimitReached
    };

    explicit ResponseCollector(Options options);

    Verdict offer(const protocol::SddpMessage& message);

    std::size_t acceptedCount() const { return accepted_; }
    bool limitReached() const {
        return options_.max_responses != 0 && accepted_ >= options_.max_responses;
    }

private:
    Options options_;
    std::set<std::pair<std::string, std::string>> seen_;
    std::size_t accepted_ = 0;
};

const char* toString(ResponseCollector::Verdict verdict);

} // namespace c4::sddp::discovery
