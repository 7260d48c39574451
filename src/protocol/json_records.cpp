#include "protocol/json_records.h"

namespace c4::sddp::protocol {

nlohmann::json toJson(const HeaderValue& value) {
    switch (kindOf(value)) {
        case HeaderValueKind::Null:    return nullptr;
        case HeaderValueKind::Bool:    return std::get<bool>(value);
        case HeaderValueKind::Integer: return std::get<std::int64_t>(value);
        case HeaderValueKind::Real:    return std::get<double>(value);
        case HeaderValueKind::String:  return std::get<std::string>(value);
    }
    return nullptr;
}

nlohmann::json toJson(const HeaderMap& headers) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& h : headers) {
        obj[h.name] = toJson(h.value);
    }
    return obj;
}

nlohmann::json toJson(const SddpMessage& message) {
    nlohmann::json j;
    j["kind"] = toString(message.kind());
    j["statement"] = message.statement();
    j["sddp_version"] = message.version();
    if (message.kind() == MessageKind::Response) {
        j["status_code"] = message.statusCode();
        j["status"] = message.statusText();
    }
    if (message.kind() == MessageKind::Search) {
        j["search_target"] = message.searchTarget();
    }
    j["headers"] = toJson(message.headers());
    if (!message.body().empty()) {
        j["body"] = message.body();
    }
    if (message.sourceAddress()) {
        j["src_addr"] = message.sourceAddress()->toString();
    }
    if (message.receivedMonotonicTime()) {
        j["monotonic_time"] = Clock::steadySeconds(*message.receivedMonotonicTime());
    }
    if (message.receivedWallTime()) {
        j["utc_time"] = Clock::toIso8601(*message.receivedWallTime());
    }
    return j;
}

} // namespace c4::sddp::protocol
