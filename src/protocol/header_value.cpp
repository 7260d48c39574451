#include "protocol/header_value.h"

#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

namespace c4::sddp::protocol {

namespace {

std::string_view trimWhitespace(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

const char* toString(HeaderValueKind kind) {
    switch (kind) {
        case HeaderValueKind::Null:    return "null";
        case HeaderValueKind::Bool:    return "bool";
        case HeaderValueKind::Integer: return "integer";
        case HeaderValueKind::Real:    return "real";
        case HeaderValueKind::String:  return "string";
    }
    return "unknown";
}

HeaderValue parseHeaderValue(std::string_view raw) {
    std::string_view text = trimWhitespace(raw);

    auto j = nlohmann::json::parse(text.begin(), text.end(),
                                   /*cb=*/nullptr,
                                   /*allow_exceptions=*/false);
    if (!j.is_discarded()) {
        switch (j.type()) {
            case nlohmann::json::value_t::null:
                return nullptr;
            case nlohmann::json::value_t::boolean:
                return j.get<bool>();
            case nlohmann::json::value_t::number_integer:
                return j.get<std::int64_t>();
            case nlohmann::json::value_t::number_unsigned: {
                auto u = j.get<std::uint64_t>();
                if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return static_cast<std::int64_t>(u);
                }
                return static_cast<double>(u);
            }
            case nlohmann::json::value_t::number_float:
                return j.get<double>();
            case nlohmann::json::value_t::string:
                return j.get<std::string>();
            default:
                // Objects and arrays are not header values; keep the text.
                return std::string(text);
        }
    }

    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        text = text.substr(1, text.size() - 2);
    }
    return std::string(text);
}

std::string encodeHeaderValue(const HeaderValue& value) {
    nlohmann::json j;
    switch (kindOf(value)) {
        case HeaderValueKind::Null:    j = nullptr; break;
        case HeaderValueKind::Bool:    j = std::get<bool>(value); break;
        case HeaderValueKind::Integer: j = std::get<std::int64_t>(value); break;
        case HeaderValueKind::Real:    j = std::get<double>(value); break;
        case HeaderValueKind::String:  j = std::get<std::string>(value); break;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string headerValueToString(const HeaderValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return encodeHeaderValue(value);
}

std::optional<std::int64_t> headerValueAsInteger(const HeaderValue& value) {
    switch (kindOf(value)) {
        case HeaderValueKind::Integer:
            return std::get<std::int64_t>(value);
        case HeaderValueKind::Real: {
            double d = std::get<double>(value);
            if (std::isfinite(d) && std::floor(d) == d &&
                std::fabs(d) < 9.0e18) {
                return static_cast<std::int64_t>(d);
            }
            return std::nullopt;
        }
        case HeaderValueKind::String: {
            const auto& s = std::get<std::string>(value);
            std::string_view t = trimWhitespace(s);
            if (t.empty() || t.size() > 18) return std::nullopt;
            bool negative = false;
            if (t.front() == '-') {
                negative = true;
                t.remove_prefix(1);
                if (t.empty()) return std::nullopt;
            }
            std::int64_t result = 0;
            for (char c : t) {
                if (c < '0' || c > '9') return std::nullopt;
                result = result * 10 + (c - '0');
            }
            return negative ? -result : result;
        }
        default:
            return std::nullopt;
    }
}

} // namespace c4::sddp::protocol
