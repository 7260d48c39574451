#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace c4::sddp::protocol {

// ---------------------------------------------------------------------------
// Decoded SDDP header value.
//
// Header values travel as JSON literals ("Acme:Test", 1800, true, null). The
// variant alternatives are kept in this order so index() maps onto
// HeaderValueKind.
// ---------------------------------------------------------------------------
using HeaderValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

enum class HeaderValueKind : std::uint8_t {
    Null    = 0,
    Bool    = 1,
    Integer = 2,
    Real    = 3,
    String  = 4
};

inline HeaderValueKind kindOf(const HeaderValue& v) {
    return static_cast<HeaderValueKind>(v.index());
}

const char* toString(HeaderValueKind kind);

/// Decode a raw (wire) header value with JSON literal rules. A value that is
/// not a JSON scalar stays text, with one pair of enclosing quotes removed.
HeaderValue parseHeaderValue(std::string_view raw);

/// Render a value as the JSON literal used on the wire.
std::string encodeHeaderValue(const HeaderValue& value);

/// Human-readable form: strings unquoted, everything else as its literal.
std::string headerValueToString(const HeaderValue& value);

/// Integer view of a value. Accepts Integer, integral Real and decimal
/// strings ("1800") since device firmware quotes numbers inconsistently.
std::optional<std::int64_t> headerValueAsInteger(const HeaderValue& value);

} // namespace c4::sddp::protocol
