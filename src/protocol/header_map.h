#pragma once

#include "header_value.h"
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace c4::sddp::protocol {

/// ASCII case-insensitive comparison used for header names.
bool iequals(std::string_view a, std::string_view b);

/// One header: the name as last written, the decoded value, and the raw wire
/// text the value was decoded from (or encoded to).
struct Header {
    std::string name;
    HeaderValue value;
    std::string raw;
};

// ---------------------------------------------------------------------------
// Ordered header collection with case-insensitive, case-preserving names.
// Insertion order is kept for encoding; equality ignores order.
// ---------------------------------------------------------------------------
class HeaderMap {
public:
    using const_iterator = std::vector<Header>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<std::pair<std::string, HeaderValue>> init);

    /// Set a decoded value; the raw text becomes its JSON literal. Replaces any
    /// header with the same name (case-insensitively), keeping its position.
    void set(std::string name, HeaderValue value);

    /// Set a raw wire value; the decoded value follows JSON literal rules.
    void setRaw(std::string name, std::string raw);

    /// Remove a header. Returns false if it was absent.
    bool erase(std::string_view name);

    const Header* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Decoded value, or nullptr if the header is absent.
    const HeaderValue* get(std::string_view name) const;

    /// String value of a header; std::nullopt if absent or not a string.
    std::optional<std::string> getString(std::string_view name) const;

    /// Integer value of a header (see headerValueAsInteger).
    std::optional<std::int64_t> getInteger(std::string_view name) const;

    std::size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }
    void clear() { headers_.clear(); }

    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

    bool operator==(const HeaderMap& other) const;
    bool operator!=(const HeaderMap& other) const { return !(*this == other); }

private:
    Header* findMutable(std::string_view name);

    std::vector<Header> headers_;
};

} // namespace c4::sddp::protocol
