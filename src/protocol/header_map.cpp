#include "protocol/header_map.h"

#include <algorithm>

namespace c4::sddp::protocol {

namespace {

char asciiLower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (asciiLower(a[i]) != asciiLower(b[i])) return false;
    }
    return true;
}

HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string, HeaderValue>> init) {
    for (const auto& [name, value] : init) {
        set(name, value);
    }
}

void HeaderMap::set(std::string name, HeaderValue value) {
    std::string raw = encodeHeaderValue(value);
    if (Header* h = findMutable(name)) {
        h->name = std::move(name);
        h->value = std::move(value);
        h->raw = std::move(raw);
        return;
    }
    headers_.push_back(Header{std::move(name), std::move(value), std::move(raw)});
}

void HeaderMap::setRaw(std::string name, std::string raw) {
    HeaderValue value = parseHeaderValue(raw);
    if (Header* h = findMutable(name)) {
        h->name = std::move(name);
        h->value = std::move(value);
        h->raw = std::move(raw);
        return;
    }
    headers_.push_back(Header{std::move(name), std::move(value), std::move(raw)});
}

bool HeaderMap::erase(std::string_view name) {
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&](const Header& h) { return iequals(h.name, name); });
    if (it == headers_.end()) return false;
    headers_.erase(it);
    return true;
}

const Header* HeaderMap::find(std::string_view name) const {
    for (const auto& h : headers_) {
        if (iequals(h.name, name)) return &h;
    }
    return nullptr;
}

Header* HeaderMap::findMutable(std::string_view name) {
    for (auto& h : headers_) {
        if (iequals(h.name, name)) return &h;
    }
    return nullptr;
}

const HeaderValue* HeaderMap::get(std::string_view name) const {
    const Header* h = find(name);
    return h ? &h->value : nullptr;
}

std::optional<std::string> HeaderMap::getString(std::string_view name) const {
    const HeaderValue* v = get(name);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    return std::nullopt;
}

std::optional<std::int64_t> HeaderMap::getInteger(std::string_view name) const {
    const HeaderValue* v = get(name);
    if (!v) return std::nullopt;
    return headerValueAsInteger(*v);
}

bool HeaderMap::operator==(const HeaderMap& other) const {
    if (headers_.size() != other.headers_.size()) return false;
    for (const auto& h : headers_) {
        const HeaderValue* v = other.get(h.name);
        if (!v || *v != h.value) return false;
    }
    return true;
}

} // namespace c4::sddp::protocol
