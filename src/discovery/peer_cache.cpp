#include "discovery/peer_cache.h"

#include <chrono>

namespace c4::sddp::discovery {

namespace {

// received_at + max_age, saturating at the end of the clock's range.
Clock::WallTime expiryFor(Clock::WallTime received_at, std::int64_t max_age) {
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        Clock::WallTime::max() - received_at).count();
    if (max_age >= remaining) {
        return Clock::WallTime::max();
    }
    return received_at + std::chrono::seconds(max_age);
}

} // anonymous namespace

PeerCache::PeerCache(std::int64_t default_max_age)
    : default_max_age_(default_max_age) {}

std::string PeerCache::keyFor(const protocol::SddpMessage& message) {
    if (const auto* host = message.headers().get("Host")) {
        auto text = protocol::headerValueToString(*host);
        if (!text.empty()) return text;
    }
    if (message.sourceAddress()) {
        return message.sourceAddress()->toString();
    }
    return {};
}

const PeerRecord& PeerCache::upsert(const protocol::SddpMessage& message,
                                    Clock::WallTime received_at) {
    std::int64_t max_age = message.maxAge().value_or(default_max_age_);
    if (max_age < 0) max_age = default_max_age_;

    auto key = keyFor(message);
    PeerRecord record{key, message, received_at, expiryFor(received_at, max_age)};

    auto it = records_.find(key);
    if (it != records_.end()) {
        it->second = std::move(record);
        return it->second;
    }
    return records_.emplace(std::move(key), std::move(record)).first->second;
}

std::optional<PeerRecord> PeerCache::find(const std::string& key, Clock::WallTime now) {
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    if (it->second.expires_at <= now) {
        records_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerRecord> PeerCache::snapshot(Clock::WallTime now) {
    evictExpired(now);
    std::vector<PeerRecord> result;
    result.reserve(records_.size());
    for (const auto& entry : records_) {
        result.push_back(entry.second);
    }
    return result;
}

std::size_t PeerCache::evictExpired(Clock::WallTime now) {
    std::size_t dropped = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.expires_at <= now) {
            it = records_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

} // namespace c4::sddp::discovery
