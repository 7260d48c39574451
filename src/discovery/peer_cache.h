#pragma once

#include "../common/clock.h"
#include "../common/types.h"
#include "../protocol/sddp_message.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace c4::sddp::discovery {

struct PeerRecord {
    std::string key;               // Host header, or source address without one
    protocol::SddpMessage message; // last NOTIFY seen
    Clock::WallTime last_seen;
    Clock::WallTime expires_at;    // last_seen + Max-Age
};

// ---------------------------------------------------------------------------
// Devices announced by NOTIFY, keyed by their Host header. A record is present
// while now < expires_at; expired records are evicted when read.
// ---------------------------------------------------------------------------
class PeerCache {
public:
    explicit PeerCache(std::int64_t default_max_age = kDefaultMaxAge);

    /// Insert or replace the record for message's key.
    const PeerRecord& upsert(const protocol::SddpMessage& message, Clock::WallTime received_at);

    std::optional<PeerRecord> find(const std::string& key, Clock::WallTime now);

    /// Live records ordered by key.
    std::vector<PeerRecord> snapshot(Clock::WallTime now);

    /// Drop records with expires_at <= now. Returns the number dropped.
    std::size_t evictExpired(Clock::WallTime now);

    std::size_t size() const { return records_.size(); }

    static std::string keyFor(const protocol::SddpMessage& message);

private:
    std::int64_t default_max_age_;
    std::map<std::string, PeerRecord> records_;
};

} // namespace c4::sddp::discovery
