#include <gtest/gtest.h>
#include "discovery/peer_cache.h"
#include "protocol/codec.h"
#include "common/clock.h"
#include <chrono>
#include <string>

using namespace c4::sddp;
using namespace c4::sddp::discovery;
using namespace c4::sddp::protocol;
using std::chrono::seconds;

namespace {

SddpMessage notify(const std::string& headers, const std::string& ip = "10.0.0.20") {
    auto result = decode("NOTIFY ALIVE SDDP/1.0\r\n" + headers + "\r\n",
                         HostAndPort{ip, 1902}, Clock::steadyNow(), Clock::wallNow());
    EXPECT_TRUE(result.ok()) << result.error;
    return *result.message;
}

} // namespace

class PeerCacheTest : public ::testing::Test {
protected:
    PeerCache cache_;
    Clock::WallTime t_ = Clock::wallNow();
};

TEST_F(PeerCacheTest, MaxAgeSixtyExpiresBetween59And61) {
    cache_.upsert(notify("Host: \"dev-1\"\r\nMax-Age: 60\r\n"), t_);

    EXPECT_TRUE(cache_.find("dev-1", t_ + seconds(59)).has_value());
    EXPECT_FALSE(cache_.find("dev-1", t_ + seconds(61)).has_value());
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(PeerCacheTest, UpsertReplacesAndExtends) {
    cache_.upsert(notify("Host: \"dev-1\"\r\nMax-Age: 60\r\nModel: \"A\"\r\n"), t_);
    cache_.upsert(notify("Host: \"dev-1\"\r\nMax-Age: 60\r\nModel: \"B\"\r\n"), t_ + seconds(50));

    auto record = cache_.find("dev-1", t_ + seconds(100));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->message.model(), "B");
    EXPECT_EQ(record->last_seen, t_ + seconds(50));
    EXPECT_EQ(record->expires_at, t_ + seconds(110));
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(PeerCacheTest, MissingMaxAgeUsesDefault) {
    cache_.upsert(notify("Host: \"dev-1\"\r\n"), t_);
    EXPECT_TRUE(cache_.find("dev-1", t_ + seconds(kDefaultMaxAge - 1)).has_value());
    EXPECT_FALSE(cache_.find("dev-1", t_ + seconds(kDefaultMaxAge)).has_value());
}

TEST_F(PeerCacheTest, InvalidMaxAgeUsesDefault) {
    cache_.upsert(notify("Host: \"dev-1\"\r\nMax-Age: \"soon\"\r\n"), t_);
    cache_.upsert(notify("Host: \"dev-2\"\r\nMax-Age: -5\r\n"), t_);
    EXPECT_TRUE(cache_.find("dev-1", t_ + seconds(1000)).has_value());
    EXPECT_TRUE(cache_.find("dev-2", t_ + seconds(1000)).has_value());
}

TEST_F(PeerCacheTest, KeyFallsBackToSourceAddress) {
    auto msg = notify("Max-Age: 60\r\n", "10.0.0.33");
    EXPECT_EQ(PeerCache::keyFor(msg), "10.0.0.33:1902");
    cache_.upsert(msg, t_);
    EXPECT_TRUE(cache_.find("10.0.0.33:1902", t_).has_value());
}

TEST_F(PeerCacheTest, SnapshotEvictsExpiredAndOrdersByKey) {
    cache_.upsert(notify("Host: \"b\"\r\nMax-Age: 10\r\n"), t_);
    cache_.upsert(notify("Host: \"a\"\r\nMax-Age: 100\r\n"), t_);
    cache_.upsert(notify("Host: \"c\"\r\nMax-Age: 100\r\n"), t_);

    auto live = cache_.snapshot(t_ + seconds(20));
    ASSERT_EQ(live.size(), 2u);
    EXPECT_EQ(live[0].key, "a");
    EXPECT_EQ(live[1].key, "c");
    EXPECT_EQ(cache_.size(), 2u);
}

TEST_F(PeerCacheTest, EvictExpiredReportsCount) {
    cache_.upsert(notify("Host: \"a\"\r\nMax-Age: 1\r\n"), t_);
    cache_.upsert(notify("Host: \"b\"\r\nMax-Age: 1\r\n"), t_);
    cache_.upsert(notify("Host: \"c\"\r\nMax-Age: 100\r\n"), t_);
    EXPECT_EQ(cache_.evictExpired(t_ + seconds(5)), 2u);
    EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(PeerCacheTest, HugeMaxAgeSaturatesExpiry) {
    const auto& record = cache_.upsert(
        notify("Host: \"long-lived\"\r\nMax-Age: 100000000000\r\n"), t_);
    EXPECT_EQ(record.expires_at, Clock::WallTime::max());

    EXPECT_TRUE(cache_.find("long-lived", t_ + seconds(1)).has_value());
    EXPECT_EQ(cache_.snapshot(t_ + seconds(86400)).size(), 1u);
}
