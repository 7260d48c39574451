#pragma once

#include "peer_cache.h"
#include "../common/asio_compat.h"
#include "../common/clock.h"
#include "../common/logger.h"
#include "../network/endpoint_set.h"
#include "../protocol/header_map.h"
#include "../protocol/sddp_message.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace c4::sddp::discovery {

// Longest NOTIFY period; longer intervals (explicit or derived from Max-Age)
// are clamped so timer arithmetic stays in range.
inline constexpr std::chrono::milliseconds kMaxAdvertiseInterval = std::chrono::hours(24 * 365);

struct ServerOptions {
    /// Device headers advertised in every NOTIFY and RESPONSE (Type, Host,
    /// Manufacturer, ...). Max-Age defaults to 1800 when absent. Any From
    /// header is replaced per endpoint.
    protocol::HeaderMap device_headers;

    /// Time between NOTIFYs; default 2/3 of Max-Age, zero disables advertising.
    std::optional<std::chrono::milliseconds> advertise_interval;

    bool respond_to_queries = true;
    bool track_peers = true;
};

struct ServerStats {
    std::uint64_t notifies_sent = 0;
    std::uint64_t notify_send_errors = 0;
    std::uint64_t searches_received = 0;
    std::uint64_t responses_sent = 0;
    std::uint64_t response_send_errors = 0;
    std::uint64_t peer_notifies_received = 0;
    std::uint64_t own_notifies_ignored = 0;
};

// ---------------------------------------------------------------------------
// SDDP device side. On every endpoint it multicasts NOTIFY on a timer and
// answers SEARCH with a unicast RESPONSE; NOTIFYs from other devices feed the
// peer cache and the registered notify handlers.
// ---------------------------------------------------------------------------
class AdvertisingServer : public std::enable_shared_from_this<AdvertisingServer> {
public:
    using Ptr = std::shared_ptr<AdvertisingServer>;
    /// Called with a NOTIFY from another device and the local endpoint it arrived on.
    using NotifyHandler = std::function<void(const protocol::SddpMessage&, const HostAndPort&)>;

    static Ptr create(boost::asio::io_context& io_ctx,
                      std::unique_ptr<network::EndpointSet> endpoints,
                      ServerOptions options);

    ~AdvertisingServer();

    AdvertisingServer(const AdvertisingServer&) = delete;
    AdvertisingServer& operator=(const AdvertisingServer&) = delete;

    /// Send the first NOTIFYs and start answering. Throws std::logic_error
    /// after stop().
    void start();

    /// Cancel timers, stop receiving and close every endpoint. Idempotent.
    void stop();

    bool running() const { return started_ && !stopped_; }
    bool stopped() const { return stopped_; }

    std::chrono::milliseconds advertiseInterval() const { return advertise_interval_; }

    /// NOTIFY template: device headers plus Max-Age, without From.
    const protocol::SddpMessage& advertisement() const { return advertisement_; }

    /// NOTIFY as sent from a particular endpoint.
    protocol::SddpMessage notifyFor(const network::MulticastEndpoint& endpoint) const;

    /// RESPONSE to a SEARCH received on a particular endpoint.
    protocol::SddpMessage responseFor(const network::MulticastEndpoint& endpoint,
                                      const protocol::SddpMessage& search) const;

    /// Devices seen via NOTIFY that have not expired.
    std::vector<PeerRecord> peers(Clock::WallTime now = Clock::wallNow());

    std::uint64_t addNotifyHandler(NotifyHandler handler);
    bool removeNotifyHandler(std::uint64_t id);

    const ServerStats& stats() const { return stats_; }
    const network::EndpointSet& endpoints() const { return *endpoints_; }

private:
    AdvertisingServer(boost::asio::io_context& io_ctx,
                      std::unique_ptr<network::EndpointSet> endpoints,
                      ServerOptions options);

    void advertise(std::size_t index);
    void scheduleAdvertise(std::size_t index);
    void onMessage(network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message);
    void onSearch(network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message);
    void onNotify(network::MulticastEndpoint& endpoint, const protocol::SddpMessage& message);
    bool isOwnMessage(const protocol::SddpMessage& message) const;
    protocol::HeaderMap headersFor(const network::MulticastEndpoint& endpoint) const;

    std::unique_ptr<network::EndpointSet> endpoints_;
    ServerOptions options_;
    protocol::SddpMessage advertisement_;
    std::chrono::milliseconds advertise_interval_;

    std::vector<std::unique_ptr<boost::asio::steady_timer>> timers_;
    PeerCache peers_;
    std::map<std::uint64_t, NotifyHandler> notify_handlers_;
    std::uint64_t next_handler_id_ = 1;

    bool started_ = false;
    bool stopped_ = false;
    ServerStats stats_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace c4::sddp::discovery
